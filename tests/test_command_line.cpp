#include <catch2/catch_test_macros.hpp>

#include "cli/CommandLine.hpp"
#include "utils/ErrorReporter.hpp"

#include <sstream>
#include <string>
#include <vector>

using trim::cli::ParseCommandLine;
using trim::cli::ParseStatus;

TEST_CASE("ParseCommandLine - no arguments runs on stdin with defaults", "[cli]")
{
    auto result = ParseCommandLine(std::vector<std::string>{});
    REQUIRE(result.status == ParseStatus::Run);
    REQUIRE(result.options.paths.empty());
    REQUIRE_FALSE(result.options.in_place);
    REQUIRE_FALSE(result.options.suppress_newline);
    REQUIRE_FALSE(result.options.suppress_summary);
    REQUIRE_FALSE(result.options.suppress_visual);
}

TEST_CASE("ParseCommandLine - short and long flags", "[cli]")
{
    auto short_flags = ParseCommandLine(std::vector<std::string>{ "-i", "-N", "-S", "-V", "a.txt" });
    REQUIRE(short_flags.status == ParseStatus::Run);
    REQUIRE(short_flags.options.in_place);
    REQUIRE(short_flags.options.suppress_newline);
    REQUIRE(short_flags.options.suppress_summary);
    REQUIRE(short_flags.options.suppress_visual);
    REQUIRE(short_flags.options.paths == std::vector<std::string>{ "a.txt" });

    auto long_flags = ParseCommandLine(
        std::vector<std::string>{ "--in-place", "--supress-newline", "--supress-summary", "--supress-visual" });
    REQUIRE(long_flags.options.in_place);
    REQUIRE(long_flags.options.suppress_newline);
    REQUIRE(long_flags.options.suppress_summary);
    REQUIRE(long_flags.options.suppress_visual);
}

TEST_CASE("ParseCommandLine - correctly spelled aliases", "[cli]")
{
    auto result = ParseCommandLine(
        std::vector<std::string>{ "--suppress-newline", "--suppress-summary", "--suppress-visual" });
    REQUIRE(result.status == ParseStatus::Run);
    REQUIRE(result.options.suppress_newline);
    REQUIRE(result.options.suppress_summary);
    REQUIRE(result.options.suppress_visual);
}

TEST_CASE("ParseCommandLine - bundled short flags", "[cli]")
{
    auto result = ParseCommandLine(std::vector<std::string>{ "-iNS", "x" });
    REQUIRE(result.options.in_place);
    REQUIRE(result.options.suppress_newline);
    REQUIRE(result.options.suppress_summary);
    REQUIRE_FALSE(result.options.suppress_visual);
}

TEST_CASE("ParseCommandLine - dash and double dash", "[cli]")
{
    auto result = ParseCommandLine(std::vector<std::string>{ "a", "-", "--", "-N", "--weird" });
    REQUIRE(result.status == ParseStatus::Run);
    REQUIRE_FALSE(result.options.suppress_newline);
    REQUIRE(result.options.paths == std::vector<std::string>{ "a", "-", "-N", "--weird" });
}

TEST_CASE("ParseCommandLine - help and version", "[cli]")
{
    REQUIRE(ParseCommandLine(std::vector<std::string>{ "-h" }).status == ParseStatus::ShowHelp);
    REQUIRE(ParseCommandLine(std::vector<std::string>{ "a", "--help" }).status == ParseStatus::ShowHelp);
    REQUIRE(ParseCommandLine(std::vector<std::string>{ "--version" }).status == ParseStatus::ShowVersion);
}

TEST_CASE("ParseCommandLine - unknown options are errors", "[cli]")
{
    auto long_opt = ParseCommandLine(std::vector<std::string>{ "--frobnicate" });
    REQUIRE(long_opt.status == ParseStatus::Error);
    REQUIRE(long_opt.error == "unknown option '--frobnicate'");

    auto short_opt = ParseCommandLine(std::vector<std::string>{ "-iq" });
    REQUIRE(short_opt.status == ParseStatus::Error);
    REQUIRE(short_opt.error == "unknown option '-q'");
}

TEST_CASE("ReportUsageError - reports a command line error and prints the help hint", "[cli]")
{
    using trim::utils::ErrorCategory;
    using trim::utils::ErrorReporter;
    using trim::utils::ErrorSeverity;

    ErrorReporter::ClearErrors();
    auto parsed = ParseCommandLine(std::vector<std::string>{ "--frobnicate" });
    REQUIRE(parsed.status == ParseStatus::Error);

    std::ostringstream out;
    trim::cli::ReportUsageError(out, "trim", parsed.error);
    REQUIRE(out.str() == "Try 'trim --help' for more information.\n");

    auto errors = ErrorReporter::GetPendingErrors();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].category == ErrorCategory::CommandLine);
    REQUIRE(errors[0].severity == ErrorSeverity::Error);
    REQUIRE(errors[0].user_message == "unknown option '--frobnicate'");
    REQUIRE_FALSE(errors[0].is_fatal);
}

TEST_CASE("ParseCommandLine - argv overload skips the program name", "[cli]")
{
    const char* argv[] = { "trim", "-V", "file.txt" };
    auto result = ParseCommandLine(3, argv);
    REQUIRE(result.options.suppress_visual);
    REQUIRE(result.options.paths == std::vector<std::string>{ "file.txt" });
}

TEST_CASE("PrintUsage and PrintVersion", "[cli]")
{
    std::ostringstream usage;
    trim::cli::PrintUsage(usage, "trim");
    REQUIRE(usage.str().find("Usage: trim [OPTIONS] [FILE]...") == 0);
    REQUIRE(usage.str().find("--supress-newline") != std::string::npos);

    std::ostringstream version;
    trim::cli::PrintVersion(version);
    REQUIRE(version.str().rfind("trim ", 0) == 0);
}
