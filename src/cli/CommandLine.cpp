#include "CommandLine.hpp"
#include "../utils/ErrorReporter.hpp"

#ifndef TRIM_VERSION
#define TRIM_VERSION "0.1.0"
#endif

namespace trim::cli
{

namespace
{
// Returns false for an unknown flag.
bool applyShortFlag(char flag, ParseResult& result)
{
    switch (flag)
    {
    case 'h':
        result.status = ParseStatus::ShowHelp;
        return true;
    case 'i':
        result.options.in_place = true;
        return true;
    case 'N':
        result.options.suppress_newline = true;
        return true;
    case 'S':
        result.options.suppress_summary = true;
        return true;
    case 'V':
        result.options.suppress_visual = true;
        return true;
    default:
        return false;
    }
}

bool applyLongFlag(std::string_view name, ParseResult& result)
{
    if (name == "help")
        return applyShortFlag('h', result);
    if (name == "in-place")
        return applyShortFlag('i', result);
    // The single-p spellings are the documented ones; accept the correct spelling too.
    if (name == "supress-newline" || name == "suppress-newline")
        return applyShortFlag('N', result);
    if (name == "supress-summary" || name == "suppress-summary")
        return applyShortFlag('S', result);
    if (name == "supress-visual" || name == "suppress-visual")
        return applyShortFlag('V', result);
    if (name == "version")
    {
        result.status = ParseStatus::ShowVersion;
        return true;
    }
    return false;
}
} // namespace

ParseResult ParseCommandLine(const std::vector<std::string>& args)
{
    ParseResult result;
    bool options_done = false;

    for (const auto& arg : args)
    {
        if (options_done || arg == "-" || arg.size() < 2 || arg[0] != '-')
        {
            result.options.paths.push_back(arg);
            continue;
        }

        if (arg == "--")
        {
            options_done = true;
            continue;
        }

        if (arg[1] == '-')
        {
            if (!applyLongFlag(std::string_view(arg).substr(2), result))
            {
                result.status = ParseStatus::Error;
                result.error = "unknown option '" + arg + "'";
                return result;
            }
        }
        else
        {
            for (std::size_t i = 1; i < arg.size(); ++i)
            {
                if (!applyShortFlag(arg[i], result))
                {
                    result.status = ParseStatus::Error;
                    result.error = std::string("unknown option '-") + arg[i] + "'";
                    return result;
                }
            }
        }

        // --help and --version win over everything after them
        if (result.status != ParseStatus::Run)
            return result;
    }

    return result;
}

ParseResult ParseCommandLine(int argc, const char* const argv[])
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);
    return ParseCommandLine(args);
}

void PrintUsage(std::ostream& out, std::string_view program_name)
{
    out << "Usage: " << program_name << " [OPTIONS] [FILE]...\n";
    out << "Strip trailing whitespace from every line and end the text with a single newline.\n\n";
    out << "Options:\n";
    out << "  -h, --help             Show this help message\n";
    out << "  -i, --in-place         Trim FILEs in place, replacing each file atomically\n";
    out << "  -N, --supress-newline  Do not end the output with a newline\n";
    out << "  -S, --supress-summary  Do not print the summary\n";
    out << "  -V, --supress-visual   Do not print the visualization of trimmed whitespace\n";
    out << "      --version          Show version information\n";
    out << "\nWith no FILE, or when FILE is -, read standard input.\n";
    out << "Summary and visualization go to standard error.\n";
}

void PrintVersion(std::ostream& out)
{
    out << "trim " << TRIM_VERSION << "\n";
}

void ReportUsageError(std::ostream& out, std::string_view program_name, const std::string& error)
{
    utils::ErrorReporter::ReportError(utils::ErrorCategory::CommandLine, error);
    out << "Try '" << program_name << " --help' for more information.\n";
}

} // namespace trim::cli
