#pragma once

#include "../config/RunOptions.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace trim::cli
{

enum class ParseStatus
{
    Run,
    ShowHelp,
    ShowVersion,
    Error
};

struct ParseResult
{
    ParseStatus status = ParseStatus::Run;
    config::RunOptions options;
    std::string error; // Set when status == Error
};

// Accepts -h -i -N -S -V (bundling allowed), their long forms, --version and "--".
ParseResult ParseCommandLine(const std::vector<std::string>& args);
ParseResult ParseCommandLine(int argc, const char* const argv[]);

void PrintUsage(std::ostream& out, std::string_view program_name);
void PrintVersion(std::ostream& out);

// Logs the parse error through ErrorReporter and writes the --help hint to out.
void ReportUsageError(std::ostream& out, std::string_view program_name, const std::string& error);

} // namespace trim::cli
