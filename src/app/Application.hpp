#pragma once

#include "../config/ConfigFile.hpp"
#include "../config/RunOptions.hpp"

#include <ostream>

namespace trim::io
{
class IFileSystem;
}

namespace trim::app
{

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1; // A target failed or stdin was unreadable
constexpr int kExitUsage = 2;

// Wires the options into the driver and turns the run summary into an exit code.
class Application
{
public:
    Application(config::RunOptions options, config::AppSettings settings);

    int run(io::IFileSystem& fs, std::ostream& out, std::ostream& diag, bool diag_is_terminal);

private:
    config::RunOptions options_;
    config::AppSettings settings_;
};

} // namespace trim::app
