#include "app/Application.hpp"
#include "cli/CommandLine.hpp"
#include "config/ConfigFile.hpp"
#include "io/LocalFileSystem.hpp"
#include "utils/LogManager.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <filesystem>

#include <plog/Log.h>
#include <unistd.h>

int main(int argc, char* argv[])
{
    using namespace trim;

    const std::string program_name =
        argc > 0 ? std::filesystem::path(argv[0]).filename().string() : std::string("trim");

    // Logging comes up before anything else so usage and config problems are
    // visible; the configured level replaces the default afterwards.
    config::AppSettings defaults;
    if (!utils::LogManager::Initialize(defaults.log))
        return app::kExitFailure;

    auto parsed = cli::ParseCommandLine(argc, argv);
    switch (parsed.status)
    {
    case cli::ParseStatus::ShowHelp:
        cli::PrintUsage(std::cout, program_name);
        return app::kExitSuccess;
    case cli::ParseStatus::ShowVersion:
        cli::PrintVersion(std::cout);
        return app::kExitSuccess;
    case cli::ParseStatus::Error:
        cli::ReportUsageError(std::cerr, program_name, parsed.error);
        return app::kExitUsage;
    case cli::ParseStatus::Run:
        break;
    }

    auto settings = config::ConfigFile::LoadDefault();
    if (!utils::LogManager::Reconfigure(settings.log))
    {
        PLOG_WARNING << "Logging to stderr only";
    }

    io::LocalFileSystem fs;
    app::Application application(std::move(parsed.options), std::move(settings));
    return application.run(fs, std::cout, std::cerr, ::isatty(STDERR_FILENO) != 0);
}
