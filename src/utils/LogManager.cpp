#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../log/CliFormatter.hpp"

#include <filesystem>
#include <system_error>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace trim::utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_file_attached = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const config::LogSettings& settings)
{
    if (s_initialized)
        return Reconfigure(settings);

    auto console_appender = std::make_unique<plog::ConsoleAppender<log::CliFormatter>>(plog::streamStdErr);
    plog::init(settings.level, console_appender.get());
    s_appenders.push_back(std::move(console_appender));
    s_initialized = true;

    if (settings.file.empty())
        return true;
    return AddFileAppender(settings);
}

bool LogManager::Reconfigure(const config::LogSettings& settings)
{
    if (!s_initialized)
        return Initialize(settings);

    if (auto logger = plog::get())
    {
        logger->setMaxSeverity(settings.level);
    }

    if (settings.file.empty() || s_file_attached)
        return true;
    return AddFileAppender(settings);
}

bool LogManager::AddFileAppender(const config::LogSettings& settings)
{
    try
    {
        std::error_code ec;
        auto parent = std::filesystem::path(settings.file).parent_path();
        if (!parent.empty())
            std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unable to prepare log directory",
                                         ec.message());
            return false;
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            settings.file.c_str(), settings.max_file_size, static_cast<int>(settings.backup_count));
        if (auto logger = plog::get())
        {
            logger->addAppender(file_appender.get());
        }
        s_appenders.push_back(std::move(file_appender));
        s_file_attached = true;
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Failed to open log file " + settings.file,
                                     ex.what());
        return false;
    }
}

} // namespace trim::utils
