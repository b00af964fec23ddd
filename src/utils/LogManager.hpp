#pragma once

#include <memory>
#include <vector>

#include "../config/ConfigFile.hpp"

namespace plog
{
class IAppender;
}

namespace trim::utils
{

// Owns the plog appenders: stderr always, a rolling file when configured.
class LogManager
{
public:
    // Installs the stderr appender at settings.level, plus the file appender if configured.
    static bool Initialize(const config::LogSettings& settings);

    // Applies settings loaded after Initialize: new level, file appender if not yet open.
    static bool Reconfigure(const config::LogSettings& settings);

    static bool IsInitialized() { return s_initialized; }

private:
    LogManager() = default;

    static bool AddFileAppender(const config::LogSettings& settings);

    static bool s_initialized;
    static bool s_file_attached;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace trim::utils
