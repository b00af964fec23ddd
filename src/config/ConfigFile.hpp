#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <plog/Severity.h>

namespace trim::config
{

enum class ColorMode
{
    Auto,
    Always,
    Never
};

struct LogSettings
{
    plog::Severity level = plog::warning;
    std::string file; // Empty disables the file appender
    std::size_t max_file_size = 1024 * 1024;
    std::size_t backup_count = 3;
};

struct AppSettings
{
    LogSettings log;
    ColorMode color = ColorMode::Auto;
};

/**
 * @brief Optional TOML settings for logging and output colors
 *
 * Lookup order: $TRIM_CONFIG, $XDG_CONFIG_HOME/trim/config.toml,
 * $HOME/.config/trim/config.toml. The trimming itself is not configurable here.
 */
class ConfigFile
{
public:
    // First existing candidate, if any
    static std::optional<std::filesystem::path> Locate();

    static bool Load(const std::filesystem::path& path, AppSettings& settings, std::string& outError);
    static bool Parse(std::string_view text, AppSettings& settings, std::string& outError);

    // Locate + Load; a missing file is fine, a broken one is reported as a warning
    static AppSettings LoadDefault();

    static std::optional<plog::Severity> ParseLevel(std::string_view name);
    static std::optional<ColorMode> ParseColorMode(std::string_view name);
};

} // namespace trim::config
