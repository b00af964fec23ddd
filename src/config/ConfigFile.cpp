#include "ConfigFile.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstdint>
#include <cstdlib>
#include <system_error>

#include <plog/Log.h>
#include <toml++/toml.h>

namespace fs = std::filesystem;

namespace trim::config
{

namespace
{
std::optional<fs::path> envPath(const char* name)
{
    const char* value = std::getenv(name);
    if (!value || !*value)
        return std::nullopt;
    return fs::path(value);
}

bool applyTable(const toml::table& root, AppSettings& settings, std::string& outError)
{
    if (auto log = root["log"].as_table())
    {
        if (auto level = (*log)["level"].value<std::string>())
        {
            auto parsed = ConfigFile::ParseLevel(*level);
            if (!parsed)
            {
                outError = "unknown log level '" + *level + "'";
                return false;
            }
            settings.log.level = *parsed;
        }
        if (auto file = (*log)["file"].value<std::string>())
        {
            settings.log.file = *file;
        }
        if (auto size = (*log)["max_file_size"].value<int64_t>())
        {
            if (*size <= 0)
            {
                outError = "log.max_file_size must be positive";
                return false;
            }
            settings.log.max_file_size = static_cast<std::size_t>(*size);
        }
        if (auto count = (*log)["backup_count"].value<int64_t>())
        {
            if (*count < 0)
            {
                outError = "log.backup_count must not be negative";
                return false;
            }
            settings.log.backup_count = static_cast<std::size_t>(*count);
        }
    }

    if (auto output = root["output"].as_table())
    {
        if (auto color = (*output)["color"].value<std::string>())
        {
            auto parsed = ConfigFile::ParseColorMode(*color);
            if (!parsed)
            {
                outError = "unknown color mode '" + *color + "'";
                return false;
            }
            settings.color = *parsed;
        }
    }

    return true;
}
} // namespace

std::optional<fs::path> ConfigFile::Locate()
{
    if (auto explicit_path = envPath("TRIM_CONFIG"))
        return explicit_path;

    std::optional<fs::path> candidate;
    if (auto xdg = envPath("XDG_CONFIG_HOME"))
        candidate = *xdg / "trim" / "config.toml";
    else if (auto home = envPath("HOME"))
        candidate = *home / ".config" / "trim" / "config.toml";

    std::error_code ec;
    if (candidate && fs::is_regular_file(*candidate, ec))
        return candidate;
    return std::nullopt;
}

bool ConfigFile::Load(const fs::path& path, AppSettings& settings, std::string& outError)
{
    try
    {
        auto root = toml::parse_file(path.string());
        return applyTable(root, settings, outError);
    }
    catch (const toml::parse_error& e)
    {
        outError = std::string(e.description());
        return false;
    }
}

bool ConfigFile::Parse(std::string_view text, AppSettings& settings, std::string& outError)
{
    try
    {
        auto root = toml::parse(text);
        return applyTable(root, settings, outError);
    }
    catch (const toml::parse_error& e)
    {
        outError = std::string(e.description());
        return false;
    }
}

AppSettings ConfigFile::LoadDefault()
{
    AppSettings settings;
    auto path = Locate();
    if (!path)
        return settings;

    AppSettings loaded;
    std::string error;
    if (!Load(*path, loaded, error))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Ignoring config file " + path->string(), error);
        return settings;
    }

    PLOG_DEBUG << "Loaded config from " << path->string();
    return loaded;
}

std::optional<plog::Severity> ConfigFile::ParseLevel(std::string_view name)
{
    if (name == "none")
        return plog::none;
    if (name == "fatal")
        return plog::fatal;
    if (name == "error")
        return plog::error;
    if (name == "warning")
        return plog::warning;
    if (name == "info")
        return plog::info;
    if (name == "debug")
        return plog::debug;
    if (name == "verbose")
        return plog::verbose;
    return std::nullopt;
}

std::optional<ColorMode> ConfigFile::ParseColorMode(std::string_view name)
{
    if (name == "auto")
        return ColorMode::Auto;
    if (name == "always")
        return ColorMode::Always;
    if (name == "never")
        return ColorMode::Never;
    return std::nullopt;
}

} // namespace trim::config
