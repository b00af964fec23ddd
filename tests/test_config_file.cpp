#include <catch2/catch_test_macros.hpp>

#include "config/ConfigFile.hpp"
#include "utils/TempDir.hpp"

#include <string>

using trim::config::AppSettings;
using trim::config::ColorMode;
using trim::config::ConfigFile;

TEST_CASE("ConfigFile - defaults when nothing is set", "[config]")
{
    AppSettings settings;
    std::string error;
    REQUIRE(ConfigFile::Parse("", settings, error));
    REQUIRE(settings.log.level == plog::warning);
    REQUIRE(settings.log.file.empty());
    REQUIRE(settings.color == ColorMode::Auto);
}

TEST_CASE("ConfigFile - reads log and output tables", "[config]")
{
    AppSettings settings;
    std::string error;
    REQUIRE(ConfigFile::Parse(R"(
[log]
level = "debug"
file = "/tmp/trim.log"
max_file_size = 2048
backup_count = 5

[output]
color = "never"
)",
                              settings, error));

    REQUIRE(settings.log.level == plog::debug);
    REQUIRE(settings.log.file == "/tmp/trim.log");
    REQUIRE(settings.log.max_file_size == 2048);
    REQUIRE(settings.log.backup_count == 5);
    REQUIRE(settings.color == ColorMode::Never);
}

TEST_CASE("ConfigFile - rejects bad values", "[config]")
{
    AppSettings settings;
    std::string error;

    REQUIRE_FALSE(ConfigFile::Parse("[log]\nlevel = \"loud\"\n", settings, error));
    REQUIRE(error == "unknown log level 'loud'");

    REQUIRE_FALSE(ConfigFile::Parse("[output]\ncolor = \"rainbow\"\n", settings, error));
    REQUIRE_FALSE(ConfigFile::Parse("[log]\nmax_file_size = 0\n", settings, error));
    REQUIRE_FALSE(ConfigFile::Parse("[log\nlevel = ", settings, error));
    REQUIRE_FALSE(error.empty());
}

TEST_CASE("ConfigFile - loads from a file", "[config]")
{
    test_utils::TempDir dir;
    auto path = dir.write("config.toml", "[log]\nlevel = \"error\"\n");

    AppSettings settings;
    std::string error;
    REQUIRE(ConfigFile::Load(path, settings, error));
    REQUIRE(settings.log.level == plog::error);
}

TEST_CASE("ConfigFile - level and color names", "[config]")
{
    REQUIRE(ConfigFile::ParseLevel("none") == plog::none);
    REQUIRE(ConfigFile::ParseLevel("verbose") == plog::verbose);
    REQUIRE_FALSE(ConfigFile::ParseLevel("WARNING"));
    REQUIRE(ConfigFile::ParseColorMode("always") == ColorMode::Always);
    REQUIRE_FALSE(ConfigFile::ParseColorMode(""));
}
