// SPDX-License-Identifier: Apache-2.0
#include <tailview/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace tailview;

namespace
{
auto writeTempConfig(std::string const& name, std::string const& content) -> std::filesystem::path
{
    auto const tempPath = std::filesystem::temp_directory_path() / name;
    auto file = std::ofstream(tempPath);
    file << content;
    return tempPath;
}
} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
    REQUIRE(path.starts_with(defaultConfigDir()));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.view.itemGap == 1);
    CHECK(config.view.autoScroll == true);
    CHECK(config.view.wheelStep == 3);
    CHECK(config.view.theme == "dark");
    CHECK(config.view.selectionMarker == "▸ ");
    CHECK(config.reader.follow == false);
    CHECK(config.reader.replayDelayMs == 0);
    CHECK(config.reader.sessionsDir.empty());
    CHECK(config.log.level == "info");
    CHECK(config.log.file.empty());
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = writeTempConfig("tailview_test_config.json", R"({
        "view": {
            "itemGap": 0,
            "autoScroll": false,
            "wheelStep": 5,
            "theme": "light",
            "selectionMarker": "> "
        },
        "reader": {
            "follow": true,
            "replayDelayMs": 40,
            "sessionsDir": "/tmp/sessions"
        },
        "log": {
            "level": "debug",
            "file": "/tmp/tailview.log"
        }
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;

    SECTION("View config")
    {
        CHECK(config.view.itemGap == 0);
        CHECK(config.view.autoScroll == false);
        CHECK(config.view.wheelStep == 5);
        CHECK(config.view.theme == "light");
        CHECK(config.view.selectionMarker == "> ");
    }

    SECTION("Reader config")
    {
        CHECK(config.reader.follow == true);
        CHECK(config.reader.replayDelayMs == 40);
        CHECK(config.reader.sessionsDir == "/tmp/sessions");
    }

    SECTION("Log config")
    {
        CHECK(config.log.level == "debug");
        CHECK(config.log.file == "/tmp/tailview.log");
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile keeps defaults for missing sections", "[config]")
{
    auto const tempPath = writeTempConfig("tailview_test_partial.json", R"({"view": {"theme": "mono"}})");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(result->view.theme == "mono");
    CHECK(result->view.itemGap == 1);
    CHECK(result->view.wheelStep == 3);
    CHECK(result->reader.follow == false);
    CHECK(result->log.level == "info");

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile clamps out-of-range numbers", "[config]")
{
    auto const tempPath = writeTempConfig(
        "tailview_test_clamp.json", R"({"view": {"itemGap": -2, "wheelStep": 0}, "reader": {"replayDelayMs": -9}})");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(result->view.itemGap == 0);
    CHECK(result->view.wheelStep == 1);
    CHECK(result->reader.replayDelayMs == 0);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile returns error for non-existent file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const tempPath = writeTempConfig("tailview_test_invalid.json", "{ invalid json }}}");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects a non-object root", "[config]")
{
    auto const tempPath = writeTempConfig("tailview_test_array.json", "[1, 2]");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects unknown log levels", "[config]")
{
    auto const tempPath = writeTempConfig("tailview_test_level.json", R"({"log": {"level": "chatty"}})");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
    CHECK(result.error().message.find("chatty") != std::string::npos);

    std::filesystem::remove(tempPath);
}

TEST_CASE("saveConfigToFile writes a valid config that can be loaded back", "[config]")
{
    auto const tempDir = std::filesystem::temp_directory_path() / "tailview_test_save";
    auto const tempPath = tempDir / "nested" / "config.json";
    std::filesystem::remove_all(tempDir);

    auto config = AppConfig {};
    config.view.itemGap = 2;
    config.view.theme = "mono";
    config.reader.follow = true;
    config.reader.sessionsDir = "/var/sessions";
    config.log.level = "trace";
    config.log.file = "/tmp/x.log";

    auto saveResult = saveConfigToFile(tempPath.string(), config);
    REQUIRE(saveResult.has_value());
    REQUIRE(std::filesystem::exists(tempPath));

    auto loaded = loadConfigFromFile(tempPath.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->view.itemGap == 2);
    CHECK(loaded->view.theme == "mono");
    CHECK(loaded->view.selectionMarker == "▸ ");
    CHECK(loaded->reader.follow == true);
    CHECK(loaded->reader.sessionsDir == "/var/sessions");
    CHECK(loaded->log.level == "trace");
    CHECK(loaded->log.file == "/tmp/x.log");

    std::filesystem::remove_all(tempDir);
}

TEST_CASE("saveConfigToFile with defaults produces loadable config", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "tailview_test_defaults.json";

    REQUIRE(saveConfigToFile(tempPath.string(), AppConfig {}).has_value());

    auto loaded = loadConfigFromFile(tempPath.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->view.wheelStep == 3);
    CHECK(loaded->reader.sessionsDir.empty());
    CHECK(loaded->log.file.empty());

    std::filesystem::remove(tempPath);
}
