/**
 * @file test_config.cpp
 * @brief TOML loading, validation, defaults and atomic writes
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>

#include "config/config_loader.hpp"
#include "faults.hpp"
#include "tests/test_support.hpp"

namespace fs = std::filesystem;

namespace {

void writeText(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << text;
}

std::string errorOf(const nlohmann::json& doc) {
    try {
        config_loader::fromJson(doc, "<test>");
    } catch (const ConfigError& e) {
        return e.what();
    }
    return "";
}

}  // namespace

// =============================================================================
// READ / WRITE
// =============================================================================

TEST(Config, RoundTripThroughToml) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor", "Open_Terminal"});
    doc["general"]["log_level"] = "DEBUG";
    doc["general"]["launch_cooldown_secs"] = 1.25;
    doc["wakewords"]["Open_Terminal"] = {"wezterm start --always-new-process", "notify-send 'hi there'"};
    doc["thresholds"] = {{"Open_Editor", 0.7}};
    doc["audio"]["device_index"] = 3;

    Config original = config_loader::fromJson(doc);
    fs::path path = dir.path() / "config.toml";
    config_loader::writeConfig(path, config_loader::toJson(original));

    Config loaded = config_loader::readConfig(path);
    EXPECT_TRUE(loaded.sameContent(original));
    EXPECT_EQ(loaded.detection.labels(), (std::vector<std::string>{"Open_Editor", "Open_Terminal"}));
    EXPECT_DOUBLE_EQ(loaded.detection.thresholdFor("Open_Editor"), 0.7);
    EXPECT_DOUBLE_EQ(loaded.detection.thresholdFor("Open_Terminal"), 0.5);
    EXPECT_EQ(loaded.audio.deviceIndex, 3);
}

TEST(Config, WriteLeavesNoTempFile) {
    vltest::TempDir dir;
    fs::path path = dir.path() / "nested" / "voicelaunch" / "config.toml";
    config_loader::writeConfig(path, config_loader::defaultConfig());

    EXPECT_TRUE(fs::is_regular_file(path));
    EXPECT_FALSE(fs::exists(path.string() + ".tmp"));
}

TEST(Config, EnsureConfigWritesDefaultsOnce) {
    vltest::TempDir dir;
    fs::path path = dir.path() / "voicelaunch" / "config.toml";

    EXPECT_TRUE(config_loader::ensureConfig(path));
    EXPECT_FALSE(config_loader::ensureConfig(path));

    nlohmann::json doc = config_loader::readDocument(path);
    nlohmann::json defaults = config_loader::defaultConfig();
    EXPECT_EQ(doc["general"]["model_paths"], defaults["general"]["model_paths"]);
    EXPECT_EQ(doc["wakewords"], defaults["wakewords"]);
    EXPECT_EQ(doc["audio"], defaults["audio"]);
    EXPECT_DOUBLE_EQ(doc["general"]["sensitivity"].get<double>(), 0.5);
}

TEST(Config, DefaultsDescribeFourLaunchers) {
    nlohmann::json doc = config_loader::defaultConfig();

    ASSERT_EQ(doc["general"]["model_paths"].size(), 4u);
    EXPECT_EQ(doc["wakewords"]["Open_Browser"][0], "firefox");
    EXPECT_EQ(doc["wakewords"]["Open_Editor"][0], "code");
    EXPECT_EQ(doc["wakewords"]["Open_Terminal"][0], "wezterm start --always-new-process");
    EXPECT_EQ(doc["wakewords"]["Open_Youtube"][0], "firefox --new-tab https://www.youtube.com");
    EXPECT_EQ(doc["audio"]["chunk_size"], 1280);
    EXPECT_DOUBLE_EQ(doc["general"]["launch_cooldown_secs"].get<double>(), 3.0);
}

TEST(Config, ParsesHandWrittenToml) {
    vltest::TempDir dir;
    fs::path model = dir.touch("m/Open_Browser.onnx");
    fs::path path = dir.path() / "config.toml";
    writeText(path,
              "[general]\n"
              "model_paths = [\"" + model.string() + "\"]\n"
              "sensitivity = 0.4\n"
              "launch_cooldown_secs = 2\n"
              "log_level = \"warning\"\n"
              "\n"
              "[wakewords]\n"
              "Open_Browser = [\"firefox\"]\n"
              "\n"
              "[audio]\n"
              "sample_rate = 16000\n"
              "channels = 2\n"
              "chunk_size = 1280\n");

    Config cfg = config_loader::readConfig(path);
    EXPECT_DOUBLE_EQ(cfg.detection.sensitivity, 0.4);
    EXPECT_DOUBLE_EQ(cfg.detection.cooldownSecs, 2.0);
    EXPECT_EQ(cfg.detection.logLevel, "warning");
    EXPECT_EQ(cfg.audio.channels, 2);
    EXPECT_EQ(cfg.audio.deviceIndex, -1);
    EXPECT_EQ(cfg.detection.commandsFor("Open_Browser"), std::vector<std::string>{"firefox"});
}

TEST(Config, MalformedTomlIsParseError) {
    vltest::TempDir dir;
    fs::path path = dir.path() / "config.toml";
    writeText(path, "[general\nsensitivity = \n");

    try {
        config_loader::readConfig(path);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), "ERR_CONFIG_PARSE");
    }
}

TEST(Config, UnreachablePathIsConfigError) {
    vltest::TempDir dir;
    // A component longer than NAME_MAX makes stat() fail with ENAMETOOLONG
    fs::path path = dir.path() / std::string(300, 'a') / "config.toml";

    try {
        config_loader::ensureConfig(path);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), "ERR_CONFIG_WRITE");
    }
    EXPECT_THROW(config_loader::readDocument(path), ConfigError);
}

TEST(Config, MissingFileIsParseError) {
    vltest::TempDir dir;
    EXPECT_THROW(config_loader::readConfig(dir.path() / "absent.toml"), ConfigError);
}

// =============================================================================
// VALIDATION
// =============================================================================

TEST(Config, MissingKeysAreListedTogether) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    doc["general"].erase("sensitivity");
    doc["audio"].erase("chunk_size");
    doc.erase("wakewords");

    try {
        config_loader::fromJson(doc, "<test>");
        FAIL() << "expected ConfigSchemaError";
    } catch (const ConfigSchemaError& e) {
        std::string msg = e.what();
        EXPECT_EQ(e.code(), "ERR_CONFIG_MISSING_KEYS");
        EXPECT_NE(msg.find("general.sensitivity"), std::string::npos);
        EXPECT_NE(msg.find("audio.chunk_size"), std::string::npos);
        EXPECT_NE(msg.find("wakewords"), std::string::npos);
        EXPECT_NE(msg.find("delete it to create a default version"), std::string::npos);
    }
}

TEST(Config, SensitivityOutOfRangeRejected) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    doc["general"]["sensitivity"] = 1.7;

    EXPECT_NE(errorOf(doc).find("general.sensitivity"), std::string::npos);
}

TEST(Config, ThresholdOutOfRangeRejected) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    doc["thresholds"] = {{"Open_Editor", -0.1}};

    EXPECT_NE(errorOf(doc).find("thresholds.Open_Editor"), std::string::npos);
}

TEST(Config, NegativeCooldownRejected) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    doc["general"]["launch_cooldown_secs"] = -1;

    EXPECT_NE(errorOf(doc).find("launch_cooldown_secs"), std::string::npos);
}

TEST(Config, UnknownWakewordLabelRejected) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    doc["wakewords"]["Open_Spotify"] = {"spotify"};

    EXPECT_NE(errorOf(doc).find("wakewords.Open_Spotify"), std::string::npos);
}

TEST(Config, MissingModelFileRejected) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    doc["general"]["model_paths"].push_back((dir.path() / "nope" / "Open_Nope.onnx").string());

    EXPECT_NE(errorOf(doc).find("model file not found"), std::string::npos);
}

TEST(Config, DuplicateLabelRejected) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    doc["general"]["model_paths"].push_back(dir.touch("other/Open_Editor.onnx").string());

    EXPECT_NE(errorOf(doc).find("duplicate"), std::string::npos);
}

TEST(Config, BadLogLevelAndAudioRejectedTogether) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    doc["general"]["log_level"] = "LOUD";
    doc["audio"]["sample_rate"] = 0;
    doc["audio"]["device_index"] = -5;

    std::string msg = errorOf(doc);
    EXPECT_NE(msg.find("general.log_level"), std::string::npos);
    EXPECT_NE(msg.find("audio.sample_rate"), std::string::npos);
    EXPECT_NE(msg.find("audio.device_index"), std::string::npos);
}

TEST(Config, NonIntegerAudioRejected) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    doc["audio"]["chunk_size"] = 12.5;

    EXPECT_NE(errorOf(doc).find("audio.chunk_size must be an integer"), std::string::npos);
}

TEST(Config, OversizedAudioIntegerRejected) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    doc["audio"]["chunk_size"] = std::int64_t{4294968576};    // 2^32 + 1280
    doc["audio"]["sample_rate"] = std::int64_t{4294983296};   // 2^32 + 16000
    doc["audio"]["device_index"] = std::uint64_t{18446744073709551615ull};

    std::string msg = errorOf(doc);
    EXPECT_NE(msg.find("audio.chunk_size must be between 1 and 2147483647"), std::string::npos);
    EXPECT_NE(msg.find("audio.sample_rate must be between 1 and 2147483647"), std::string::npos);
    EXPECT_NE(msg.find("audio.device_index must be between -1 and 2147483647"), std::string::npos);
}

TEST(Config, OversizedIntegerInTomlFileRejected) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    doc["audio"]["chunk_size"] = std::int64_t{4294968576};
    fs::path path = dir.path() / "config.toml";
    config_loader::writeConfig(path, doc);

    try {
        config_loader::readConfig(path);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), "ERR_CONFIG_INVALID");
        EXPECT_NE(std::string(e.what()).find("4294968576"), std::string::npos);
    }
}

TEST(Config, IntegerLimitsAccepted) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    doc["audio"]["chunk_size"] = 2147483647;
    doc["audio"]["device_index"] = -1;

    Config cfg = config_loader::fromJson(doc);
    EXPECT_EQ(cfg.audio.chunkSize, 2147483647);
    EXPECT_EQ(cfg.audio.deviceIndex, -1);
}

// =============================================================================
// PATHS
// =============================================================================

TEST(Config, ExpandUserUsesHome) {
    const char* home = std::getenv("HOME");
    ASSERT_NE(home, nullptr);

    EXPECT_EQ(config_loader::expandUser("~/models/a.onnx"), std::string(home) + "/models/a.onnx");
    EXPECT_EQ(config_loader::expandUser("~"), std::string(home));
    EXPECT_EQ(config_loader::expandUser("/abs/a.onnx"), "/abs/a.onnx");
    EXPECT_EQ(config_loader::expandUser("~other/a.onnx"), "~other/a.onnx");
}

TEST(Config, LabelIsModelStem) {
    EXPECT_EQ(labelFromModelPath("/x/y/Open_Browser.onnx"), "Open_Browser");
    EXPECT_EQ(labelFromModelPath("hey_jarvis_v0.1.onnx"), "hey_jarvis_v0.1");
}
