#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

#include "config/config_types.hpp"

// Config file handling: TOML on disk, nlohmann::json document in memory,
// typed Config once validated.
namespace config_loader {

    // $XDG_CONFIG_HOME/voicelaunch/config.toml, else ~/.config/voicelaunch/config.toml
    std::filesystem::path defaultConfigPath();

    // Canonical defaults (written on first run)
    nlohmann::json defaultConfig();

    // "~" and "~/x" expanded against $HOME
    std::string expandUser(const std::string& path);

    // Parse a TOML file into a json document.
    // Throws ConfigError (ERR_CONFIG_PARSE) on missing/unreadable/malformed files.
    nlohmann::json readDocument(const std::filesystem::path& path);

    // Validate a document and build the snapshot. `origin` names the source in
    // error messages. Throws ConfigSchemaError when required keys are absent and
    // ConfigError for bad values, unknown labels or missing model files.
    Config fromJson(const nlohmann::json& doc, const std::string& origin = "<memory>");

    // Inverse of fromJson (version is not stored)
    nlohmann::json toJson(const Config& cfg);

    // readDocument + fromJson
    Config readConfig(const std::filesystem::path& path);

    // Serialize to TOML and replace `path` atomically (temp file + rename).
    // Creates the parent directory. Throws ConfigError (ERR_CONFIG_WRITE).
    void writeConfig(const std::filesystem::path& path, const nlohmann::json& doc);
    std::string toToml(const nlohmann::json& doc);

    // Writes defaults when `path` does not exist. Returns true if it did.
    bool ensureConfig(const std::filesystem::path& path);
}
