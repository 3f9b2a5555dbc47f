#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

#include "logger.hpp"

// ------------------------------------------------------------
// FaultReport: what was logged for a reported error code
// ------------------------------------------------------------
struct FaultReport {
    std::string errorCode;
    std::string userMessage;   // shown in the log for the user
    std::string debugMessage;  // catalog explanation of the code
    std::string detail;        // runtime detail (exception text, errno...)
};

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Built-in catalog { code: { "user": ..., "debug": ... } }
    nlohmann::json defaultErrors();

    // Load the built-in catalog, then overlay entries from `overrides`
    // (same shape, optionally wrapped in {"errors": {...}}).
    void init(const nlohmann::json& overrides = nlohmann::json::object());

    // init() with the overrides read from a JSON file. A missing file keeps
    // the built-in catalog silently, an unreadable one with a warning.
    // Returns true when overrides were applied.
    bool load(const std::filesystem::path& path);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Report an error: logs "<user> (<detail>)" at `level` and the catalog
    // debug text at DEBUG.
    FaultReport report(const std::string& code,
                       const std::string& detail = "",
                       LogLevel level = LogLevel::Error);
}
