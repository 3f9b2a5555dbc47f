#include "error_manager.hpp"

#include <fstream>
#include <mutex>
#include <system_error>

// ------------------------------------------------------------
// Catalog storage
// ------------------------------------------------------------
static nlohmann::json g_root;
static std::mutex g_errorsMutex;

namespace ErrorManager {

nlohmann::json defaultErrors() {
    return {
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Configuration is invalid."},
            {"debug", "Config value failed validation (range, type, unknown label or missing model file)."}
        }},
        {"ERR_CONFIG_MISSING_KEYS", {
            {"user", "[Config] Configuration is missing required keys."},
            {"debug", "Schema check found absent keys; fix config.toml or delete it to regenerate defaults."}
        }},
        {"ERR_CONFIG_PARSE", {
            {"user", "[Config] Configuration file could not be parsed."},
            {"debug", "TOML parser rejected the file."}
        }},
        {"ERR_CONFIG_WRITE", {
            {"user", "[Config] Could not write the configuration file."},
            {"debug", "Creating the config directory or renaming the temp file failed."}
        }},
        {"ERR_RELOAD_REJECTED", {
            {"user", "[Reload] Edit had no effect, still running with the previous configuration."},
            {"debug", "Candidate snapshot failed validation or component preparation; active snapshot kept."}
        }},
        {"ERR_DEVICE_OPEN", {
            {"user", "[Audio] Could not open the microphone."},
            {"debug", "PortAudio init/open/start of the input stream failed."}
        }},
        {"ERR_DEVICE_FAULT", {
            {"user", "[Audio] Microphone stream failed, shutting down."},
            {"debug", "Pa_ReadStream returned an error other than input overflow."}
        }},
        {"ERR_SCORER_INIT", {
            {"user", "[Scorer] Could not load wake word models."},
            {"debug", "onnxruntime failed to create a session for a feature or wake word model."}
        }},
        {"ERR_SCORING_FAULT", {
            {"user", "[Scorer] Frame skipped, scoring failed."},
            {"debug", "onnxruntime Run() threw while scoring one frame."}
        }},
        {"ERR_DISPATCH_PARSE", {
            {"user", "[Dispatch] Command string could not be split into arguments."},
            {"debug", "Unbalanced quote or trailing escape in configured command."}
        }},
        {"ERR_DISPATCH_FAILED", {
            {"user", "[Dispatch] Command failed to start."},
            {"debug", "fork/setsid/exec of the configured command failed."}
        }},
        {"ERR_COMMAND_NOT_FOUND", {
            {"user", "[Dispatch] Command not found on PATH or as a file."},
            {"debug", "execvp returned ENOENT for the first word of the command."}
        }}
    };
}

void init(const nlohmann::json& overrides) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    g_root = defaultErrors();

    const nlohmann::json& src =
        (overrides.contains("errors") && overrides["errors"].is_object()) ? overrides["errors"]
                                                                           : overrides;
    if (src.is_object()) {
        for (auto& [key, val] : src.items()) {
            if (val.is_object()) g_root[key] = val;
        }
    }
}

bool load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_DEBUG("ErrorManager", "No overrides at " + path.string() + ", using built-in catalog");
        init();
        return false;
    }

    std::ifstream in(path);
    if (!in) {
        LOG_WARN("ErrorManager", "Could not open " + path.string());
        init();
        return false;
    }

    nlohmann::json overrides;
    try {
        overrides = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARN("ErrorManager", "Failed to parse " + path.string() + " -> " + e.what());
        init();
        return false;
    }

    if (!overrides.is_object()) {
        LOG_WARN("ErrorManager", path.string() + " is not a JSON object, ignored");
        init();
        return false;
    }

    init(overrides);
    LOG_INFO("ErrorManager", "Loaded error overrides from " + path.string());
    return true;
}

std::string getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    if (g_root.is_null()) g_root = defaultErrors();
    if (g_root.contains(code) && g_root[code].contains("user")) {
        return g_root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    if (g_root.is_null()) g_root = defaultErrors();
    if (g_root.contains(code) && g_root[code].contains("debug")) {
        return g_root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

FaultReport report(const std::string& code, const std::string& detail, LogLevel level) {
    FaultReport result;
    result.errorCode    = code;
    result.userMessage  = getUserMessage(code);
    result.debugMessage = getDebugMessage(code);
    result.detail       = detail;

    std::string line = result.userMessage;
    if (!detail.empty()) line += " (" + detail + ")";

    logMessage(level, code, line);
    LOG_DEBUG(code, result.debugMessage);
    return result;
}

} // namespace ErrorManager
