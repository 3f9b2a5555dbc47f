#include "config/config_loader.hpp"
#include "faults.hpp"
#include "logger.hpp"

#include <toml++/toml.hpp>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <set>
#include <sstream>
#include <unistd.h>

#ifndef VOICELAUNCH_DATA_DIR
#define VOICELAUNCH_DATA_DIR "/usr/local/share/voicelaunch"
#endif

namespace fs = std::filesystem;

// ----------------- TOML <-> json helpers -----------------
static nlohmann::json nodeToJson(const toml::node& node, const std::string& where) {
    if (const auto* tbl = node.as_table()) {
        nlohmann::json obj = nlohmann::json::object();
        for (auto&& [k, v] : *tbl) {
            std::string key(k.str());
            obj[key] = nodeToJson(v, where.empty() ? key : where + "." + key);
        }
        return obj;
    }
    if (const auto* arr = node.as_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (auto&& elem : *arr) {
            out.push_back(nodeToJson(elem, where + "[]"));
        }
        return out;
    }
    if (const auto* s = node.as_string())         return s->get();
    if (const auto* i = node.as_integer())        return i->get();
    if (const auto* f = node.as_floating_point()) return f->get();
    if (const auto* b = node.as_boolean())        return b->get();

    throw ConfigError("Unsupported TOML value (date/time) at " + where, "ERR_CONFIG_PARSE");
}

static toml::table toTable(const nlohmann::json& obj);

static toml::array toArray(const nlohmann::json& arr) {
    toml::array out;
    for (const auto& val : arr) {
        if (val.is_object())              out.push_back(toTable(val));
        else if (val.is_array())          out.push_back(toArray(val));
        else if (val.is_string())         out.push_back(val.get<std::string>());
        else if (val.is_boolean())        out.push_back(val.get<bool>());
        else if (val.is_number_integer()) out.push_back(val.get<std::int64_t>());
        else if (val.is_number_float())   out.push_back(val.get<double>());
    }
    return out;
}

static toml::table toTable(const nlohmann::json& obj) {
    toml::table tbl;
    for (auto& [key, val] : obj.items()) {
        if (val.is_object())              tbl.insert_or_assign(key, toTable(val));
        else if (val.is_array())          tbl.insert_or_assign(key, toArray(val));
        else if (val.is_string())         tbl.insert_or_assign(key, val.get<std::string>());
        else if (val.is_boolean())        tbl.insert_or_assign(key, val.get<bool>());
        else if (val.is_number_integer()) tbl.insert_or_assign(key, val.get<std::int64_t>());
        else if (val.is_number_float())   tbl.insert_or_assign(key, val.get<double>());
        // null: nothing to write
    }
    return tbl;
}

// ----------------- validation helpers -----------------
namespace {

struct Problems {
    std::vector<std::string> items;

    void add(const std::string& msg) { items.push_back(msg); }

    std::string joined() const {
        std::string out;
        for (size_t i = 0; i < items.size(); i++) {
            if (i) out += "; ";
            out += items[i];
        }
        return out;
    }
};

const nlohmann::json* member(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &*it;
}

bool readNumber(const nlohmann::json& v, const std::string& key, double& out, Problems& p) {
    if (!v.is_number()) {
        p.add(key + " must be a number");
        return false;
    }
    out = v.get<double>();
    if (!std::isfinite(out)) {
        p.add(key + " must be finite");
        return false;
    }
    return true;
}

// TOML integers are 64-bit; anything outside [minValue, INT_MAX] is rejected
// instead of being narrowed
bool readInt(const nlohmann::json& v, const std::string& key, int minValue, int& out, Problems& p) {
    if (!v.is_number_integer()) {
        p.add(key + " must be an integer");
        return false;
    }
    const bool tooLarge = v.is_number_unsigned() &&
                          v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    const std::int64_t wide = tooLarge ? std::numeric_limits<std::int64_t>::max() : v.get<std::int64_t>();
    if (wide < minValue || wide > std::numeric_limits<int>::max()) {
        p.add(key + " must be between " + std::to_string(minValue) + " and " +
              std::to_string(std::numeric_limits<int>::max()) + ", got " + v.dump());
        return false;
    }
    out = static_cast<int>(wide);
    return true;
}

void checkUnit(double v, const std::string& key, Problems& p) {
    if (v < 0.0 || v > 1.0) {
        std::ostringstream oss;
        oss << key << " must be within [0.0, 1.0], got " << v;
        p.add(oss.str());
    }
}

} // namespace

// ----------------- public API -----------------
namespace config_loader {

std::string expandUser(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;   // ~user is left alone

    const char* home = std::getenv("HOME");
    if (!home || !*home) return path;
    return std::string(home) + path.substr(1);
}

fs::path defaultConfigPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return fs::path(xdg) / "voicelaunch" / "config.toml";
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config" / "voicelaunch" / "config.toml";
    }
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return (ec ? fs::path(".") : cwd) / "config.toml";
}

nlohmann::json defaultConfig() {
    fs::path models = fs::path(VOICELAUNCH_DATA_DIR) / "models";
    return {
        {"general", {
            {"model_paths", {
                (models / "Open_Browser.onnx").string(),
                (models / "Open_Editor.onnx").string(),
                (models / "Open_Terminal.onnx").string(),
                (models / "Open_Youtube.onnx").string()
            }},
            {"feature_model_dir", ""},
            {"sensitivity", 0.5},
            {"log_level", "INFO"},
            {"launch_cooldown_secs", 3.0}
        }},
        {"wakewords", {
            {"Open_Terminal", {"wezterm start --always-new-process"}},
            {"Open_Browser",  {"firefox"}},
            {"Open_Editor",   {"code"}},
            {"Open_Youtube",  {"firefox --new-tab https://www.youtube.com"}}
        }},
        {"thresholds", nlohmann::json::object()},
        {"audio", {
            {"sample_rate", 16000},
            {"channels", 1},
            {"chunk_size", 1280},
            {"device_index", -1}
        }}
    };
}

nlohmann::json readDocument(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw ConfigError(ec ? "Cannot access config file " + path.string() + ": " + ec.message()
                             : "Config file not found: " + path.string(),
                          "ERR_CONFIG_PARSE");
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path.string());
    } catch (const toml::parse_error& e) {
        std::ostringstream oss;
        oss << "Failed to parse TOML config at " << path.string()
            << " (line " << e.source().begin.line
            << ", column " << e.source().begin.column << "): "
            << e.description();
        throw ConfigError(oss.str(), "ERR_CONFIG_PARSE");
    }

    return nodeToJson(tbl, "");
}

Config fromJson(const nlohmann::json& doc, const std::string& origin) {
    if (!doc.is_object()) {
        throw ConfigError("Unexpected top-level type in " + origin + ": " + doc.type_name());
    }

    const nlohmann::json* gen       = member(doc, "general");
    const nlohmann::json* wakewords = member(doc, "wakewords");
    const nlohmann::json* audio     = member(doc, "audio");

    // ---- schema: every required key, reported together ----
    std::vector<std::string> missing;
    if (!gen || !gen->is_object()) {
        missing.insert(missing.end(), {"general.model_paths", "general.sensitivity",
                                       "general.launch_cooldown_secs"});
    } else {
        if (!member(*gen, "model_paths"))          missing.push_back("general.model_paths");
        if (!member(*gen, "sensitivity"))          missing.push_back("general.sensitivity");
        if (!member(*gen, "launch_cooldown_secs")) missing.push_back("general.launch_cooldown_secs");
    }
    if (!wakewords || !wakewords->is_object()) {
        missing.push_back("wakewords");
    }
    if (!audio || !audio->is_object()) {
        missing.insert(missing.end(), {"audio.sample_rate", "audio.channels", "audio.chunk_size"});
    } else {
        if (!member(*audio, "sample_rate")) missing.push_back("audio.sample_rate");
        if (!member(*audio, "channels"))    missing.push_back("audio.channels");
        if (!member(*audio, "chunk_size"))  missing.push_back("audio.chunk_size");
    }

    if (!missing.empty()) {
        std::string keys;
        for (size_t i = 0; i < missing.size(); i++) {
            if (i) keys += ", ";
            keys += missing[i];
        }
        throw ConfigSchemaError("Config at " + origin + " is missing required keys: " + keys +
                                ". Please fix config.toml file or delete it to create a default version.");
    }

    // ---- values ----
    Config cfg;
    Problems p;
    DetectionConfig& det = cfg.detection;

    const auto& paths = (*gen)["model_paths"];
    if (!paths.is_array() || paths.empty()) {
        p.add("general.model_paths must be a non-empty list of paths");
    } else {
        for (const auto& entry : paths) {
            if (!entry.is_string() || entry.get<std::string>().empty()) {
                p.add("general.model_paths entries must be non-empty strings");
                continue;
            }
            det.modelPaths.push_back(expandUser(entry.get<std::string>()));
        }
    }

    std::set<WakewordLabel> known;
    for (const auto& path : det.modelPaths) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            p.add("model file not found: " + path);
        }
        if (!known.insert(labelFromModelPath(path)).second) {
            p.add("duplicate wake word label '" + labelFromModelPath(path) + "' in general.model_paths");
        }
    }

    if (const auto* dir = member(*gen, "feature_model_dir")) {
        if (!dir->is_string()) {
            p.add("general.feature_model_dir must be a string");
        } else {
            det.featureModelDir = expandUser(dir->get<std::string>());
            std::error_code ec;
            if (!det.featureModelDir.empty() && !fs::is_directory(det.featureModelDir, ec)) {
                p.add("general.feature_model_dir is not a directory: " + det.featureModelDir);
            }
        }
    }

    if (readNumber((*gen)["sensitivity"], "general.sensitivity", det.sensitivity, p)) {
        checkUnit(det.sensitivity, "general.sensitivity", p);
    }

    if (readNumber((*gen)["launch_cooldown_secs"], "general.launch_cooldown_secs", det.cooldownSecs, p) &&
        det.cooldownSecs < 0.0) {
        p.add("general.launch_cooldown_secs must be >= 0");
    }

    if (const auto* lvl = member(*gen, "log_level")) {
        LogLevel parsed;
        if (!lvl->is_string() || !parseLogLevel(lvl->get<std::string>(), parsed)) {
            p.add("general.log_level must be one of DEBUG, INFO, WARNING, ERROR, CRITICAL");
        } else {
            det.logLevel = lvl->get<std::string>();
        }
    }

    for (auto& [label, cmds] : wakewords->items()) {
        if (!known.count(label)) {
            p.add("wakewords." + label + " does not match any loaded model");
            continue;
        }
        if (!cmds.is_array()) {
            p.add("wakewords." + label + " must be a list of command strings");
            continue;
        }
        std::vector<std::string> list;
        for (const auto& c : cmds) {
            if (!c.is_string()) {
                p.add("wakewords." + label + " entries must be strings");
                continue;
            }
            list.push_back(c.get<std::string>());
        }
        det.commands[label] = std::move(list);
    }

    if (const auto* th = member(doc, "thresholds")) {
        if (!th->is_object()) {
            p.add("thresholds must be a table of label = value");
        } else {
            for (auto& [label, val] : th->items()) {
                if (!known.count(label)) {
                    p.add("thresholds." + label + " does not match any loaded model");
                    continue;
                }
                double v = 0.0;
                if (readNumber(val, "thresholds." + label, v, p)) {
                    checkUnit(v, "thresholds." + label, p);
                    det.thresholds[label] = v;
                }
            }
        }
    }

    AudioConfig& a = cfg.audio;
    readInt((*audio)["sample_rate"], "audio.sample_rate", 1, a.sampleRate, p);
    readInt((*audio)["channels"], "audio.channels", 1, a.channels, p);
    readInt((*audio)["chunk_size"], "audio.chunk_size", 1, a.chunkSize, p);
    if (const auto* dev = member(*audio, "device_index")) {
        // -1 = default device
        readInt(*dev, "audio.device_index", -1, a.deviceIndex, p);
    }

    if (!p.items.empty()) {
        throw ConfigError("Config at " + origin + " is invalid: " + p.joined());
    }
    return cfg;
}

nlohmann::json toJson(const Config& cfg) {
    const DetectionConfig& det = cfg.detection;

    nlohmann::json wakewords = nlohmann::json::object();
    for (const auto& [label, cmds] : det.commands) {
        wakewords[label] = cmds;
    }
    nlohmann::json thresholds = nlohmann::json::object();
    for (const auto& [label, v] : det.thresholds) {
        thresholds[label] = v;
    }

    return {
        {"general", {
            {"model_paths", det.modelPaths},
            {"feature_model_dir", det.featureModelDir},
            {"sensitivity", det.sensitivity},
            {"log_level", det.logLevel},
            {"launch_cooldown_secs", det.cooldownSecs}
        }},
        {"wakewords", wakewords},
        {"thresholds", thresholds},
        {"audio", {
            {"sample_rate", cfg.audio.sampleRate},
            {"channels", cfg.audio.channels},
            {"chunk_size", cfg.audio.chunkSize},
            {"device_index", cfg.audio.deviceIndex}
        }}
    };
}

Config readConfig(const fs::path& path) {
    return fromJson(readDocument(path), path.string());
}

std::string toToml(const nlohmann::json& doc) {
    std::ostringstream oss;
    oss << "# voicelaunch configuration\n"
        << "#\n"
        << "# [general]    model_paths: openWakeWord .onnx files; the file name is the wake word label\n"
        << "#              feature_model_dir: holds melspectrogram.onnx and embedding_model.onnx\n"
        << "#                                 (empty = directory of the first model)\n"
        << "#              sensitivity: 0.0 - 1.0, launch_cooldown_secs: >= 0\n"
        << "#              log_level: DEBUG, INFO, WARNING, ERROR, CRITICAL\n"
        << "# [wakewords]  label = [\"command --with flags\", ...]\n"
        << "# [thresholds] label = 0.0 - 1.0 (overrides sensitivity for that label)\n"
        << "# [audio]      sample_rate, channels, chunk_size, device_index (-1 = default)\n"
        << "#\n"
        << "# Send SIGHUP (systemctl --user reload voicelaunch) to apply edits.\n\n";
    oss << toTable(doc) << "\n";
    return oss.str();
}

void writeConfig(const fs::path& path, const nlohmann::json& doc) {
    std::error_code ec;
    fs::path parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw ConfigError("Failed to create config directory " + parent.string() + ": " +
                              ec.message(), "ERR_CONFIG_WRITE");
        }
    }

    const std::string text = toToml(doc);
    fs::path tmp = path;
    tmp += ".tmp";

    std::FILE* f = std::fopen(tmp.c_str(), "w");
    if (!f) {
        throw ConfigError("Failed to open " + tmp.string() + " for writing", "ERR_CONFIG_WRITE");
    }
    bool ok = std::fwrite(text.data(), 1, text.size(), f) == text.size();
    ok = (std::fflush(f) == 0) && ok;
    ok = (::fsync(fileno(f)) == 0) && ok;
    ok = (std::fclose(f) == 0) && ok;

    if (ok) {
        fs::rename(tmp, path, ec);
        ok = !ec;
    }
    if (!ok) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw ConfigError("Failed to write config to " + path.string(), "ERR_CONFIG_WRITE");
    }
}

bool ensureConfig(const fs::path& path) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return false;
    }
    if (ec) {
        throw ConfigError("Cannot access config file " + path.string() + ": " + ec.message(),
                          "ERR_CONFIG_WRITE");
    }
    writeConfig(path, defaultConfig());
    LOG_PHASE("Default config created", true);
    LOG_INFO("Config", "Wrote default configuration to " + path.string());
    return true;
}

} // namespace config_loader
