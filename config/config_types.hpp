#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// ------------------------------------------------------------
// Wake word label: stem of the model file ("Open_Browser")
// ------------------------------------------------------------
using WakewordLabel = std::string;

struct DetectionConfig {
    std::vector<std::string> modelPaths;                    // ordered, ~ expanded
    std::string featureModelDir;                            // "" = dir of first model
    double sensitivity = 0.5;                               // global threshold
    std::map<WakewordLabel, double> thresholds;             // per-label override
    std::string logLevel = "INFO";
    double cooldownSecs = 3.0;
    std::map<WakewordLabel, std::vector<std::string>> commands;

    // Labels in model order
    std::vector<WakewordLabel> labels() const;

    double thresholdFor(const WakewordLabel& label) const;
    const std::vector<std::string>& commandsFor(const WakewordLabel& label) const;

    bool operator==(const DetectionConfig&) const = default;
};

struct AudioConfig {
    int sampleRate = 16000;
    int channels = 1;
    int chunkSize = 1280;   // samples per channel per read
    int deviceIndex = -1;   // -1 = default input device

    bool operator==(const AudioConfig&) const = default;
};

// ------------------------------------------------------------
// Config: one immutable snapshot. Published as
// std::shared_ptr<const Config> and never modified afterwards.
// ------------------------------------------------------------
struct Config {
    DetectionConfig detection;
    AudioConfig audio;
    std::uint64_t version = 0;   // assigned on publish

    // Equality of contents, ignoring the publish version
    bool sameContent(const Config& other) const {
        return detection == other.detection && audio == other.audio;
    }

    // Changes that need a new scorer instance
    bool modelsDiffer(const Config& other) const {
        return detection.modelPaths != other.detection.modelPaths ||
               detection.featureModelDir != other.detection.featureModelDir;
    }
};

// Label derived from a model path: file name without extension
WakewordLabel labelFromModelPath(const std::string& path);
