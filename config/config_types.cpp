#include "config/config_types.hpp"

#include <filesystem>

WakewordLabel labelFromModelPath(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

std::vector<WakewordLabel> DetectionConfig::labels() const {
    std::vector<WakewordLabel> out;
    out.reserve(modelPaths.size());
    for (const auto& p : modelPaths) {
        out.push_back(labelFromModelPath(p));
    }
    return out;
}

double DetectionConfig::thresholdFor(const WakewordLabel& label) const {
    auto it = thresholds.find(label);
    return it != thresholds.end() ? it->second : sensitivity;
}

const std::vector<std::string>& DetectionConfig::commandsFor(const WakewordLabel& label) const {
    static const std::vector<std::string> none;
    auto it = commands.find(label);
    return it != commands.end() ? it->second : none;
}
