#include "wake/wake.hpp"
#include "logger.hpp"

#include <set>
#include <sstream>

namespace Wake {

static std::chrono::duration<double> cooldownOf(const Config& cfg) {
    return std::chrono::duration<double>(cfg.detection.cooldownSecs);
}

State Detector::stateOf(const WakewordLabel& label,
                        const Config& cfg,
                        Clock::time_point now) const {
    auto it = lastFired_.find(label);
    if (it == lastFired_.end()) return State::Armed;
    return (now - it->second >= cooldownOf(cfg)) ? State::Armed : State::Cooling;
}

std::optional<Clock::time_point> Detector::lastFired(const WakewordLabel& label) const {
    auto it = lastFired_.find(label);
    if (it == lastFired_.end()) return std::nullopt;
    return it->second;
}

std::vector<DispatchRequest> Detector::step(const ScoreFrame& scores,
                                            const Config& cfg,
                                            Clock::time_point now) {
    std::vector<DispatchRequest> fired;

    for (const auto& [label, score] : scores) {
        if (score < cfg.detection.thresholdFor(label)) continue;

        if (stateOf(label, cfg, now) == State::Cooling) {
            LOG_DEBUG("Wake", "Suppressed label=" + label + " (cooling)");
            continue;
        }

        // Armed -> Cooling
        lastFired_[label] = now;

        DispatchRequest req;
        req.label = label;
        req.score = score;
        req.firedAt = now;
        req.configVersion = cfg.version;
        req.commands = cfg.detection.commandsFor(label);

        std::ostringstream oss;
        oss << "Detection fired label=" << label << " score=" << score
            << " threshold=" << cfg.detection.thresholdFor(label)
            << " commands=" << req.commands.size();
        LOG_INFO("Wake", oss.str());

        fired.push_back(std::move(req));
    }

    return fired;
}

void Detector::retainLabels(const Config& cfg) {
    std::set<WakewordLabel> keep;
    for (const auto& label : cfg.detection.labels()) keep.insert(label);

    for (auto it = lastFired_.begin(); it != lastFired_.end();) {
        if (!keep.count(it->first)) {
            LOG_DEBUG("Wake", "Dropping cooldown of removed label=" + it->first);
            it = lastFired_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace Wake
