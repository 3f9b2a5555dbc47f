#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_types.hpp"
#include "scorer/scorer.hpp"

namespace Wake {

using Clock = std::chrono::steady_clock;

// Per-label detection state
enum class State {
    Armed,     // eligible to fire
    Cooling    // fired recently, scores are tracked but suppressed
};

// One confirmed detection. Commands are copied out of the snapshot the
// detection ran against, so later reloads cannot change them.
struct DispatchRequest {
    WakewordLabel label;
    float score = 0.0f;
    Clock::time_point firedAt;
    std::uint64_t configVersion = 0;
    std::vector<std::string> commands;
};

/// Detector
/// Threshold/cooldown state machine. The cooldown map is the only state and
/// is touched exclusively through step() and retainLabels().
class Detector {
public:
    // Evaluate one score frame. Every label at or above its threshold that is
    // not cooling fires; its timestamp is recorded before this returns.
    std::vector<DispatchRequest> step(const ScoreFrame& scores,
                                      const Config& cfg,
                                      Clock::time_point now);

    State stateOf(const WakewordLabel& label,
                  const Config& cfg,
                  Clock::time_point now) const;

    std::optional<Clock::time_point> lastFired(const WakewordLabel& label) const;

    // After a reload: keep cooldowns of labels still configured, forget the rest
    void retainLabels(const Config& cfg);

private:
    std::unordered_map<WakewordLabel, Clock::time_point> lastFired_;
};

} // namespace Wake
