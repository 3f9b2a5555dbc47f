#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <vector>

#include "config/config_types.hpp"

// Label -> confidence (0.0 - 1.0) for one processed frame
using ScoreFrame = std::map<WakewordLabel, float>;

/// Scorer
/// Wraps a wake word model. Keeps whatever rolling state the model needs,
/// so one instance must only be fed from one stream. Throws ScoringFault
/// when a frame cannot be scored.
class Scorer {
public:
    virtual ~Scorer() = default;
    virtual ScoreFrame score(const std::vector<std::int16_t>& pcm) = 0;
    virtual std::vector<WakewordLabel> labels() const = 0;
};

// Builds a scorer for a detection config. Throws ScoringFault when the
// models cannot be loaded.
using ScorerFactory = std::function<std::unique_ptr<Scorer>(const DetectionConfig&)>;

// Throws ScoringFault (ERR_SCORER_INIT) unless `scorer` reports exactly the
// labels configured in `det`.
void requireLabels(const Scorer& scorer, const DetectionConfig& det);
