#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "scorer/scorer.hpp"

struct WakeModelInfo {
    WakewordLabel label;
    size_t windowFeatures = 16;   // embeddings per inference
};

/// FeatureBackend
/// The three inference stages of the openWakeWord pipeline. Implementations
/// throw ScoringFault when a stage fails.
class FeatureBackend {
public:
    virtual ~FeatureBackend() = default;

    // One entry per wake word model, in model order
    virtual std::vector<WakeModelInfo> models() const = 0;

    // Raw int16-range samples -> unscaled mel frames, 32 floats each
    virtual std::vector<float> melFrames(std::vector<float>& samples) = 0;

    // 76 x 32 scaled mel frames -> one 96-float embedding
    virtual std::vector<float> embed(float* mels) = 0;

    // Last `windowFeatures` embeddings -> score of model `index`
    virtual float classify(size_t index, float* features, size_t windowFeatures) = 0;
};

/// StreamingScorer
/// Cuts incoming audio into 1280-sample steps (80 ms at 16 kHz). Each step
/// feeds 480 samples of overlap plus the step to the mel stage, adds one
/// embedding from the latest 76 mel frames and scores every wake model
/// whose feature window is full.
class StreamingScorer : public Scorer {
public:
    explicit StreamingScorer(std::unique_ptr<FeatureBackend> backend);

    // Labels scored during this call, with the highest score of the steps it
    // completed. Empty while fewer than 1280 samples are pending.
    ScoreFrame score(const std::vector<std::int16_t>& pcm) override;
    std::vector<WakewordLabel> labels() const override;

    size_t pendingSamples() const { return pending_.size(); }

private:
    void processStep(const float* samples, ScoreFrame& out);

    std::unique_ptr<FeatureBackend> backend_;
    std::vector<WakeModelInfo> models_;

    std::vector<float> pending_;   // samples not yet stepped
    std::vector<float> overlap_;   // tail of the previous step
    std::vector<float> mels_;      // rolling mel frames, 32 floats each
    std::vector<float> features_;  // rolling embeddings, 96 floats each
    size_t featureCount_ = 0;      // embeddings produced since start
    size_t maxWindow_ = 16;
};
