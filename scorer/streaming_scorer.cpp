#include "scorer/streaming_scorer.hpp"
#include "faults.hpp"

#include <algorithm>

// openWakeWord feature pipeline constants
const size_t chunkSamples   = 1280;  // 80 ms
const size_t overlapSamples = 480;   // 3 mel hops carried into the next step
const size_t numMels        = 32;
const size_t embWindowSize  = 76;    // 775 ms
const size_t embFeatures    = 96;
const size_t maxMelFrames   = 10 * embWindowSize;

StreamingScorer::StreamingScorer(std::unique_ptr<FeatureBackend> backend)
    : backend_(std::move(backend)), models_(backend_->models()) {
    for (const auto& m : models_) {
        maxWindow_ = std::max(maxWindow_, m.windowFeatures);
    }

    // Mel window starts out as a full window of ones
    mels_.assign(embWindowSize * numMels, 1.0f);
    overlap_.assign(overlapSamples, 0.0f);
}

void StreamingScorer::processStep(const float* samples, ScoreFrame& out) {
    // ---- audio -> mels ----
    std::vector<float> melInput(overlap_);
    melInput.insert(melInput.end(), samples, samples + chunkSamples);
    std::copy(melInput.end() - overlapSamples, melInput.end(), overlap_.begin());

    std::vector<float> mel = backend_->melFrames(melInput);
    if (mel.size() % numMels != 0) {
        throw ScoringFault("mel output of " + std::to_string(mel.size()) +
                           " values is not a whole number of frames");
    }

    // Scale mels for Google speech embedding model
    for (float v : mel) {
        mels_.push_back((v / 10.0f) + 2.0f);
    }
    if (mels_.size() > maxMelFrames * numMels) {
        mels_.erase(mels_.begin(), mels_.end() - maxMelFrames * numMels);
    }

    // ---- mels -> one embedding from the latest window ----
    float* window = mels_.data() + (mels_.size() - embWindowSize * numMels);
    std::vector<float> emb = backend_->embed(window);
    if (emb.size() != embFeatures) {
        throw ScoringFault("embedding has " + std::to_string(emb.size()) + " values, expected 96");
    }

    features_.insert(features_.end(), emb.begin(), emb.end());
    featureCount_++;
    if (features_.size() > maxWindow_ * embFeatures) {
        features_.erase(features_.begin(), features_.end() - maxWindow_ * embFeatures);
    }

    // ---- embeddings -> wake word scores ----
    for (size_t i = 0; i < models_.size(); i++) {
        const WakeModelInfo& m = models_[i];
        float probability = 0.0f;

        // Until the window is filled with real embeddings the score stays 0
        if (featureCount_ >= m.windowFeatures) {
            float* feats = features_.data() + (features_.size() - m.windowFeatures * embFeatures);
            probability = backend_->classify(i, feats, m.windowFeatures);
        }

        auto it = out.find(m.label);
        if (it == out.end()) out[m.label] = probability;
        else it->second = std::max(it->second, probability);
    }
}

ScoreFrame StreamingScorer::score(const std::vector<std::int16_t>& pcm) {
    // NOTE: samples are not normalized, the mel model expects int16 range
    for (std::int16_t s : pcm) {
        pending_.push_back(static_cast<float>(s));
    }

    ScoreFrame out;
    size_t offset = 0;
    try {
        while (pending_.size() - offset >= chunkSamples) {
            processStep(pending_.data() + offset, out);
            offset += chunkSamples;
        }
    } catch (const ScoringFault&) {
        // The failed step is dropped with the ones before it
        pending_.erase(pending_.begin(), pending_.begin() + offset + chunkSamples);
        throw;
    }

    pending_.erase(pending_.begin(), pending_.begin() + offset);
    return out;
}

std::vector<WakewordLabel> StreamingScorer::labels() const {
    std::vector<WakewordLabel> out;
    for (const auto& m : models_) out.push_back(m.label);
    return out;
}
