#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <onnxruntime_cxx_api.h>

#include "scorer/streaming_scorer.hpp"

/// OnnxFeatureBackend
/// melspectrogram.onnx -> embedding_model.onnx -> one ONNX model per wake
/// word. Every onnxruntime error, including environment setup, surfaces as
/// ScoringFault.
class OnnxFeatureBackend : public FeatureBackend {
public:
    explicit OnnxFeatureBackend(const DetectionConfig& cfg);

    std::vector<WakeModelInfo> models() const override;
    std::vector<float> melFrames(std::vector<float>& samples) override;
    std::vector<float> embed(float* mels) override;
    float classify(size_t index, float* features, size_t windowFeatures) override;

private:
    struct Model {
        std::unique_ptr<Ort::Session> session;
        std::string inputName;
        std::string outputName;
    };

    Model loadModel(const std::filesystem::path& path);
    std::vector<float> run(Model& m, float* data, size_t count, const std::vector<int64_t>& shape);

    Ort::Env env_{nullptr};
    Ort::SessionOptions options_{nullptr};
    Ort::MemoryInfo memoryInfo_{nullptr};

    Model mel_;
    Model emb_;
    std::vector<Model> wakeModels_;
    std::vector<WakeModelInfo> info_;
};

std::unique_ptr<Scorer> makeOpenWakeWordScorer(const DetectionConfig& cfg);
