#include "scorer/openwakeword_scorer.hpp"
#include "faults.hpp"
#include "logger.hpp"

#include <functional>
#include <numeric>
#include <system_error>

namespace fs = std::filesystem;

const int64_t numMels       = 32;
const int64_t embWindowSize = 76;
const int64_t embFeatures   = 96;

OnnxFeatureBackend::OnnxFeatureBackend(const DetectionConfig& cfg) {
    if (cfg.modelPaths.empty()) {
        throw ScoringFault("No model_paths provided in config", "ERR_SCORER_INIT");
    }

    fs::path featureDir = cfg.featureModelDir.empty()
                              ? fs::path(cfg.modelPaths.front()).parent_path()
                              : fs::path(cfg.featureModelDir);

    try {
        env_ = Ort::Env(ORT_LOGGING_LEVEL_WARNING, "voicelaunch");
        env_.DisableTelemetryEvents();
        memoryInfo_ = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

        // One thread per session
        options_ = Ort::SessionOptions();
        options_.SetIntraOpNumThreads(1);
        options_.SetInterOpNumThreads(1);

        mel_ = loadModel(featureDir / "melspectrogram.onnx");
        LOG_DEBUG("Scorer", "Loaded mel spectrogram model");
        emb_ = loadModel(featureDir / "embedding_model.onnx");
        LOG_DEBUG("Scorer", "Loaded speech embedding model");

        for (const auto& path : cfg.modelPaths) {
            WakeModelInfo info;
            info.label = labelFromModelPath(path);
            Model model = loadModel(path);

            // (1, window, 96); dynamic or missing dims keep the default
            auto shape = model.session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
            if (shape.size() >= 2 && shape[1] > 0) {
                info.windowFeatures = static_cast<size_t>(shape[1]);
            }

            LOG_INFO("Scorer", "Loaded wake word model label=" + info.label +
                               " window=" + std::to_string(info.windowFeatures));
            wakeModels_.push_back(std::move(model));
            info_.push_back(info);
        }
    } catch (const Ort::Exception& e) {
        throw ScoringFault(e.what(), "ERR_SCORER_INIT");
    }
}

OnnxFeatureBackend::Model OnnxFeatureBackend::loadModel(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ScoringFault("Model file not found: " + path.string(), "ERR_SCORER_INIT");
    }

    Model m;
    m.session = std::make_unique<Ort::Session>(env_, path.c_str(), options_);

    Ort::AllocatorWithDefaultOptions allocator;
    m.inputName = m.session->GetInputNameAllocated(0, allocator).get();
    m.outputName = m.session->GetOutputNameAllocated(0, allocator).get();
    return m;
}

std::vector<float> OnnxFeatureBackend::run(Model& m, float* data, size_t count,
                                           const std::vector<int64_t>& shape) {
    try {
        std::vector<Ort::Value> inputTensors;
        inputTensors.push_back(Ort::Value::CreateTensor<float>(
            memoryInfo_, data, count, shape.data(), shape.size()));

        const char* inputNames[] = {m.inputName.c_str()};
        const char* outputNames[] = {m.outputName.c_str()};

        auto outputTensors = m.session->Run(Ort::RunOptions{nullptr}, inputNames,
                                            inputTensors.data(), 1, outputNames, 1);

        const auto& out = outputTensors.front();
        const auto outShape = out.GetTensorTypeAndShapeInfo().GetShape();
        const float* outData = out.GetTensorData<float>();
        size_t outCount = std::accumulate(outShape.begin(), outShape.end(), (int64_t)1,
                                          std::multiplies<>());
        return std::vector<float>(outData, outData + outCount);
    } catch (const Ort::Exception& e) {
        throw ScoringFault(e.what());
    }
}

std::vector<WakeModelInfo> OnnxFeatureBackend::models() const {
    return info_;
}

std::vector<float> OnnxFeatureBackend::melFrames(std::vector<float>& samples) {
    // (1, 1, frames, 32)
    std::vector<int64_t> shape{1, (int64_t)samples.size()};
    return run(mel_, samples.data(), samples.size(), shape);
}

std::vector<float> OnnxFeatureBackend::embed(float* mels) {
    std::vector<int64_t> shape{1, embWindowSize, numMels, 1};
    return run(emb_, mels, embWindowSize * numMels, shape);
}

float OnnxFeatureBackend::classify(size_t index, float* features, size_t windowFeatures) {
    std::vector<int64_t> shape{1, (int64_t)windowFeatures, embFeatures};
    std::vector<float> res = run(wakeModels_.at(index), features, windowFeatures * embFeatures, shape);
    return res.empty() ? 0.0f : res.front();
}

std::unique_ptr<Scorer> makeOpenWakeWordScorer(const DetectionConfig& cfg) {
    return std::make_unique<StreamingScorer>(std::make_unique<OnnxFeatureBackend>(cfg));
}
