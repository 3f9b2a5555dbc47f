#include "audio/portaudio_source.hpp"
#include "faults.hpp"
#include "logger.hpp"

#include <portaudio.h>
#include <string>

static std::string paError(const char* what, PaError err) {
    return std::string(what) + ": " + Pa_GetErrorText(err);
}

PortAudioSource::PortAudioSource(const AudioConfig& cfg) : cfg_(cfg) {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw DeviceFault(paError("Pa_Initialize", err), "ERR_DEVICE_OPEN");
    }
    initialized_ = true;

    int deviceIndex = (cfg_.deviceIndex >= 0) ? cfg_.deviceIndex : Pa_GetDefaultInputDevice();
    if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        release();
        throw DeviceFault("No valid input device (index " + std::to_string(cfg_.deviceIndex) + ")",
                          "ERR_DEVICE_OPEN");
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);

    PaStreamParameters inputParams;
    inputParams.device = deviceIndex;
    inputParams.channelCount = cfg_.channels;
    inputParams.sampleFormat = paInt16;
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    // No callback: blocking reads of exactly chunk_size frames
    err = Pa_OpenStream(&stream_,
                        &inputParams,
                        nullptr,
                        cfg_.sampleRate,
                        static_cast<unsigned long>(cfg_.chunkSize),
                        paNoFlag,
                        nullptr,
                        nullptr);
    if (err != paNoError || !stream_) {
        stream_ = nullptr;
        release();
        throw DeviceFault(paError("Pa_OpenStream", err), "ERR_DEVICE_OPEN");
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        release();
        throw DeviceFault(paError("Pa_StartStream", err), "ERR_DEVICE_OPEN");
    }

    interleaved_.resize(static_cast<size_t>(cfg_.chunkSize) * cfg_.channels);

    LOG_INFO("Audio", std::string("Opened input device='") + devInfo->name +
                      "' sample_rate=" + std::to_string(cfg_.sampleRate) +
                      " channels=" + std::to_string(cfg_.channels) +
                      " chunk_size=" + std::to_string(cfg_.chunkSize));
}

PortAudioSource::~PortAudioSource() {
    release();
}

void PortAudioSource::release() {
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        LOG_DEBUG("Audio", "Input stream closed");
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
}

FrameResult PortAudioSource::nextFrame() {
    FrameResult result;

    PaError err = Pa_ReadStream(stream_, interleaved_.data(),
                                static_cast<unsigned long>(cfg_.chunkSize));
    if (err == paInputOverflowed) {
        // Samples were dropped before this chunk, the chunk itself is complete
        LOG_DEBUG("Audio", "Input overflow");
    } else if (err != paNoError) {
        result.success = false;
        result.errorCode = "ERR_DEVICE_FAULT";
        result.message = paError("Pa_ReadStream", err);
        return result;
    }

    result.pcm.resize(static_cast<size_t>(cfg_.chunkSize));
    if (cfg_.channels == 1) {
        result.pcm.assign(interleaved_.begin(), interleaved_.end());
    } else {
        // Downmix to mono
        for (int i = 0; i < cfg_.chunkSize; i++) {
            int sum = 0;
            for (int ch = 0; ch < cfg_.channels; ch++) {
                sum += interleaved_[static_cast<size_t>(i) * cfg_.channels + ch];
            }
            result.pcm[i] = static_cast<std::int16_t>(sum / cfg_.channels);
        }
    }

    result.success = true;
    return result;
}

std::unique_ptr<FrameSource> makePortAudioSource(const AudioConfig& cfg) {
    return std::make_unique<PortAudioSource>(cfg);
}
