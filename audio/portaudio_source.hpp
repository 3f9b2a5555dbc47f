#pragma once
#include <cstdint>
#include <vector>

#include "audio/frame_source.hpp"

typedef void PaStream;

/// PortAudioSource
/// Blocking int16 input stream. Constructor initialises PortAudio and opens
/// and starts the stream (throws DeviceFault on any failure); the destructor
/// stops, closes and terminates.
class PortAudioSource : public FrameSource {
public:
    explicit PortAudioSource(const AudioConfig& cfg);
    ~PortAudioSource() override;

    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    FrameResult nextFrame() override;

private:
    void release();

    AudioConfig cfg_;
    PaStream* stream_ = nullptr;
    bool initialized_ = false;
    std::vector<std::int16_t> interleaved_;
};

// Factory for DaemonLoop reloads
std::unique_ptr<FrameSource> makePortAudioSource(const AudioConfig& cfg);
