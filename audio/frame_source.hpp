#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "config/config_types.hpp"

// ------------------------------------------------------------
// FrameResult: one full chunk of mono PCM, or a device fault
// ------------------------------------------------------------
struct FrameResult {
    std::vector<std::int16_t> pcm;   // exactly chunk_size samples on success
    bool success = false;
    std::string errorCode;           // ERR_DEVICE_FAULT on failure
    std::string message;
};

/// FrameSource
/// Holds the audio device open for its lifetime. nextFrame() blocks until a
/// full chunk is read and never returns a partial one.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual FrameResult nextFrame() = 0;
};

// Opens a source for an audio config. Throws DeviceFault when it cannot.
using FrameSourceFactory = std::function<std::unique_ptr<FrameSource>(const AudioConfig&)>;
