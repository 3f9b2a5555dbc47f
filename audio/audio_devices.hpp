#pragma once
#include <ostream>
#include <string>
#include <vector>

struct InputDeviceInfo {
    int index = -1;
    std::string name;
    std::string hostApi;
    int maxInputChannels = 0;
    double defaultSampleRate = 0.0;
    double defaultLowInputLatency = 0.0;
    bool isDefault = false;
};

// Devices with at least one input channel. Throws DeviceFault if PortAudio
// cannot be initialised.
std::vector<InputDeviceInfo> listInputDevices();

// --list-devices output; the index is what [audio] device_index expects
void printInputDevices(std::ostream& out, const std::vector<InputDeviceInfo>& devices);
