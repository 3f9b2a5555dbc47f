#include "audio/audio_devices.hpp"
#include "faults.hpp"

#include <portaudio.h>

std::vector<InputDeviceInfo> listInputDevices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw DeviceFault(std::string("Pa_Initialize: ") + Pa_GetErrorText(err), "ERR_DEVICE_OPEN");
    }

    int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        std::string msg = std::string("Pa_GetDeviceCount: ") + Pa_GetErrorText(numDevices);
        Pa_Terminate();
        throw DeviceFault(msg, "ERR_DEVICE_OPEN");
    }

    std::vector<InputDeviceInfo> devices;
    const int defaultInput = Pa_GetDefaultInputDevice();

    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (!deviceInfo || deviceInfo->maxInputChannels <= 0) continue;

        const PaHostApiInfo* hostApiInfo = Pa_GetHostApiInfo(deviceInfo->hostApi);

        InputDeviceInfo info;
        info.index = i;
        info.name = deviceInfo->name;
        info.hostApi = hostApiInfo ? hostApiInfo->name : "?";
        info.maxInputChannels = deviceInfo->maxInputChannels;
        info.defaultSampleRate = deviceInfo->defaultSampleRate;
        info.defaultLowInputLatency = deviceInfo->defaultLowInputLatency;
        info.isDefault = (i == defaultInput);
        devices.push_back(info);
    }

    Pa_Terminate();
    return devices;
}

void printInputDevices(std::ostream& out, const std::vector<InputDeviceInfo>& devices) {
    out << "=== PortAudio Input Devices ===\n";
    out << "Found " << devices.size() << " input devices\n\n";

    for (const auto& d : devices) {
        out << "Device #" << d.index << ": " << d.name
            << "  (Host API: " << d.hostApi << ")\n";
        out << "  Max input channels : " << d.maxInputChannels << "\n";
        out << "  Default sample rate: " << d.defaultSampleRate << "\n";
        out << "  Input latency      : " << d.defaultLowInputLatency << " sec\n";
        if (d.isDefault)
            out << "  *** Default INPUT device ***\n";
        out << "-------------------------------------------\n\n";
    }
}
