#include "device_setups/audio_devices.hpp"
#include "logger.hpp"

#include <portaudio.h>
#include <sstream>

std::vector<AudioDeviceInfo> listAudioDevices() {
    std::vector<AudioDeviceInfo> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        LOG_ERROR("Audio", std::string("PortAudio error: ") + Pa_GetErrorText(err));
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        LOG_ERROR("Audio", "Pa_GetDeviceCount returned " + std::to_string(numDevices));
        Pa_Terminate();
        return devices;
    }

    const int defaultIn = Pa_GetDefaultInputDevice();
    const int defaultOut = Pa_GetDefaultOutputDevice();

    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (!deviceInfo) continue;

        const PaHostApiInfo* hostApiInfo = Pa_GetHostApiInfo(deviceInfo->hostApi);

        AudioDeviceInfo info;
        info.index = i;
        info.name = deviceInfo->name ? deviceInfo->name : "";
        info.hostApi = (hostApiInfo && hostApiInfo->name) ? hostApiInfo->name : "?";
        info.maxInputChannels = deviceInfo->maxInputChannels;
        info.maxOutputChannels = deviceInfo->maxOutputChannels;
        info.defaultSampleRate = deviceInfo->defaultSampleRate;
        info.isDefaultInput = (i == defaultIn);
        info.isDefaultOutput = (i == defaultOut);
        devices.push_back(std::move(info));
    }

    Pa_Terminate();
    LOG_DEBUG("Audio", "Found " + std::to_string(devices.size()) + " devices");
    return devices;
}

std::string formatAudioDevices(const std::vector<AudioDeviceInfo>& devices) {
    if (devices.empty()) return "[Audio] No devices found";

    std::ostringstream out;
    out << "[Audio] " << devices.size() << " device(s)\n";
    for (const auto& d : devices) {
        out << "  #" << d.index << ": " << d.name << "  (" << d.hostApi << ")"
            << "  in=" << d.maxInputChannels
            << " out=" << d.maxOutputChannels
            << " rate=" << d.defaultSampleRate;
        if (d.isDefaultInput)  out << "  [default input]";
        if (d.isDefaultOutput) out << "  [default output]";
        out << "\n";
    }
    return out.str();
}
