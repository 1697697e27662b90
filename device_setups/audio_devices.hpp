#pragma once
#include <string>
#include <vector>

struct AudioDeviceInfo {
    int index = -1;
    std::string name;
    std::string hostApi;
    int maxInputChannels = 0;
    int maxOutputChannels = 0;
    double defaultSampleRate = 0.0;
    bool isDefaultInput = false;
    bool isDefaultOutput = false;
};

// Enumerate every PortAudio device. Empty if PortAudio cannot start.
std::vector<AudioDeviceInfo> listAudioDevices();

// One line per device, default devices marked.
std::string formatAudioDevices(const std::vector<AudioDeviceInfo>& devices);
