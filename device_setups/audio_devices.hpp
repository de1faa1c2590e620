#pragma once
#include <iosfwd>
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

// Enumerate PortAudio devices. Returns false (and fills 'err') if PortAudio
// cannot be initialized.
bool listAudioDevices(std::vector<AudioDeviceInfo>& out, std::string* err = nullptr);

// Print the device list so the user can pick audio.input_device_index.
// Returns the process exit status.
int printAudioDevices(std::ostream& os);
