#include "audio_devices.hpp"
#include "error_manager.hpp"

#include <portaudio.h>
#include <ostream>

bool listAudioDevices(std::vector<AudioDeviceInfo>& out, std::string* err) {
    PaError paErr = Pa_Initialize();
    if (paErr != paNoError) {
        if (err) *err = std::string("PortAudio error: ") + Pa_GetErrorText(paErr);
        return false;
    }

    int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        if (err) *err = "Pa_GetDeviceCount returned " + std::to_string(numDevices);
        Pa_Terminate();
        return false;
    }

    int defaultIn  = Pa_GetDefaultInputDevice();
    int defaultOut = Pa_GetDefaultOutputDevice();

    out.clear();
    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (!deviceInfo) continue;

        const PaHostApiInfo* hostApiInfo = Pa_GetHostApiInfo(deviceInfo->hostApi);

        AudioDeviceInfo d;
        d.index             = i;
        d.name              = deviceInfo->name;
        d.hostApi           = hostApiInfo ? hostApiInfo->name : "unknown";
        d.maxInputChannels  = deviceInfo->maxInputChannels;
        d.maxOutputChannels = deviceInfo->maxOutputChannels;
        d.defaultSampleRate = deviceInfo->defaultSampleRate;
        d.isDefaultInput    = (i == defaultIn);
        d.isDefaultOutput   = (i == defaultOut);
        out.push_back(d);
    }

    Pa_Terminate();
    return true;
}

int printAudioDevices(std::ostream& os) {
    std::vector<AudioDeviceInfo> devices;
    std::string err;
    if (!listAudioDevices(devices, &err)) {
        StageResult r = ErrorManager::report(ErrorKind::ResourceUnavailable, "ERR_AUDIO_DEVICE", err);
        os << ErrorManager::describe(r) << "\n";
        return exitCodeFor(r.kind);
    }

    os << "=== PortAudio Device List ===\n";
    os << "Found " << devices.size() << " devices total\n\n";

    for (const auto& d : devices) {
        os << "Device #" << d.index << ": " << d.name
           << "  (Host API: " << d.hostApi << ")\n";
        os << "  Max input channels : " << d.maxInputChannels << "\n";
        os << "  Max output channels: " << d.maxOutputChannels << "\n";
        os << "  Default sample rate: " << d.defaultSampleRate << "\n";

        if (d.isDefaultInput)
            os << "  *** Default INPUT device ***\n";
        if (d.isDefaultOutput)
            os << "  *** Default OUTPUT device ***\n";

        os << "-------------------------------------------\n\n";
    }
    os << "Set audio.input_device_index in the config to one of the input devices above.\n";
    return 0;
}
