#include "audio/portaudio_source.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <portaudio.h>
#include <string>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw DeviceError(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

// Constructor
PortAudioSource::PortAudioSource(int deviceIndex) : deviceIndex_(deviceIndex) {}

// Destructor
PortAudioSource::~PortAudioSource() { close(); }

// Opens and starts a blocking mono int16 input stream
void PortAudioSource::open(int sampleRate, int framesPerBuffer) {
    if (stream_) return;

    pa_check(Pa_Initialize(), "Pa_Initialize");
    initialized_ = true;

    PaStreamParameters inParams{};
    inParams.device = deviceIndex_ < 0 ? Pa_GetDefaultInputDevice() : (PaDeviceIndex)deviceIndex_;
    if (inParams.device == paNoDevice || inParams.device >= Pa_GetDeviceCount()) {
        close();
        throw DeviceError("No usable input device (index " + std::to_string(deviceIndex_) + ")");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
    name_ = info ? info->name : "(unknown)";

    inParams.channelCount = 1;
    inParams.sampleFormat = paInt16;
    inParams.suggestedLatency = info ? info->defaultHighInputLatency : 0.1;
    inParams.hostApiSpecificStreamInfo = nullptr;

    try {
        pa_check(
            Pa_OpenStream(&stream_, &inParams, nullptr,
                          sampleRate, framesPerBuffer,
                          paNoFlag, nullptr, nullptr),
            "Pa_OpenStream"
        );
        pa_check(Pa_StartStream(stream_), "Pa_StartStream");
    } catch (const DeviceError&) {
        close();
        throw;
    }

    logDebug("Audio", "stream open: " + std::to_string(sampleRate) + " Hz, " +
             std::to_string(framesPerBuffer) + " frames per buffer");
}

void PortAudioSource::read(int16_t* out, size_t frames) {
    if (!stream_) throw DeviceError("read on closed input stream");

    PaError e = Pa_ReadStream(stream_, out, (unsigned long)frames);
    if (e == paInputOverflowed) {
        logDebug("Audio", "input overflowed");
        return;
    }
    pa_check(e, "Pa_ReadStream");
}

void PortAudioSource::close() {
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
    name_ = "(closed)";
}

std::vector<PortAudioSource::DeviceInfo> PortAudioSource::listInputDevices() {
    pa_check(Pa_Initialize(), "Pa_Initialize");

    std::vector<DeviceInfo> out;
    const PaDeviceIndex def = Pa_GetDefaultInputDevice();
    const int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;
        out.push_back({i, info->name, info->maxInputChannels, info->defaultSampleRate, i == def});
    }

    Pa_Terminate();
    return out;
}
