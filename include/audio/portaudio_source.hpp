#ifndef PORTAUDIO_SOURCE_HPP
#define PORTAUDIO_SOURCE_HPP

#include "audio/audio_source.hpp"

#include <string>
#include <vector>

typedef void PaStream;

class PortAudioSource : public AudioSource {
public:
    struct DeviceInfo {
        int index;
        std::string name;
        int maxInputChannels;
        double defaultSampleRate;
        bool isDefault;
    };

    // deviceIndex < 0 selects the default input device.
    explicit PortAudioSource(int deviceIndex = -1);
    ~PortAudioSource() override;

    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    void open(int sampleRate, int framesPerBuffer) override;
    void read(int16_t* out, size_t frames) override;
    void close() override;
    std::string name() const override { return name_; }

    static std::vector<DeviceInfo> listInputDevices();

private:
    int deviceIndex_;
    std::string name_ = "(closed)";
    PaStream* stream_ = nullptr;
    bool initialized_ = false;
};

#endif
