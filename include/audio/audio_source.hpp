#ifndef AUDIO_SOURCE_HPP
#define AUDIO_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <string>

// Blocking PCM16 mono input. Owned exclusively by the capture thread while a
// session is recording. Implementations throw DeviceError on failure.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual void open(int sampleRate, int framesPerBuffer) = 0;

    // Fills exactly `frames` samples, blocking until they are available.
    virtual void read(int16_t* out, size_t frames) = 0;

    virtual void close() = 0;

    virtual std::string name() const = 0;
};

#endif
