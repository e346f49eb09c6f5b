#include "audio/wav_file.hpp"
#include "core/errors.hpp"

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

#include <algorithm>
#include <cmath>
#include <string>

void writeWavPcm16(const std::string& path, const std::vector<int16_t>& samples, int sampleRate) {
    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_PCM;
    format.channels = 1;
    format.sampleRate = (drwav_uint32)sampleRate;
    format.bitsPerSample = 16;

    drwav wav;
    if (!drwav_init_file_write(&wav, path.c_str(), &format, nullptr)) {
        throw StorageError("drwav_init_file_write failed: " + path);
    }

    const drwav_uint64 written = drwav_write_pcm_frames(&wav, samples.size(), samples.data());
    drwav_uninit(&wav);

    if (written != samples.size()) {
        throw StorageError("short write (" + std::to_string(written) + "/" +
                           std::to_string(samples.size()) + " frames): " + path);
    }
}

std::vector<float> resampleLinear(const std::vector<float>& in, int fromRate, int toRate) {
    if (fromRate == toRate || in.empty()) return in;

    const double ratio = (double)fromRate / (double)toRate;
    const size_t outLen = (size_t)std::floor((double)in.size() / ratio);

    std::vector<float> out(outLen);
    for (size_t i = 0; i < outLen; ++i) {
        const double pos = (double)i * ratio;
        const size_t i0 = (size_t)pos;
        const size_t i1 = std::min(i0 + 1, in.size() - 1);
        const double frac = pos - (double)i0;
        out[i] = (float)((1.0 - frac) * in[i0] + frac * in[i1]);
    }
    return out;
}

std::vector<float> readWavMono16k(const std::string& path) {
    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        throw StorageError("drwav_init_file failed: " + path);
    }

    const unsigned channels = wav.channels;
    const int rate = (int)wav.sampleRate;
    const drwav_uint64 frames = wav.totalPCMFrameCount;

    std::vector<float> interleaved((size_t)frames * channels);
    const drwav_uint64 got = drwav_read_pcm_frames_f32(&wav, frames, interleaved.data());
    drwav_uninit(&wav);

    if (channels == 0 || rate <= 0) throw StorageError("invalid WAV header: " + path);

    std::vector<float> mono((size_t)got);
    for (size_t i = 0; i < mono.size(); ++i) {
        float acc = 0.0f;
        for (unsigned c = 0; c < channels; ++c) acc += interleaved[i * channels + c];
        mono[i] = acc / (float)channels;
    }

    return resampleLinear(mono, rate, 16000);
}
