#ifndef WAV_FILE_HPP
#define WAV_FILE_HPP

#include <cstdint>
#include <string>
#include <vector>

// Writes mono PCM16 to a RIFF/WAV file. Throws StorageError.
void writeWavPcm16(const std::string& path, const std::vector<int16_t>& samples, int sampleRate);

// Reads any PCM/float WAV file and returns it as 16 kHz mono float in [-1, 1]
// (channels averaged, linear resampling when the file rate differs). Throws StorageError.
std::vector<float> readWavMono16k(const std::string& path);

// Linear-interpolation resampler used by readWavMono16k.
std::vector<float> resampleLinear(const std::vector<float>& in, int fromRate, int toRate);

#endif
