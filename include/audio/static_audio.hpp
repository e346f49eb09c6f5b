#ifndef STATIC_AUDIO_HPP
#define STATIC_AUDIO_HPP

#include "audio/chunker.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Prepares an existing recording for transcription. Anything that is not a
// .wav file is first converted to 16 kHz mono PCM16 by an external command
// (ffmpeg by default); long silences are then dropped.
class StaticAudioLoader {
public:
    // convertCommand may use {input} and {output}; both are substituted quoted.
    StaticAudioLoader(std::string convertCommand, std::string workDir, Chunker::Config silence);

    // Throws StorageError when the file cannot be converted or decoded.
    std::vector<float> load(const std::string& path, uint64_t jobId) const;

    static bool needsConversion(const std::string& path);

private:
    std::string convert(const std::string& input, uint64_t jobId) const;

    std::string convertCommand_;
    std::string workDir_;
    Chunker::Config silence_;
};

// Substitutes {input} and {output} with shell-quoted paths.
std::string expandConvertCommand(const std::string& tmpl, const std::string& input, const std::string& output);

// Runs the chunker over the audio and keeps only the voiced chunks, so every
// silence is cut down to the chunker's lead-in.
std::vector<float> stripSilence(const std::vector<float>& pcm16kMono, const Chunker::Config& config);

#endif
