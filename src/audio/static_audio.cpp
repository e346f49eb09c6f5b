#include "audio/static_audio.hpp"
#include "audio/wav_file.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

static std::string shellQuote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    return out + "'";
}

static void replaceAll(std::string& s, const std::string& what, const std::string& with) {
    for (size_t pos = s.find(what); pos != std::string::npos; pos = s.find(what, pos + with.size())) {
        s.replace(pos, what.size(), with);
    }
}

std::string expandConvertCommand(const std::string& tmpl, const std::string& input, const std::string& output) {
    std::string cmd = tmpl;
    replaceAll(cmd, "{input}", shellQuote(input));
    replaceAll(cmd, "{output}", shellQuote(output));
    return cmd;
}

std::vector<float> stripSilence(const std::vector<float>& pcm16kMono, const Chunker::Config& config) {
    Chunker chunker(config);
    std::vector<float> out;

    auto keep = [&out](const SealedAudio& s) {
        for (int16_t v : s.samples) out.push_back((float)v / 32768.0f);
    };

    const size_t block = 1024;
    std::vector<int16_t> buff(block);
    for (size_t off = 0; off < pcm16kMono.size(); off += block) {
        const size_t n = std::min(block, pcm16kMono.size() - off);
        for (size_t i = 0; i < n; ++i) {
            const float v = std::max(-1.0f, std::min(1.0f, pcm16kMono[off + i]));
            buff[i] = (int16_t)std::lround(v * 32767.0f);
        }
        for (const auto& s : chunker.feed(buff.data(), n)) keep(s);
    }

    SealedAudio last;
    if (chunker.sealOpen(last)) keep(last);
    return out;
}

// Constructor
StaticAudioLoader::StaticAudioLoader(std::string convertCommand, std::string workDir, Chunker::Config silence)
    : convertCommand_(std::move(convertCommand)), workDir_(std::move(workDir)), silence_(silence) {}

bool StaticAudioLoader::needsConversion(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return ext != ".wav";
}

// Runs the converter into the work directory and returns the produced WAV
std::string StaticAudioLoader::convert(const std::string& input, uint64_t jobId) const {
    if (convertCommand_.empty()) throw StorageError("no convert_command configured for " + input);

    const std::string output = (fs::path(workDir_) / ("static" + std::to_string(jobId) + ".wav")).string();
    const std::string cmd = expandConvertCommand(convertCommand_, input, output);

    logInfo("Static Audio", "Converting " + input);
    logDebug("Static Audio", cmd);

    const int rc = std::system(cmd.c_str());
    if (rc != 0 || !fs::is_regular_file(output)) {
        throw StorageError("'" + cmd + "' failed (exit " + std::to_string(rc) + ")");
    }
    return output;
}

// Decodes (after conversion if needed) and drops silences
std::vector<float> StaticAudioLoader::load(const std::string& path, uint64_t jobId) const {
    std::vector<float> pcm;

    if (needsConversion(path)) {
        const std::string wav = convert(path, jobId);
        try {
            pcm = readWavMono16k(wav);
        } catch (const StorageError&) {
            std::error_code ec;
            fs::remove(wav, ec);
            throw;
        }
        std::error_code ec;
        fs::remove(wav, ec);
    } else {
        pcm = readWavMono16k(path);
    }

    const size_t before = pcm.size();
    pcm = stripSilence(pcm, silence_);
    logInfo("Static Audio", "Kept " + std::to_string(pcm.size() / 16) + " ms of " +
            std::to_string(before / 16) + " ms after dropping silence");
    return pcm;
}
