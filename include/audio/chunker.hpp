#ifndef CHUNKER_HPP
#define CHUNKER_HPP

#include "core/config.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class BoundaryReason { Silence, MaxDuration, ForcedStop };

const char* toString(BoundaryReason reason);

// Audio of one sealed chunk. Sample offsets are relative to the first sample
// fed after the last restart().
struct SealedAudio {
    uint32_t seq = 0;
    uint64_t startSample = 0;
    uint64_t endSample = 0;
    BoundaryReason reason = BoundaryReason::ForcedStop;
    std::vector<int16_t> samples;
};

// Cuts a continuous PCM16 stream into chunks. Not thread-safe; driven by the
// capture thread only.
//
// A chunk is sealed by whichever trigger fires first:
//  - Silence: after voiced audio, energy stays below threshold for minSilenceMs.
//    The chunk ends at the silence onset and the silence becomes lead-in of the next one.
//  - MaxDuration: the chunk span reaches splitIntervalMs, cut to the exact sample.
//  - ForcedStop: sealOpen() on stop.
// Audio before the first voiced block is kept as lead-in, bounded by maxLeadInMs.
class Chunker {
public:
    struct Config {
        int sampleRate = 16000;
        EnergyMeasure measure = EnergyMeasure::Peak;
        float threshold = 500.0f;
        int minSilenceMs = 1500;
        int maxLeadInMs = 1500;
        int splitIntervalMs = 60000;
    };

    static Config fromConfig(const ::Config& config, bool realtime);

    explicit Chunker(Config config);

    // Feeds one block; returns the chunks sealed by it (usually none).
    std::vector<SealedAudio> feed(const int16_t* samples, size_t frames);

    // Seals the open chunk as ForcedStop. Returns false (and drops the buffer)
    // when the open chunk never contained voiced audio.
    bool sealOpen(SealedAudio& out);

    // Drops the open chunk and restarts seq and the sample clock at 0.
    void restart();

    // Takes effect for the open chunk at the next feed().
    void setConfig(Config config);
    const Config& config() const { return config_; }

    uint32_t nextSeq() const { return nextSeq_; }
    uint64_t samplesSeen() const { return totalSamples_; }
    size_t openSamples() const { return buffer_.size(); }
    bool openVoiced() const { return voiced_; }

    float energy(const int16_t* x, size_t n) const;

private:
    Config config_;

    size_t minSilenceSamples_ = 0;
    size_t maxLeadInSamples_ = 0;
    size_t splitSamples_ = 0;

    std::vector<int16_t> buffer_;
    uint64_t chunkStart_ = 0;
    uint64_t totalSamples_ = 0;
    uint32_t nextSeq_ = 0;

    bool voiced_ = false;
    size_t silenceRun_ = 0;
    size_t silenceOnset_ = 0;

    void recompute();
    void append(const int16_t* x, size_t n, bool silent, std::vector<SealedAudio>& sealed);
    void trimLeadIn();
    void sealAt(size_t cut, BoundaryReason reason, std::vector<SealedAudio>& sealed);
};

#endif
