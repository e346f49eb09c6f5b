#include "audio/chunker.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

const char* toString(BoundaryReason reason) {
    switch (reason) {
    case BoundaryReason::Silence: return "SILENCE";
    case BoundaryReason::MaxDuration: return "MAX_DURATION";
    case BoundaryReason::ForcedStop: return "FORCED_STOP";
    }
    return "UNKNOWN";
}

static size_t msToSamples(int ms, int sampleRate) {
    if (ms <= 0) return 0;
    return (size_t)(((int64_t)ms * sampleRate) / 1000);
}

Chunker::Config Chunker::fromConfig(const ::Config& config, bool realtime) {
    Config c;
    c.sampleRate = config.audio.sampleRate;
    c.measure = config.chunking.measure;
    c.threshold = config.chunking.threshold;
    if (realtime) {
        c.minSilenceMs = config.realtime.minSilenceMs;
        c.maxLeadInMs = config.realtime.maxLeadInMs;
        c.splitIntervalMs = config.realtime.splitIntervalMs;
    } else {
        c.minSilenceMs = config.chunking.minSilenceMs;
        c.maxLeadInMs = config.chunking.maxLeadInMs;
        c.splitIntervalMs = config.chunking.splitIntervalMs;
    }
    return c;
}

// Constructor
Chunker::Chunker(Config config) : config_(config) {
    recompute();
    buffer_.reserve(splitSamples_);
}

void Chunker::recompute() {
    splitSamples_ = std::max<size_t>(1, msToSamples(config_.splitIntervalMs, config_.sampleRate));
    minSilenceSamples_ = std::max<size_t>(1, msToSamples(config_.minSilenceMs, config_.sampleRate));
    maxLeadInSamples_ = msToSamples(config_.maxLeadInMs, config_.sampleRate);
    // Lead-in must stay below the split length or silence alone could fill a chunk.
    if (maxLeadInSamples_ >= splitSamples_) maxLeadInSamples_ = splitSamples_ / 2;
}

void Chunker::setConfig(Config config) {
    config_ = config;
    recompute();
}

void Chunker::restart() {
    buffer_.clear();
    chunkStart_ = 0;
    totalSamples_ = 0;
    nextSeq_ = 0;
    voiced_ = false;
    silenceRun_ = 0;
    silenceOnset_ = 0;
}

float Chunker::energy(const int16_t* x, size_t n) const {
    if (n == 0) return 0.0f;

    if (config_.measure == EnergyMeasure::Peak) {
        int peak = 0;
        for (size_t i = 0; i < n; ++i) peak = std::max(peak, std::abs((int)x[i]));
        return (float)peak;
    }

    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) acc += (double)x[i] * (double)x[i];
    acc /= (double)n;
    return (float)std::sqrt(acc);
}

void Chunker::trimLeadIn() {
    if (buffer_.size() <= maxLeadInSamples_) return;
    const size_t extra = buffer_.size() - maxLeadInSamples_;
    buffer_.erase(buffer_.begin(), buffer_.begin() + extra);
    chunkStart_ += extra;
}

void Chunker::sealAt(size_t cut, BoundaryReason reason, std::vector<SealedAudio>& sealed) {
    SealedAudio s;
    s.seq = nextSeq_++;
    s.startSample = chunkStart_;
    s.endSample = chunkStart_ + cut;
    s.reason = reason;
    s.samples.assign(buffer_.begin(), buffer_.begin() + cut);

    buffer_.erase(buffer_.begin(), buffer_.begin() + cut);
    chunkStart_ += cut;

    // Only a MaxDuration cut inside the buffer (after a profile switch) leaves voiced audio behind.
    voiced_ = reason == BoundaryReason::MaxDuration && !buffer_.empty();
    silenceRun_ = 0;
    silenceOnset_ = 0;
    if (!voiced_) trimLeadIn();

    sealed.push_back(std::move(s));
}

void Chunker::append(const int16_t* x, size_t n, bool silent, std::vector<SealedAudio>& sealed) {
    buffer_.insert(buffer_.end(), x, x + n);
    totalSamples_ += n;

    if (!silent) {
        voiced_ = true;
        silenceRun_ = 0;
        return;
    }

    if (!voiced_) {
        trimLeadIn();
        return;
    }

    if (silenceRun_ == 0) silenceOnset_ = buffer_.size() - n;
    silenceRun_ += n;

    if (silenceRun_ >= minSilenceSamples_ && silenceOnset_ > 0) {
        sealAt(silenceOnset_, BoundaryReason::Silence, sealed);
    }
}

std::vector<SealedAudio> Chunker::feed(const int16_t* samples, size_t frames) {
    std::vector<SealedAudio> sealed;

    // A profile switch may have shortened the limits under an open chunk.
    if (!voiced_) trimLeadIn();
    while (voiced_ && buffer_.size() >= splitSamples_) {
        sealAt(splitSamples_, BoundaryReason::MaxDuration, sealed);
    }

    if (frames == 0) return sealed;

    const bool silent = energy(samples, frames) < config_.threshold;

    size_t offset = 0;
    while (offset < frames) {
        const size_t room = splitSamples_ - buffer_.size();
        const size_t take = std::min(room, frames - offset);

        append(samples + offset, take, silent, sealed);
        offset += take;

        if (buffer_.size() >= splitSamples_) {
            if (voiced_) sealAt(buffer_.size(), BoundaryReason::MaxDuration, sealed);
            else trimLeadIn();
        }
    }

    return sealed;
}

bool Chunker::sealOpen(SealedAudio& out) {
    const bool keep = voiced_ && !buffer_.empty();

    if (keep) {
        std::vector<SealedAudio> sealed;
        sealAt(buffer_.size(), BoundaryReason::ForcedStop, sealed);
        out = std::move(sealed.front());
    } else {
        chunkStart_ += buffer_.size();
        buffer_.clear();
        voiced_ = false;
        silenceRun_ = 0;
        silenceOnset_ = 0;
    }

    return keep;
}
