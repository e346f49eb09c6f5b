#include "audio/capture_loop.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <utility>
#include <vector>

// Constructor
CaptureLoop::CaptureLoop(AudioSource& source, ChunkStore& store, EventSink sink)
    : source_(source), store_(store), sink_(std::move(sink)) {}

// Destructor
CaptureLoop::~CaptureLoop() { stop(); }

void CaptureLoop::start(uint64_t sessionId, Chunker::Config config, int framesPerBuffer) {
    if (running_.load()) return;
    if (thread_.joinable()) thread_.join();

    source_.open(config.sampleRate, framesPerBuffer);
    logInfo("Capture", "Recording from " + source_.name());

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = config;
        configChanged_ = false;
    }
    requestedGen_.store(0);
    running_.store(true);
    thread_ = std::thread(&CaptureLoop::run, this, sessionId, framesPerBuffer);
}

void CaptureLoop::stop() {
    running_.store(false);
    if (thread_.joinable()) thread_.join();
}

void CaptureLoop::requestReset(uint32_t resetGen) { requestedGen_.store(resetGen); }

void CaptureLoop::setChunkerConfig(Chunker::Config config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
    configChanged_ = true;
}

void CaptureLoop::applyPending(Chunker& chunker, uint32_t& gen) {
    const uint32_t wanted = requestedGen_.load();
    if (wanted != gen) {
        chunker.restart();
        gen = wanted;
        logDebug("Capture", "restarted chunk sequence, generation " + std::to_string(gen));
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    if (configChanged_) {
        chunker.setConfig(config_);
        configChanged_ = false;
    }
}

void CaptureLoop::persist(uint64_t sessionId, uint32_t gen, SealedAudio& sealed, int sampleRate) {
    CaptureEvent ev;
    ev.kind = CaptureEvent::Kind::ChunkSealed;
    ev.sessionId = sessionId;
    ev.resetGen = gen;
    ev.seq = sealed.seq;
    ev.startSec = (double)sealed.startSample / sampleRate;
    ev.endSec = (double)sealed.endSample / sampleRate;
    ev.reason = sealed.reason;

    try {
        ev.path = store_.write(sessionId, gen, sealed.seq, sealed.samples);
    } catch (const StorageError& e) {
        ev.error = e.what();
    }

    sink_(std::move(ev));
}

// Capture thread body
void CaptureLoop::run(uint64_t sessionId, int framesPerBuffer) {
    Chunker::Config initial;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        initial = config_;
    }
    Chunker chunker(initial);
    const int sampleRate = initial.sampleRate;
    uint32_t gen = 0;

    std::vector<int16_t> buff((size_t)framesPerBuffer);
    bool deviceOk = true;

    try {
        while (running_.load()) {
            source_.read(buff.data(), buff.size());

            applyPending(chunker, gen);

            for (auto& sealed : chunker.feed(buff.data(), buff.size())) {
                persist(sessionId, gen, sealed, sampleRate);
            }
        }
    } catch (const DeviceError& e) {
        deviceOk = false;
        CaptureEvent ev;
        ev.kind = CaptureEvent::Kind::DeviceFailed;
        ev.sessionId = sessionId;
        ev.resetGen = gen;
        ev.error = e.what();
        sink_(std::move(ev));
    }

    if (deviceOk) {
        applyPending(chunker, gen);
        SealedAudio last;
        if (chunker.sealOpen(last)) persist(sessionId, gen, last, sampleRate);
    }

    source_.close();
    running_.store(false);

    CaptureEvent done;
    done.kind = CaptureEvent::Kind::Finished;
    done.sessionId = sessionId;
    done.resetGen = gen;
    sink_(std::move(done));
}
