#ifndef CAPTURE_LOOP_HPP
#define CAPTURE_LOOP_HPP

#include "audio/audio_source.hpp"
#include "audio/chunk_store.hpp"
#include "audio/chunker.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

struct CaptureEvent {
    enum class Kind { ChunkSealed, DeviceFailed, Finished };

    Kind kind = Kind::Finished;
    uint64_t sessionId = 0;
    uint32_t resetGen = 0;

    // ChunkSealed
    uint32_t seq = 0;
    double startSec = 0.0;
    double endSec = 0.0;
    BoundaryReason reason = BoundaryReason::ForcedStop;
    std::string path;          // empty when the temp file could not be written
    std::string error;         // StorageError / DeviceError text
};

// The capture thread: reads the device, runs the chunker and persists sealed
// chunks. It never touches session state; everything it learns is posted as a
// CaptureEvent through the sink.
class CaptureLoop {
public:
    using EventSink = std::function<void(CaptureEvent)>;

    CaptureLoop(AudioSource& source, ChunkStore& store, EventSink sink);
    ~CaptureLoop();

    CaptureLoop(const CaptureLoop&) = delete;
    CaptureLoop& operator=(const CaptureLoop&) = delete;

    // Opens the device on the calling thread (throws DeviceError) and starts capturing.
    void start(uint64_t sessionId, Chunker::Config config, int framesPerBuffer);

    // Seals the open chunk as FORCED_STOP, posts Finished and joins the thread.
    // Returns after at most one device read.
    void stop();

    // Drops the open chunk and restarts seq at 0 under the new reset generation.
    // Applied by the capture thread before it feeds its next block.
    void requestReset(uint32_t resetGen);

    // Chunker profile switch, applied before the next block.
    void setChunkerConfig(Chunker::Config config);

    bool running() const { return running_.load(); }

private:
    void run(uint64_t sessionId, int framesPerBuffer);
    void applyPending(Chunker& chunker, uint32_t& gen);
    void persist(uint64_t sessionId, uint32_t gen, SealedAudio& sealed, int sampleRate);

    AudioSource& source_;
    ChunkStore& store_;
    EventSink sink_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint32_t> requestedGen_{0};

    std::mutex config_mutex_;
    Chunker::Config config_;
    bool configChanged_ = false;
};

#endif
