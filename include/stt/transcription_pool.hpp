#ifndef TRANSCRIPTION_POOL_HPP
#define TRANSCRIPTION_POOL_HPP

#include "audio/static_audio.hpp"
#include "core/blocking_queue.hpp"
#include "stt/speech_model.hpp"
#include "stt/text_filter.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class JobKind { Chunk, Static };

enum class ResultStatus { Ok, Failed };

struct TranscriptionJob {
    JobKind kind = JobKind::Chunk;
    uint64_t sessionId = 0;     // for Static jobs: the static job id
    uint32_t resetGen = 0;
    uint32_t seq = 0;
    std::string path;
    TranscribeRequest request;
};

struct TranscriptionResult {
    JobKind kind = JobKind::Chunk;
    uint64_t sessionId = 0;
    uint32_t resetGen = 0;
    uint32_t seq = 0;
    std::string path;
    std::string text;
    ResultStatus status = ResultStatus::Ok;
    std::string error;
    int attempts = 0;
};

// Fixed set of worker threads calling the speech model. A failed call is
// retried once with the same audio; a second failure yields ResultStatus::Failed
// with empty text. Unless the model is reentrant, calls are serialized.
// Static jobs are read through the StaticAudioLoader when one is given.
class TranscriptionPool {
public:
    using ResultSink = std::function<void(TranscriptionResult)>;

    static constexpr int kMaxAttempts = 2;

    TranscriptionPool(SpeechModel& model, const TextFilter& filter, int workers, ResultSink sink,
                      const StaticAudioLoader* staticLoader = nullptr);
    ~TranscriptionPool();

    TranscriptionPool(const TranscriptionPool&) = delete;
    TranscriptionPool& operator=(const TranscriptionPool&) = delete;

    void start();

    // Returns false after shutdown().
    bool submit(TranscriptionJob job);

    // Drops jobs not yet picked up by a worker. In-flight calls keep running;
    // their results are matched as stale by the receiver.
    size_t discardQueued();

    // Aborts the static job with this id, queued or in flight. Its result is not delivered.
    void cancelStatic(uint64_t staticId);

    // Drops queued jobs, aborts in-flight model calls and joins the workers.
    // Results of aborted calls are not delivered.
    void shutdown();

    size_t queued() const { return jobs_.size(); }
    int busy() const { return busy_.load(); }
    int workers() const { return workers_; }

private:
    void workerLoop(int id);
    bool cancelled(const TranscriptionJob& job) const;
    TranscriptionResult runJob(const TranscriptionJob& job);
    std::vector<float> loadAudio(const TranscriptionJob& job) const;
    std::string callModel(const std::vector<float>& pcm, const TranscriptionJob& job);

    SpeechModel& model_;
    const TextFilter& filter_;
    int workers_;
    ResultSink sink_;
    const StaticAudioLoader* staticLoader_;

    BlockingQueue<TranscriptionJob> jobs_;
    std::vector<std::thread> threads_;
    std::mutex model_mutex_;

    std::atomic<bool> running_{false};
    std::atomic<bool> abort_{false};
    std::atomic<uint64_t> cancelledStatic_{0};
    std::atomic<int> busy_{0};
};

#endif
