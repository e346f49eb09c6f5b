#include "stt/transcription_pool.hpp"
#include "audio/wav_file.hpp"
#include "core/log.hpp"

#include <exception>
#include <utility>

// Constructor
TranscriptionPool::TranscriptionPool(SpeechModel& model, const TextFilter& filter, int workers, ResultSink sink,
                                     const StaticAudioLoader* staticLoader)
    : model_(model), filter_(filter), workers_(workers < 1 ? 1 : workers), sink_(std::move(sink)),
      staticLoader_(staticLoader) {}

// Destructor
TranscriptionPool::~TranscriptionPool() { shutdown(); }

void TranscriptionPool::start() {
    if (running_.exchange(true)) return;
    for (int i = 0; i < workers_; ++i) {
        threads_.emplace_back(&TranscriptionPool::workerLoop, this, i);
    }
}

bool TranscriptionPool::submit(TranscriptionJob job) {
    if (abort_.load()) return false;
    return jobs_.push(std::move(job));
}

size_t TranscriptionPool::discardQueued() { return jobs_.clear(); }

void TranscriptionPool::cancelStatic(uint64_t staticId) { cancelledStatic_.store(staticId); }

// True once the job's result is no longer wanted
bool TranscriptionPool::cancelled(const TranscriptionJob& job) const {
    if (abort_.load()) return true;
    return job.kind == JobKind::Static && cancelledStatic_.load() == job.sessionId;
}

void TranscriptionPool::shutdown() {
    abort_.store(true);
    const size_t dropped = jobs_.clear();
    jobs_.close();

    if (dropped > 0) logInfo("Transcription", "discarded " + std::to_string(dropped) + " queued job(s)");

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    running_.store(false);
}

// Reads the job's audio; static files go through the loader (conversion, silence removal)
std::vector<float> TranscriptionPool::loadAudio(const TranscriptionJob& job) const {
    if (job.kind == JobKind::Static && staticLoader_) return staticLoader_->load(job.path, job.sessionId);
    return readWavMono16k(job.path);
}

// Calls the model, serialized unless it is reentrant
std::string TranscriptionPool::callModel(const std::vector<float>& pcm, const TranscriptionJob& job) {
    const AbortCheck shouldAbort = [this, &job] { return cancelled(job); };

    if (model_.reentrant()) return model_.transcribe(pcm, job.request, shouldAbort);

    std::lock_guard<std::mutex> lock(model_mutex_);
    if (shouldAbort()) return {};
    return model_.transcribe(pcm, job.request, shouldAbort);
}

TranscriptionResult TranscriptionPool::runJob(const TranscriptionJob& job) {
    TranscriptionResult result;
    result.kind = job.kind;
    result.sessionId = job.sessionId;
    result.resetGen = job.resetGen;
    result.seq = job.seq;
    result.path = job.path;
    result.status = ResultStatus::Failed;

    for (int attempt = 1; attempt <= kMaxAttempts && !cancelled(job); ++attempt) {
        result.attempts = attempt;
        try {
            const std::vector<float> pcm = loadAudio(job);
            const std::string text = callModel(pcm, job);
            if (cancelled(job)) break;

            result.text = filter_.apply(text);
            result.status = ResultStatus::Ok;
            result.error.clear();
            return result;
        } catch (const std::exception& e) {
            result.error = e.what();
            logWarn("Transcription", "attempt " + std::to_string(attempt) + " failed for " +
                    job.path + ": " + e.what());
        }
    }

    result.text.clear();
    return result;
}

// Worker thread body
void TranscriptionPool::workerLoop(int id) {
    TranscriptionJob job;
    while (jobs_.pop(job)) {
        if (abort_.load()) break;
        if (cancelled(job)) {
            logDebug("Transcription", "skipping cancelled job " + job.path);
            continue;
        }

        busy_.fetch_add(1);
        logDebug("Transcription", "worker " + std::to_string(id) + " took " + job.path);
        TranscriptionResult result = runJob(job);
        busy_.fetch_sub(1);

        if (abort_.load()) break;
        if (cancelled(job)) {
            logInfo("Transcription", "Dropped result of cancelled job " + job.path);
            continue;
        }
        if (sink_) sink_(std::move(result));
    }
}
