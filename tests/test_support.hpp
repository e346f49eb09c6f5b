#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include "audio/audio_source.hpp"
#include "core/errors.hpp"
#include "output/text_output.hpp"
#include "session/engine.hpp"
#include "stt/speech_model.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace testing {

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("longscribe_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string str() const { return path_.string(); }
    std::filesystem::path path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Constant-amplitude square wave; its peak energy equals `amplitude`.
inline std::vector<int16_t> tone(int16_t amplitude, double seconds, int sampleRate = 16000) {
    std::vector<int16_t> out((size_t)std::llround(seconds * sampleRate));
    for (size_t i = 0; i < out.size(); ++i) out[i] = (i % 2 == 0) ? amplitude : (int16_t)-amplitude;
    return out;
}

inline std::vector<int16_t> silence(double seconds, int sampleRate = 16000) {
    return std::vector<int16_t>((size_t)std::llround(seconds * sampleRate), 0);
}

inline void append(std::vector<int16_t>& dst, const std::vector<int16_t>& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

// Amplitudes the ScriptedModel maps to words.
constexpr int16_t kAlpha = 3277;    // ~0.1 full scale
constexpr int16_t kBeta = 6554;     // ~0.2
constexpr int16_t kGamma = 9830;    // ~0.3

// Serves queued audio as fast as it is read; once the script runs dry it
// yields silent blocks at roughly 1 ms per block.
class ScriptedSource : public AudioSource {
public:
    void push(const std::vector<int16_t>& samples) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.insert(pending_.end(), samples.begin(), samples.end());
    }

    void open(int /*sampleRate*/, int /*framesPerBuffer*/) override {
        if (failOpen) throw DeviceError("scripted open failure");
        std::lock_guard<std::mutex> lock(mutex_);
        opened_ = true;
        ++opens_;
    }

    void read(int16_t* out, size_t frames) override {
        bool idle = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failAfterBlocks >= 0 && blocks_ >= (uint64_t)failAfterBlocks) {
                throw DeviceError("scripted device failure");
            }
            const size_t n = std::min(frames, pending_.size());
            std::copy(pending_.begin(), pending_.begin() + n, out);
            pending_.erase(pending_.begin(), pending_.begin() + n);
            std::fill(out + n, out + frames, (int16_t)0);
            idle = n == 0;
            ++blocks_;
            if (idle) ++idleBlocks_;
            else idleBlocks_ = 0;
        }
        cv_.notify_all();
        if (idle) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        opened_ = false;
    }

    std::string name() const override { return "scripted"; }

    // Waits until the script is consumed and `idleBlocks` silent blocks have
    // been served after it, so every scripted block has been fed to the chunker.
    bool waitDrained(int idleBlocks = 3, std::chrono::milliseconds timeout = std::chrono::seconds(20)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            return pending_.empty() && idleBlocks_ >= (uint64_t)idleBlocks;
        });
    }

    bool opened() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opened_;
    }

    int opens() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opens_;
    }

    bool failOpen = false;
    int failAfterBlocks = -1;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<int16_t> pending_;
    uint64_t blocks_ = 0;
    uint64_t idleBlocks_ = 0;
    bool opened_ = false;
    int opens_ = 0;
};

inline float peakOf(const std::vector<float>& pcm) {
    float peak = 0.0f;
    for (float v : pcm) peak = std::max(peak, std::fabs(v));
    return peak;
}

// Redirects a stream into a buffer for its lifetime. Create it before any
// thread that logs and destroy it after they are joined.
class StreamCapture {
public:
    explicit StreamCapture(std::ostream& os) : os_(os), old_(os.rdbuf(buffer_.rdbuf())) {}
    ~StreamCapture() { os_.rdbuf(old_); }

    std::string text() const { return buffer_.str(); }

private:
    std::ostream& os_;
    std::ostringstream buffer_;
    std::streambuf* old_;
};

inline std::string wordFor(const std::vector<float>& pcm) {
    const float peak = peakOf(pcm);
    if (peak < 0.05f) return "";
    if (peak < 0.15f) return " alpha";
    if (peak < 0.25f) return " beta";
    return " gamma";
}

// Maps the peak amplitude of a chunk to a word: alpha, beta or gamma.
class ScriptedModel : public SpeechModel {
public:
    std::string transcribe(const std::vector<float>& pcm, const TranscribeRequest& request,
                           const AbortCheck& /*shouldAbort*/) override {
        calls.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(mutex);
            languages.push_back(request.language);
        }
        return wordFor(pcm);
    }

    std::atomic<int> calls{0};
    std::mutex mutex;
    std::vector<std::string> languages;
};

// Never returns until the caller aborts.
class BlockingModel : public SpeechModel {
public:
    std::string transcribe(const std::vector<float>& /*pcm*/, const TranscribeRequest& /*request*/,
                           const AbortCheck& shouldAbort) override {
        calls.fetch_add(1);
        while (!shouldAbort()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return " never";
    }

    std::atomic<int> calls{0};
};

// Like ScriptedModel, but calls with at least holdFrom samples wait until
// release() or until the caller aborts them.
class GatedModel : public SpeechModel {
public:
    explicit GatedModel(size_t holdFrom = 0) : holdFrom_(holdFrom) {}

    std::string transcribe(const std::vector<float>& pcm, const TranscribeRequest& /*request*/,
                           const AbortCheck& shouldAbort) override {
        calls.fetch_add(1);
        if (pcm.size() < holdFrom_) return wordFor(pcm);

        held.fetch_add(1);
        std::unique_lock<std::mutex> lock(mutex_);
        while (!open_ && !shouldAbort()) cv_.wait_for(lock, std::chrono::milliseconds(2));
        const bool released = open_;
        lock.unlock();
        held.fetch_sub(1);

        if (!released) {
            aborted.fetch_add(1);
            return " never";
        }
        return wordFor(pcm);
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    // Polls until `n` calls are waiting at the gate.
    bool waitHeld(int n) const {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (held.load() < n) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }

    std::atomic<int> calls{0};
    std::atomic<int> held{0};
    std::atomic<int> aborted{0};

private:
    size_t holdFrom_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

class RecordingOutput : public TextOutput {
public:
    void deliver(const std::string& text, bool pressEnter) override {
        std::lock_guard<std::mutex> lock(mutex_);
        texts_.push_back(text);
        enters_.push_back(pressEnter);
    }

    std::vector<std::string> texts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts_;
    }

    std::vector<bool> enters() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return enters_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> texts_;
    std::vector<bool> enters_;
};

// Records engine notifications and lets the test thread wait for them.
class RecordingListener : public EngineListener {
public:
    struct Handled {
        CommandType type;
        bool accepted;
    };

    void onCommandHandled(const Command& cmd, bool accepted) override {
        record([&] { handled.push_back({cmd.type, accepted}); });
    }
    void onCommandRejected(const std::string& command, const std::string& reason) override {
        record([&] { rejected.push_back(command + ": " + reason); });
    }
    void onStateChanged(SessionState state) override {
        record([&] { states.push_back(state); });
    }
    void onSessionDone(uint64_t sessionId, const std::string& transcript) override {
        record([&] { done.push_back({sessionId, transcript}); });
    }
    void onSessionAborted(uint64_t sessionId, const std::string& reason) override {
        record([&] { aborted.push_back({sessionId, reason}); });
    }
    void onUiRequest(UiRequest ui) override {
        record([&] { ui_requests.push_back(ui); });
    }
    // Also captures what the transcript file holds at the moment of the notification.
    void onStaticDone(const std::string& path, bool ok) override {
        std::ifstream in(std::filesystem::path(path).replace_extension(".txt"));
        std::stringstream text;
        if (in) text << in.rdbuf();
        record([&] {
            statics.push_back({path, ok});
            staticTexts.push_back(text.str());
        });
    }
    void onShutdown() override {
        record([&] { shutdown = true; });
    }

    // Waits until `pred` (evaluated under the lock) holds.
    bool waitFor(const std::function<bool()>& pred,
                 std::chrono::milliseconds timeout = std::chrono::seconds(20)) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, pred);
    }

    size_t handledCount(CommandType type) {
        size_t n = 0;
        for (const auto& h : handled) n += h.type == type ? 1 : 0;
        return n;
    }

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Handled> handled;
    std::vector<std::string> rejected;
    std::vector<SessionState> states;
    std::vector<std::pair<uint64_t, std::string>> done;
    std::vector<std::pair<uint64_t, std::string>> aborted;
    std::vector<UiRequest> ui_requests;
    std::vector<std::pair<std::string, bool>> statics;
    std::vector<std::string> staticTexts;
    bool shutdown = false;

private:
    template <typename F>
    void record(F f) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            f();
        }
        cv.notify_all();
    }
};

}

#endif
