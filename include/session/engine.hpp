#ifndef ENGINE_HPP
#define ENGINE_HPP

#include "audio/audio_source.hpp"
#include "audio/capture_loop.hpp"
#include "audio/chunk_store.hpp"
#include "control/command.hpp"
#include "core/blocking_queue.hpp"
#include "core/config.hpp"
#include "output/text_output.hpp"
#include "session/session.hpp"
#include "session/transcript_assembler.hpp"
#include "stt/speech_model.hpp"
#include "stt/text_filter.hpp"
#include "stt/transcription_pool.hpp"

#include <atomic>
#include <cstdint>
#include <string>

enum class UiRequest { Config, LanguageMenu, AudioSourceMenu };

const char* toString(UiRequest ui);

// Front-end facing notifications. Called on the engine thread, except for
// rejections of unparsable lines which are reported on the posting thread.
class EngineListener {
public:
    virtual ~EngineListener() = default;

    virtual void onCommandHandled(const Command& /*cmd*/, bool /*accepted*/) {}
    virtual void onCommandRejected(const std::string& /*command*/, const std::string& /*reason*/) {}
    virtual void onStateChanged(SessionState /*state*/) {}
    virtual void onSessionDone(uint64_t /*sessionId*/, const std::string& /*transcript*/) {}
    virtual void onSessionAborted(uint64_t /*sessionId*/, const std::string& /*reason*/) {}
    virtual void onUiRequest(UiRequest /*ui*/) {}
    virtual void onStaticDone(const std::string& /*path*/, bool /*ok*/) {}
    virtual void onShutdown() {}
};

// The process-wide recording/transcription engine.
//
// Every Session, chunk and assembler mutation happens on the thread that calls
// run(). Commands, capture events and worker results reach it through one
// event queue, so the loop never waits on the device or on the model.
class Engine {
public:
    Engine(Config config, AudioSource& source, SpeechModel& model, TextOutput& output,
           EngineListener* listener = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Creates the temp directory (throws StorageError) and starts the workers.
    void init();

    // Thread-safe.
    void post(const Command& cmd);

    // Parses and posts one command line. Unknown commands are reported and
    // dropped. Thread-safe.
    bool postLine(const std::string& line);

    // Processes events until QUIT, then tears down.
    void run();

    SessionState state() const { return stateMirror_.load(); }
    uint64_t sessionId() const { return sessionMirror_.load(); }

    // Only safe to read once run() has returned.
    const Config& config() const { return config_; }

    const ChunkStore& store() const { return store_; }

private:
    struct Event {
        enum class Kind { Command, Capture, Result };
        Kind kind = Kind::Command;
        Command command;
        CaptureEvent capture;
        TranscriptionResult result;
    };

    void dispatch(Event& ev);

    bool handleCommand(const Command& cmd);
    bool startRecording();
    bool stopAndTranscribe();
    bool resetTranscription();
    bool transcribeStatic(const std::string& argument);
    void toggleLanguage();
    void toggleEnter();
    void toggleRealtime();

    void handleCapture(const CaptureEvent& ev);
    void handleResult(const TranscriptionResult& result);
    void handleStaticResult(const TranscriptionResult& result);

    void maybeFinish();
    void abortSession(const std::string& reason);
    void deliver(const std::string& text, bool pressEnter);
    void reject(const Command& cmd, const std::string& reason);
    void setState(SessionState state);
    void teardown();

    Chunker::Config chunkerConfig() const;

    Config config_;
    AudioSource& source_;
    SpeechModel& model_;
    TextOutput& output_;
    EngineListener* listener_;

    BlockingQueue<Event> events_;

    ChunkStore store_;
    TextFilter filter_;
    TranscriptAssembler assembler_;
    Session session_;
    StaticAudioLoader staticLoader_;

    uint64_t lastSessionId_ = 0;
    uint64_t lastStaticId_ = 0;
    uint64_t staticJobId_ = 0;     // 0 = no static transcription in flight
    std::string staticPath_;
    bool quitting_ = false;
    bool tornDown_ = false;

    std::atomic<SessionState> stateMirror_{SessionState::Idle};
    std::atomic<uint64_t> sessionMirror_{0};

    // Declared last: their threads post into events_ and must stop first.
    CaptureLoop capture_;
    TranscriptionPool pool_;
};

#endif
