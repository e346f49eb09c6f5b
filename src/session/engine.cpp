#include "session/engine.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

static std::string secs(double s) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2fs", s);
    return buf;
}

// Silence detection for static files, which are always decoded to 16 kHz
static Chunker::Config staticSilenceConfig(const Config& config) {
    Chunker::Config c = Chunker::fromConfig(config, false);
    c.sampleRate = 16000;
    return c;
}

const char* toString(UiRequest ui) {
    switch (ui) {
    case UiRequest::Config: return "config";
    case UiRequest::LanguageMenu: return "language";
    case UiRequest::AudioSourceMenu: return "audio_source";
    }
    return "unknown";
}

// Constructor
Engine::Engine(Config config, AudioSource& source, SpeechModel& model, TextOutput& output,
               EngineListener* listener)
    : config_(std::move(config)),
      source_(source),
      model_(model),
      output_(output),
      listener_(listener),
      store_(config_.storage.tempDir, config_.audio.sampleRate),
      filter_(config_.transcription.hallucinationPatterns),
      assembler_(config_.transcription.gapMarker),
      staticLoader_(config_.transcription.convertCommand, config_.storage.tempDir, staticSilenceConfig(config_)),
      capture_(source_, store_, [this](CaptureEvent ev) {
          Event e;
          e.kind = Event::Kind::Capture;
          e.capture = std::move(ev);
          events_.push(std::move(e));
      }),
      pool_(model_, filter_, config_.transcription.workers, [this](TranscriptionResult r) {
          Event e;
          e.kind = Event::Kind::Result;
          e.result = std::move(r);
          events_.push(std::move(e));
      }, &staticLoader_) {}

// Destructor
Engine::~Engine() { teardown(); }

// Creates the temp directory and starts the workers
void Engine::init() {
    store_.init();
    pool_.start();
    logInfo("Engine", "temp audio in " + store_.dir() + ", " +
            std::to_string(pool_.workers()) + " transcription worker(s)");
}

// Queues a parsed command for the engine thread
void Engine::post(const Command& cmd) {
    Event e;
    e.kind = Event::Kind::Command;
    e.command = cmd;
    if (!events_.push(std::move(e))) {
        logWarn("Engine", std::string("engine stopped, dropping ") + toString(cmd.type));
    }
}

// Parses a raw command line and queues it
bool Engine::postLine(const std::string& line) {
    Command cmd;
    if (!parseCommand(line, cmd)) {
        logWarn("Engine", "Unrecognized command: '" + line + "'");
        if (listener_) listener_->onCommandRejected(line, "unknown command");
        return false;
    }
    logInfo("Engine", "Received command: '" + line + "'");
    post(cmd);
    return true;
}

// Engine thread: handles events until QUIT or close
void Engine::run() {
    Event ev;
    while (!quitting_ && events_.pop(ev)) {
        dispatch(ev);
    }
    teardown();
}

// Routes one event to its handler
void Engine::dispatch(Event& ev) {
    switch (ev.kind) {
    case Event::Kind::Command: {
        const bool accepted = handleCommand(ev.command);
        if (listener_) listener_->onCommandHandled(ev.command, accepted);
        break;
    }
    case Event::Kind::Capture:
        handleCapture(ev.capture);
        break;
    case Event::Kind::Result:
        handleResult(ev.result);
        break;
    }
}

// Updates the state and notifies the listener
void Engine::setState(SessionState state) {
    if (session_.state == state) return;
    session_.state = state;
    stateMirror_.store(state);
    logDebug("Engine", std::string("state -> ") + toString(state));
    if (listener_) listener_->onStateChanged(state);
}

// Logs and reports a refused command
void Engine::reject(const Command& cmd, const std::string& reason) {
    logWarn("Engine", std::string(toString(cmd.type)) + " rejected: " + reason);
    if (listener_) listener_->onCommandRejected(toString(cmd.type), reason);
}

// Chunking profile for the current realtime mode
Chunker::Config Engine::chunkerConfig() const {
    return Chunker::fromConfig(config_, config_.realtime.enabled);
}

// Checks a command against the state and runs it
bool Engine::handleCommand(const Command& cmd) {
    switch (cmd.type) {
    case CommandType::StartRecording:
        if (session_.active()) {
            reject(cmd, session_.state == SessionState::Recording ? "already recording"
                                                                    : "previous session still transcribing");
            return false;
        }
        if (staticJobId_ != 0) {
            reject(cmd, "static transcription in progress");
            return false;
        }
        return startRecording();

    case CommandType::StopAndTranscribe:
        if (session_.state != SessionState::Recording) {
            reject(cmd, session_.state == SessionState::Stopping ? "already stopping" : "recording not in progress");
            return false;
        }
        return stopAndTranscribe();

    case CommandType::ResetTranscription:
        if (!session_.active() && staticJobId_ == 0) {
            reject(cmd, "no transcription in progress to reset");
            return false;
        }
        return resetTranscription();

    case CommandType::TranscribeStatic:
        if (session_.state != SessionState::Idle) {
            reject(cmd, "cannot start static transcription while recording is in progress");
            return false;
        }
        if (staticJobId_ != 0) {
            reject(cmd, "static transcription already in progress");
            return false;
        }
        return transcribeStatic(cmd.argument);

    case CommandType::ToggleLanguage:
        toggleLanguage();
        return true;

    case CommandType::ToggleEnter:
        toggleEnter();
        return true;

    case CommandType::ToggleRealtimeTranscription:
        toggleRealtime();
        return true;

    case CommandType::OpenLanguageMenu:
        if (listener_) listener_->onUiRequest(UiRequest::LanguageMenu);
        logInfo("Engine", "language menu requested");
        return true;

    case CommandType::OpenConfigDialog:
        if (listener_) listener_->onUiRequest(UiRequest::Config);
        logInfo("Engine", "configuration dialog requested");
        return true;

    case CommandType::OpenAudioSourceMenu:
        if (listener_) listener_->onUiRequest(UiRequest::AudioSourceMenu);
        logInfo("Engine", "audio source menu requested");
        return true;

    case CommandType::Quit:
        logInfo("Engine", "Received QUIT command");
        quitting_ = true;
        return true;
    }
    return false;
}

// Opens a new session and starts capture
bool Engine::startRecording() {
    const size_t purged = store_.purge();
    if (purged > 0) logInfo("Engine", "Deleted " + std::to_string(purged) + " temp file(s) of the previous session");

    Session next;
    next.sessionId = ++lastSessionId_;
    next.language = config_.transcription.language;
    next.autoTypeEnabled = config_.output.autoType;
    next.autoEnterEnabled = config_.output.sendEnter;
    session_ = next;
    assembler_.reset();
    sessionMirror_.store(session_.sessionId);

    try {
        capture_.start(session_.sessionId, chunkerConfig(), config_.audio.framesPerBuffer);
    } catch (const DeviceError& e) {
        logError("Engine", std::string("Failed to open audio stream: ") + e.what());
        if (listener_) listener_->onSessionAborted(session_.sessionId, e.what());
        return false;
    }

    setState(SessionState::Recording);
    logInfo("Engine", "Starting a new recording session (#" + std::to_string(session_.sessionId) +
            ", language " + session_.language + (config_.realtime.enabled ? ", realtime" : "") + ")");
    return true;
}

// Stops capture; the session ends once every chunk is transcribed
bool Engine::stopAndTranscribe() {
    logInfo("Engine", "Stopping recording and transcribing...");
    setState(SessionState::Stopping);
    // Joins the capture thread; the final chunk and Finished are already queued when this returns.
    capture_.stop();
    maybeFinish();
    return true;
}

// Drops the transcript so far, or aborts the static job
bool Engine::resetTranscription() {
    if (!session_.active()) {
        logInfo("Engine", "Static transcription abort requested");
        pool_.cancelStatic(staticJobId_);
        if (listener_) listener_->onStaticDone(staticPath_, false);
        staticJobId_ = 0;
        staticPath_.clear();
        return true;
    }

    ++session_.resetGen;
    if (capture_.running()) capture_.requestReset(session_.resetGen);

    const size_t dropped = pool_.discardQueued();
    assembler_.reset();
    session_.nextChunkSeq = 0;
    session_.pendingChunks = 0;
    session_.chunks.clear();

    logInfo("Engine", "Transcription reset (" + std::to_string(dropped) + " queued chunk(s) dropped)" +
            (session_.state == SessionState::Recording ? ", still recording" : ""));

    maybeFinish();
    return true;
}

// Queues an existing file for transcription
bool Engine::transcribeStatic(const std::string& argument) {
    const std::string path = argument.empty() ? config_.transcription.staticFile : argument;
    const Command cmd{CommandType::TranscribeStatic, argument};

    if (path.empty()) {
        reject(cmd, "no file given and transcription.static_file is not set");
        return false;
    }
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        reject(cmd, "no such file: " + path);
        return false;
    }

    TranscriptionJob job;
    job.kind = JobKind::Static;
    job.sessionId = ++lastStaticId_;
    job.path = path;
    job.request.language = config_.transcription.language;
    job.request.translate = config_.shouldTranslate(job.request.language);

    if (!pool_.submit(job)) {
        reject(cmd, "transcription workers stopped");
        return false;
    }

    staticJobId_ = job.sessionId;
    staticPath_ = path;
    logInfo("Engine", "Transcribing static file " + path);
    return true;
}

// Switches to the next configured language
void Engine::toggleLanguage() {
    const std::string old = config_.transcription.language;
    config_.transcription.language = config_.nextLanguage(old);
    if (session_.active()) session_.language = config_.transcription.language;
    logInfo("Engine", "Language toggled from " + old + " to " + config_.transcription.language +
            (config_.shouldTranslate(config_.transcription.language) ? " (translate)" : ""));
}

// Flips Enter after delivery
void Engine::toggleEnter() {
    config_.output.sendEnter = !config_.output.sendEnter;
    if (session_.active()) session_.autoEnterEnabled = config_.output.sendEnter;
    logInfo("Engine", std::string("Toggled send_enter to: ") + (config_.output.sendEnter ? "true" : "false"));
}

// Flips realtime mode, also for the running capture
void Engine::toggleRealtime() {
    config_.realtime.enabled = !config_.realtime.enabled;
    if (capture_.running()) capture_.setChunkerConfig(chunkerConfig());
    logInfo("Engine", std::string("Realtime transcription ") + (config_.realtime.enabled ? "on" : "off") +
            " (split every " + std::to_string(chunkerConfig().splitIntervalMs) + " ms)");
}

// Records sealed chunks and queues their transcription
void Engine::handleCapture(const CaptureEvent& ev) {
    if (!session_.active() || ev.sessionId != session_.sessionId) {
        logDebug("Engine", "dropping capture event of session " + std::to_string(ev.sessionId));
        return;
    }

    switch (ev.kind) {
    case CaptureEvent::Kind::ChunkSealed: {
        if (ev.resetGen != session_.resetGen) {
            logDebug("Engine", "dropping chunk " + std::to_string(ev.seq) + " sealed before reset");
            return;
        }
        if (ev.seq != session_.nextChunkSeq) {
            logWarn("Engine", "chunk seq " + std::to_string(ev.seq) + " arrived, expected " +
                    std::to_string(session_.nextChunkSeq));
        }
        session_.nextChunkSeq = ev.seq + 1;
        ++session_.pendingChunks;

        ChunkRecord rec;
        rec.seq = ev.seq;
        rec.startTime = ev.startSec;
        rec.endTime = ev.endSec;
        rec.storagePath = ev.path;
        rec.reason = ev.reason;
        session_.chunks.push_back(rec);

        logInfo("Engine", "Chunk " + std::to_string(ev.seq) + " sealed (" + toString(ev.reason) + ", " +
                secs(ev.startSec) + " - " + secs(ev.endSec) + ")");

        TranscriptionResult failed;
        failed.kind = JobKind::Chunk;
        failed.sessionId = ev.sessionId;
        failed.resetGen = ev.resetGen;
        failed.seq = ev.seq;
        failed.status = ResultStatus::Failed;

        if (ev.path.empty()) {
            logError("Engine", "chunk " + std::to_string(ev.seq) + " not stored: " + ev.error);
            failed.error = ev.error;
            handleResult(failed);
            return;
        }

        TranscriptionJob job;
        job.kind = JobKind::Chunk;
        job.sessionId = ev.sessionId;
        job.resetGen = ev.resetGen;
        job.seq = ev.seq;
        job.path = ev.path;
        job.request.language = session_.language;
        job.request.translate = config_.shouldTranslate(session_.language);
        if (!pool_.submit(job)) {
            failed.error = "transcription workers stopped";
            handleResult(failed);
        }
        return;
    }

    case CaptureEvent::Kind::DeviceFailed:
        abortSession("audio device error: " + ev.error);
        return;

    case CaptureEvent::Kind::Finished:
        session_.captureFinished = true;
        maybeFinish();
        return;
    }
}

// Feeds a chunk result to the assembler
void Engine::handleResult(const TranscriptionResult& result) {
    if (result.kind == JobKind::Static) {
        handleStaticResult(result);
        return;
    }

    if (!session_.active() || result.sessionId != session_.sessionId || result.resetGen != session_.resetGen) {
        logDebug("Engine", "dropping stale result for chunk " + std::to_string(result.seq));
        return;
    }

    if (result.status == ResultStatus::Failed) {
        logError("Engine", "Chunk " + std::to_string(result.seq) + " failed after " +
                 std::to_string(result.attempts) + " attempt(s): " + result.error);
    }

    const size_t appended = assembler_.accept(result);
    session_.pendingChunks -= (uint32_t)appended;

    if (appended > 0) {
        logInfo("Engine", "Partial transcription up to chunk " + std::to_string(assembler_.cursor() - 1) +
                ": " + assembler_.lastPart());
        if (config_.realtime.enabled && session_.autoTypeEnabled) {
            const std::string piece = assembler_.takeNew();
            if (!piece.empty()) deliver(piece, false);
        }
    }

    maybeFinish();
}

// Saves a static transcript beside its audio file
void Engine::handleStaticResult(const TranscriptionResult& result) {
    if (result.sessionId != staticJobId_) {
        logDebug("Engine", "dropping result of aborted static transcription " + result.path);
        return;
    }
    staticJobId_ = 0;
    staticPath_.clear();

    if (result.status != ResultStatus::Ok) {
        logError("Engine", "Static transcription failed for " + result.path + ": " + result.error);
        if (listener_) listener_->onStaticDone(result.path, false);
        return;
    }

    const std::string text = trimLeft(result.text);
    logInfo("Engine", "Static File Transcription: " + text);

    const fs::path out = fs::path(result.path).replace_extension(".txt");
    bool saved = false;
    {
        std::ofstream f(out);
        f << text;
        f.close();
        saved = !f.fail();
    }
    if (saved) logInfo("Engine", "Transcription saved to " + out.string());
    else logError("Engine", "cannot write " + out.string());

    if (config_.output.autoType && !text.empty()) deliver(text, false);
    if (listener_) listener_->onStaticDone(result.path, saved);
}

// Ends a stopping session once nothing is pending
void Engine::maybeFinish() {
    if (session_.state != SessionState::Stopping) return;
    if (!session_.captureFinished || session_.pendingChunks > 0) return;

    setState(SessionState::Terminal);

    const std::string text = assembler_.takeNew();
    const std::string full = assembler_.text();

    double audioSec = 0.0;
    for (const auto& c : session_.chunks) audioSec += c.endTime - c.startTime;

    if (full.empty()) {
        logInfo("Engine", "No transcription result available.");
    } else {
        logInfo("Engine", "Final Combined Transcription (" + std::to_string(session_.chunks.size()) +
                " chunk(s), " + secs(audioSec) + "): " + full);
        if (assembler_.failed() > 0) {
            logWarn("Engine", std::to_string(assembler_.failed()) + " chunk(s) marked as gaps");
        }
    }

    if (session_.autoTypeEnabled && (!text.empty() || (!full.empty() && session_.autoEnterEnabled))) {
        deliver(text, session_.autoEnterEnabled);
    }

    const uint64_t done = session_.sessionId;
    setState(SessionState::Idle);
    logInfo("Engine", "Done.");
    if (listener_) listener_->onSessionDone(done, full);
}

// Ends the session without a transcript
void Engine::abortSession(const std::string& reason) {
    logError("Engine", "Session #" + std::to_string(session_.sessionId) + " aborted after " +
             std::to_string(session_.chunks.size()) + " chunk(s): " + reason);

    const uint64_t aborted = session_.sessionId;
    capture_.stop();
    pool_.discardQueued();
    assembler_.reset();

    session_.pendingChunks = 0;
    session_.chunks.clear();
    ++session_.resetGen;
    setState(SessionState::Idle);

    if (listener_) listener_->onSessionAborted(aborted, reason);
}

// Sends text to the output, logging failures
void Engine::deliver(const std::string& text, bool pressEnter) {
    try {
        output_.deliver(text, pressEnter);
    } catch (const std::exception& e) {
        logError("Engine", std::string("transcript delivery failed: ") + e.what());
    }
}

// Stops capture and workers; runs once
void Engine::teardown() {
    if (tornDown_) return;
    tornDown_ = true;

    logInfo("Engine", "Shutting down gracefully...");
    capture_.stop();
    pool_.shutdown();
    events_.close();

    if (session_.active()) {
        logInfo("Engine", "Discarded unfinished session #" + std::to_string(session_.sessionId));
    }
    setState(SessionState::Idle);

    if (listener_) listener_->onShutdown();
}
