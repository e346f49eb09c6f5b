#ifndef SESSION_HPP
#define SESSION_HPP

#include "audio/chunker.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class SessionState { Idle, Recording, Stopping, Terminal };

const char* toString(SessionState state);

struct ChunkRecord {
    uint32_t seq = 0;
    double startTime = 0.0;
    double endTime = 0.0;
    std::string storagePath;
    BoundaryReason reason = BoundaryReason::ForcedStop;
};

// One recording/transcription cycle. Only the engine thread reads or writes it.
struct Session {
    uint64_t sessionId = 0;
    SessionState state = SessionState::Idle;
    uint32_t nextChunkSeq = 0;
    uint32_t pendingChunks = 0;
    // Bumped by RESET_TRANSCRIPTION; chunks and results of older generations are stale.
    uint32_t resetGen = 0;
    std::string language;
    bool autoTypeEnabled = true;
    bool autoEnterEnabled = false;
    bool captureFinished = false;
    std::vector<ChunkRecord> chunks;

    bool active() const { return state == SessionState::Recording || state == SessionState::Stopping; }
};

#endif
