#ifndef TRANSCRIPT_ASSEMBLER_HPP
#define TRANSCRIPT_ASSEMBLER_HPP

#include "stt/transcription_pool.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Re-orders worker results by seq. A result is appended only once every
// smaller seq has been appended; later ones are held until the gap closes.
// FAILED results are rendered as the gap marker so lost audio stays visible.
class TranscriptAssembler {
public:
    explicit TranscriptAssembler(std::string gapMarker = "[untranscribed audio]");

    // Returns how many results were appended (0 when `result` is held or a duplicate).
    size_t accept(const TranscriptionResult& result);

    void reset();

    uint32_t cursor() const { return cursor_; }
    size_t held() const { return held_.size(); }
    size_t appended() const { return parts_.size(); }
    size_t failed() const { return failed_; }

    // Ordered transcript so far, leading whitespace removed.
    std::string text() const;

    // Text appended since the previous call.
    std::string takeNew();

    // Rendered piece of the most recently appended result.
    const std::string& lastPart() const;

private:
    std::string render(const TranscriptionResult& result) const;

    std::string gapMarker_;
    std::map<uint32_t, TranscriptionResult> held_;
    std::vector<std::string> parts_;
    uint32_t cursor_ = 0;
    size_t taken_ = 0;
    size_t failed_ = 0;
    bool emittedText_ = false;
};

#endif
