#include "session/transcript_assembler.hpp"
#include "stt/text_filter.hpp"

#include <utility>

// Constructor
TranscriptAssembler::TranscriptAssembler(std::string gapMarker) : gapMarker_(std::move(gapMarker)) {}

void TranscriptAssembler::reset() {
    held_.clear();
    parts_.clear();
    cursor_ = 0;
    taken_ = 0;
    failed_ = 0;
    emittedText_ = false;
}

std::string TranscriptAssembler::render(const TranscriptionResult& result) const {
    if (result.status == ResultStatus::Ok) return result.text;
    return " " + gapMarker_;
}

size_t TranscriptAssembler::accept(const TranscriptionResult& result) {
    if (result.seq < cursor_ || held_.count(result.seq)) return 0;

    held_.emplace(result.seq, result);

    size_t appended = 0;
    for (auto it = held_.find(cursor_); it != held_.end(); it = held_.find(cursor_)) {
        if (it->second.status == ResultStatus::Failed) ++failed_;
        parts_.push_back(render(it->second));
        held_.erase(it);
        ++cursor_;
        ++appended;
    }
    return appended;
}

std::string TranscriptAssembler::text() const {
    std::string out;
    for (const auto& p : parts_) out += p;
    return trimLeft(out);
}

std::string TranscriptAssembler::takeNew() {
    std::string out;
    for (size_t i = taken_; i < parts_.size(); ++i) out += parts_[i];
    if (!emittedText_) {
        out = trimLeft(out);
        emittedText_ = !out.empty();
    }
    taken_ = parts_.size();
    return out;
}

const std::string& TranscriptAssembler::lastPart() const {
    static const std::string empty;
    return parts_.empty() ? empty : parts_.back();
}
