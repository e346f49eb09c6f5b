#ifndef SPEECH_MODEL_HPP
#define SPEECH_MODEL_HPP

#include <functional>
#include <string>
#include <vector>

struct TranscribeRequest {
    std::string language = "en";
    bool translate = false;
};

// Polled during a transcribe() call; true means the caller no longer wants the result.
using AbortCheck = std::function<bool()>;

// Opaque speech recognizer: 16 kHz mono audio in, text out.
// transcribe() throws on failure and should return early once `shouldAbort` holds.
class SpeechModel {
public:
    virtual ~SpeechModel() = default;

    virtual std::string transcribe(const std::vector<float>& pcm16kMono,
                                   const TranscribeRequest& request,
                                   const AbortCheck& shouldAbort) = 0;

    // True when concurrent transcribe() calls on the same instance are safe.
    virtual bool reentrant() const { return false; }
};

#endif
