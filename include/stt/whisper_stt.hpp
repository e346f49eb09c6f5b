#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include "stt/speech_model.hpp"

#include <string>
#include <vector>

struct whisper_context;

class WhisperSTT : public SpeechModel {
public:
    WhisperSTT(const std::string& modelPath, bool useGpu, int threads);
    ~WhisperSTT() override;

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    std::string transcribe(const std::vector<float>& pcm16kMono,
                           const TranscribeRequest& request,
                           const AbortCheck& shouldAbort) override;

private:
    whisper_context* context_ = nullptr;
    int threads_;
};

#endif
