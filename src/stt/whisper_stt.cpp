#include "stt/whisper_stt.hpp"
#include "core/errors.hpp"

#include <whisper.h>

// Constructor
WhisperSTT::WhisperSTT(const std::string& modelPath, bool useGpu, int threads) : threads_(threads) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = useGpu;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    if (!context_) throw ModelError("whisper_init_from_file_with_params failed: " + modelPath);
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

static bool abort_requested(void* user_data) {
    const AbortCheck* check = static_cast<const AbortCheck*>(user_data);
    return *check && (*check)();
}

// Converts pcm16kMono into text, transcribing or translating to English
std::string WhisperSTT::transcribe(const std::vector<float>& pcm16kMono,
                                   const TranscribeRequest& request,
                                   const AbortCheck& shouldAbort) {
    if (pcm16kMono.empty()) return {};

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = threads_;
    params.language = request.language.c_str();
    params.translate = request.translate;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;

    params.no_speech_thold = 0.6f;

    params.abort_callback = abort_requested;
    params.abort_callback_user_data = const_cast<AbortCheck*>(&shouldAbort);

    const int rc = whisper_full(context_, params, pcm16kMono.data(), (int)pcm16kMono.size());
    if (shouldAbort && shouldAbort()) return {};
    if (rc != 0) throw ModelError("whisper_full failed (" + std::to_string(rc) + ")");

    std::string out;
    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) out += whisper_full_get_segment_text(context_, i);
    return out;
}
