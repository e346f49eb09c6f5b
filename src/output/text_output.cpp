#include "output/text_output.hpp"
#include "core/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <utility>

#ifdef _WIN32
static FILE* openPipe(const char* cmd) { return _popen(cmd, "w"); }
static int closePipe(FILE* p) { return _pclose(p); }
#else
static FILE* openPipe(const char* cmd) { return popen(cmd, "w"); }
static int closePipe(FILE* p) { return pclose(p); }
#endif

// Constructor
CommandTextOutput::CommandTextOutput(std::string typeCommand, std::string enterCommand)
    : typeCommand_(std::move(typeCommand)), enterCommand_(std::move(enterCommand)) {}

void CommandTextOutput::deliver(const std::string& text, bool pressEnter) {
    if (!text.empty() && !typeCommand_.empty()) {
        FILE* pipe = openPipe(typeCommand_.c_str());
        if (!pipe) {
            logError("Output", "failed to run: " + typeCommand_);
            return;
        }
        const size_t n = std::fwrite(text.data(), 1, text.size(), pipe);
        const int rc = closePipe(pipe);
        if (n != text.size() || rc != 0) {
            logError("Output", "'" + typeCommand_ + "' failed (exit " + std::to_string(rc) + ")");
            return;
        }
    }

    if (pressEnter && !enterCommand_.empty()) {
        const int rc = std::system(enterCommand_.c_str());
        if (rc != 0) logError("Output", "'" + enterCommand_ + "' failed (exit " + std::to_string(rc) + ")");
        else logInfo("Output", "Sent an ENTER keystroke after transcription.");
    }
}
