#include "control/command.hpp"

#include <cctype>
#include <utility>

namespace {

struct Entry {
    const char* name;
    CommandType type;
};

const Entry kCommands[] = {
    {"START_RECORDING", CommandType::StartRecording},
    {"STOP_AND_TRANSCRIBE", CommandType::StopAndTranscribe},
    {"TOGGLE_LANGUAGE", CommandType::ToggleLanguage},
    {"OPEN_LANGUAGE_MENU", CommandType::OpenLanguageMenu},
    {"TOGGLE_ENTER", CommandType::ToggleEnter},
    {"RESET_TRANSCRIPTION", CommandType::ResetTranscription},
    {"TOGGLE_REALTIME_TRANSCRIPTION", CommandType::ToggleRealtimeTranscription},
    {"TRANSCRIBE_STATIC", CommandType::TranscribeStatic},
    {"OPEN_CONFIG_DIALOG", CommandType::OpenConfigDialog},
    {"OPEN_AUDIO_SOURCE_MENU", CommandType::OpenAudioSourceMenu},
    {"QUIT", CommandType::Quit},
};

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

}

bool parseCommand(const std::string& line, Command& out) {
    const std::string text = trim(line);

    const size_t space = text.find_first_of(" \t");
    const std::string word = text.substr(0, space);
    std::string arg = space == std::string::npos ? std::string() : trim(text.substr(space));

    for (const auto& entry : kCommands) {
        if (word != entry.name) continue;
        // Only TRANSCRIBE_STATIC takes an argument.
        if (!arg.empty() && entry.type != CommandType::TranscribeStatic) return false;
        out.type = entry.type;
        out.argument = std::move(arg);
        return true;
    }
    return false;
}

const char* toString(CommandType type) {
    for (const auto& entry : kCommands) {
        if (entry.type == type) return entry.name;
    }
    return "UNKNOWN";
}
