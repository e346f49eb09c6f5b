#ifndef COMMAND_HPP
#define COMMAND_HPP

#include <string>

enum class CommandType {
    StartRecording,
    StopAndTranscribe,
    ToggleLanguage,
    OpenLanguageMenu,
    ToggleEnter,
    ResetTranscription,
    ToggleRealtimeTranscription,
    TranscribeStatic,
    OpenConfigDialog,
    OpenAudioSourceMenu,
    Quit,
};

struct Command {
    CommandType type = CommandType::Quit;
    std::string argument;   // TRANSCRIBE_STATIC only: optional file path
};

// Parses one command line. Matching is case-sensitive; surrounding whitespace
// is ignored. Returns false for anything unrecognized.
bool parseCommand(const std::string& line, Command& out);

const char* toString(CommandType type);

#endif
