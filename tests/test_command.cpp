#include <catch2/catch.hpp>

#include "control/command.hpp"

TEST_CASE("Every command word parses", "[command]") {
    const char* words[] = {
        "START_RECORDING", "STOP_AND_TRANSCRIBE", "TOGGLE_LANGUAGE", "OPEN_LANGUAGE_MENU",
        "TOGGLE_ENTER", "RESET_TRANSCRIPTION", "TOGGLE_REALTIME_TRANSCRIPTION",
        "TRANSCRIBE_STATIC", "OPEN_CONFIG_DIALOG", "OPEN_AUDIO_SOURCE_MENU", "QUIT",
    };

    for (const char* word : words) {
        Command cmd;
        INFO(word);
        REQUIRE(parseCommand(word, cmd));
        CHECK(std::string(toString(cmd.type)) == word);
        CHECK(cmd.argument.empty());
    }
}

TEST_CASE("Command lines are trimmed and case-sensitive", "[command]") {
    Command cmd;

    REQUIRE(parseCommand("  STOP_AND_TRANSCRIBE\r\n", cmd));
    CHECK(cmd.type == CommandType::StopAndTranscribe);

    CHECK_FALSE(parseCommand("stop_and_transcribe", cmd));
    CHECK_FALSE(parseCommand("", cmd));
    CHECK_FALSE(parseCommand("START", cmd));
    CHECK_FALSE(parseCommand("START_RECORDINGS", cmd));
}

TEST_CASE("Only TRANSCRIBE_STATIC takes an argument", "[command]") {
    Command cmd;

    REQUIRE(parseCommand("TRANSCRIBE_STATIC /tmp/some file.wav ", cmd));
    CHECK(cmd.type == CommandType::TranscribeStatic);
    CHECK(cmd.argument == "/tmp/some file.wav");

    CHECK_FALSE(parseCommand("START_RECORDING now", cmd));
    CHECK_FALSE(parseCommand("QUIT 1", cmd));
}
