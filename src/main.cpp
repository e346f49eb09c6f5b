#include "audio/portaudio_source.hpp"
#include "control/command_server.hpp"
#include "control/frontend_notifier.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "output/text_output.hpp"
#include "session/engine.hpp"
#include "stt/whisper_stt.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>

static void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <path>] [--model <path>] [--verbose] [--list-devices]\n";
}

static int listDevices() {
    try {
        for (const auto& d : PortAudioSource::listInputDevices()) {
            std::cout << (d.isDefault ? "* " : "  ") << d.index << ": " << d.name
                      << " (" << d.maxInputChannels << " ch, " << d.defaultSampleRate << " Hz)\n";
        }
    } catch (const DeviceError& e) {
        logError("Main", e.what());
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    std::string configPath = "config.json";
    std::string modelPath;
    bool verbose = false;
    bool list = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            modelPath = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--list-devices") {
            list = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (list) return listDevices();

    Config config = Config::load(configPath);
    if (config.loadPreferences(config.storage.userDataFile)) {
        logInfo("Main", "Loaded preferences from " + config.storage.userDataFile);
    }
    if (!modelPath.empty()) config.transcription.modelPath = modelPath;
    if (verbose) config.verbose = true;
    setLogVerbose(config.verbose);

    // STT model init
    std::unique_ptr<WhisperSTT> stt;
    try {
        logInfo("Main", "Loading model " + config.transcription.modelPath);
        stt = std::make_unique<WhisperSTT>(config.transcription.modelPath, config.transcription.useGpu,
                                           config.transcription.threads);
    } catch (const ModelError& e) {
        logError("Main", e.what());
        return 1;
    }

    PortAudioSource source(config.audio.deviceIndex);
    CommandTextOutput output(config.output.typeCommand, config.output.enterCommand);

    Engine* engineRef = nullptr;
    CommandServer server(config.control.bindIp, config.control.port,
        [&engineRef](const std::string& msg, const std::string& senderIP, uint16_t senderPort) {
            logDebug("Command Server", "datagram from " + senderIP + ":" + std::to_string(senderPort));
            if (engineRef) engineRef->postLine(msg);
        });
    FrontendNotifier notifier(server);

    const std::string userDataFile = config.storage.userDataFile;
    Engine engine(config, source, *stt, output, &notifier);

    try {
        engine.init();
    } catch (const StorageError& e) {
        logError("Main", std::string("cannot prepare temp storage: ") + e.what());
        return 1;
    }

    engineRef = &engine;
    try {
        server.start();
    } catch (const std::runtime_error& e) {
        logError("Main", e.what());
        return 1;
    }

    std::cout << "\nlongscribe running... send QUIT to exit." << std::endl;
    engine.run();

    server.stop();

    if (engine.config().save(userDataFile)) {
        logInfo("Main", "Saved preferences to " + userDataFile);
    }
    return 0;
}
