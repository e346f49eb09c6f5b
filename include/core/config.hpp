#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

enum class EnergyMeasure { Peak, Rms };

struct Config {
    struct Audio {
        int sampleRate = 16000;
        int channels = 1;
        int framesPerBuffer = 1024;
        int deviceIndex = -1;   // -1 = default input device
    } audio;

    // Long-form boundary policy.
    struct Chunking {
        EnergyMeasure measure = EnergyMeasure::Peak;
        float threshold = 500.0f;   // int16 amplitude units
        int minSilenceMs = 1500;
        int maxLeadInMs = 1500;
        int splitIntervalMs = 60000;
    } chunking;

    // Profile applied to the chunker while realtime mode is on.
    struct Realtime {
        bool enabled = false;
        int minSilenceMs = 500;
        int maxLeadInMs = 500;
        int splitIntervalMs = 5000;
    } realtime;

    struct Transcription {
        std::string modelPath = "models/whisper/ggml-large-v3.bin";
        bool useGpu = false;
        int threads = 4;
        int workers = 1;
        std::vector<std::string> languages = {"en", "el"};
        std::string language = "en";
        // Languages transcribed as-is; everything else is translated to English.
        std::vector<std::string> transcribeLanguages = {"en", "el"};
        std::vector<std::string> hallucinationPatterns = {
            "Υπότιτλοι\\s+AUTHORWAVE[.!,]*",
            "Σας\\s+ευχαριστώ[.!,]*",
        };
        std::string gapMarker = "[untranscribed audio]";
        std::string staticFile;
        // Turns a non-WAV static file into 16 kHz mono WAV; {input} and {output} are substituted.
        std::string convertCommand = "ffmpeg -nostdin -loglevel error -y -i {input} -ar 16000 -ac 1 -c:a pcm_s16le {output}";
    } transcription;

    struct Output {
        bool autoType = true;
        bool sendEnter = false;
        std::string typeCommand = "xdotool type --clearmodifiers --file -";
        std::string enterCommand = "xdotool key Return";
    } output;

    struct Control {
        std::string bindIp = "127.0.0.1";
        int port = 34909;
    } control;

    struct Storage {
        std::string tempDir = "temp_audio";
        std::string userDataFile = "userdata.json";
    } storage;

    bool verbose = false;

    // Reads a JSON file on top of the defaults. A missing file yields the defaults;
    // a malformed one is reported and the defaults are kept.
    static Config load(const std::string& path);
    static Config loadDefault();

    // Writes the user preferences (language, toggles). Returns false on I/O failure.
    bool save(const std::string& path) const;

    // Overlays preferences written by save(). Returns false when nothing was read.
    bool loadPreferences(const std::string& path);

    // Language that follows `current` in the configured cycle.
    std::string nextLanguage(const std::string& current) const;
    bool shouldTranslate(const std::string& language) const;
};

#endif
