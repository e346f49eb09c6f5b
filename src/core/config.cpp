#include "core/config.hpp"
#include "core/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>

using nlohmann::json;

namespace {

template <typename T>
void readKey(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) out = it->get<T>();
}

void readMeasure(const json& j, EnergyMeasure& out) {
    auto it = j.find("measure");
    if (it == j.end() || !it->is_string()) return;
    const std::string s = it->get<std::string>();
    if (s == "rms") out = EnergyMeasure::Rms;
    else if (s == "peak") out = EnergyMeasure::Peak;
    else logWarn("Config", "unknown chunking.measure '" + s + "', keeping default");
}

}

Config Config::loadDefault() { return Config{}; }

Config Config::load(const std::string& path) {
    Config config;

    std::ifstream in(path);
    if (!in) {
        logInfo("Config", "no config at " + path + ", using defaults");
        return config;
    }

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        logWarn("Config", "failed to parse " + path + ": " + e.what() + ", using defaults");
        return config;
    }

    try {
        if (j.contains("audio")) {
            const json& a = j["audio"];
            readKey(a, "sample_rate", config.audio.sampleRate);
            readKey(a, "channels", config.audio.channels);
            readKey(a, "frames_per_buffer", config.audio.framesPerBuffer);
            readKey(a, "device_index", config.audio.deviceIndex);
        }
        if (j.contains("chunking")) {
            const json& c = j["chunking"];
            readMeasure(c, config.chunking.measure);
            readKey(c, "threshold", config.chunking.threshold);
            readKey(c, "min_silence_ms", config.chunking.minSilenceMs);
            readKey(c, "max_lead_in_ms", config.chunking.maxLeadInMs);
            readKey(c, "split_interval_ms", config.chunking.splitIntervalMs);
        }
        if (j.contains("realtime")) {
            const json& r = j["realtime"];
            readKey(r, "enabled", config.realtime.enabled);
            readKey(r, "min_silence_ms", config.realtime.minSilenceMs);
            readKey(r, "max_lead_in_ms", config.realtime.maxLeadInMs);
            readKey(r, "split_interval_ms", config.realtime.splitIntervalMs);
        }
        if (j.contains("transcription")) {
            const json& t = j["transcription"];
            readKey(t, "model_path", config.transcription.modelPath);
            readKey(t, "use_gpu", config.transcription.useGpu);
            readKey(t, "threads", config.transcription.threads);
            readKey(t, "workers", config.transcription.workers);
            readKey(t, "languages", config.transcription.languages);
            readKey(t, "language", config.transcription.language);
            readKey(t, "transcribe_languages", config.transcription.transcribeLanguages);
            readKey(t, "hallucination_patterns", config.transcription.hallucinationPatterns);
            readKey(t, "gap_marker", config.transcription.gapMarker);
            readKey(t, "static_file", config.transcription.staticFile);
            readKey(t, "convert_command", config.transcription.convertCommand);
        }
        if (j.contains("output")) {
            const json& o = j["output"];
            readKey(o, "auto_type", config.output.autoType);
            readKey(o, "send_enter", config.output.sendEnter);
            readKey(o, "type_command", config.output.typeCommand);
            readKey(o, "enter_command", config.output.enterCommand);
        }
        if (j.contains("control")) {
            const json& c = j["control"];
            readKey(c, "bind_ip", config.control.bindIp);
            readKey(c, "port", config.control.port);
        }
        if (j.contains("storage")) {
            const json& s = j["storage"];
            readKey(s, "temp_dir", config.storage.tempDir);
            readKey(s, "user_data_file", config.storage.userDataFile);
        }
        readKey(j, "verbose", config.verbose);
    } catch (const json::exception& e) {
        logWarn("Config", "bad value in " + path + ": " + e.what() + ", using defaults");
        return Config{};
    }

    if (config.transcription.languages.empty()) config.transcription.languages = {"en", "el"};
    if (config.transcription.workers < 1) config.transcription.workers = 1;

    return config;
}

bool Config::save(const std::string& path) const {
    json j;
    j["transcription"]["language"] = transcription.language;
    j["transcription"]["languages"] = transcription.languages;
    j["transcription"]["model_path"] = transcription.modelPath;
    j["output"]["auto_type"] = output.autoType;
    j["output"]["send_enter"] = output.sendEnter;
    j["realtime"]["enabled"] = realtime.enabled;

    std::ofstream out(path);
    if (!out) {
        logError("Config", "cannot write " + path);
        return false;
    }
    out << j.dump(4) << "\n";
    return static_cast<bool>(out);
}

bool Config::loadPreferences(const std::string& path) {
    std::ifstream in(path);
    if (!in) return false;

    json j;
    try {
        in >> j;
        if (j.contains("transcription")) {
            const json& t = j["transcription"];
            readKey(t, "language", transcription.language);
            readKey(t, "languages", transcription.languages);
            readKey(t, "model_path", transcription.modelPath);
        }
        if (j.contains("output")) {
            readKey(j["output"], "auto_type", output.autoType);
            readKey(j["output"], "send_enter", output.sendEnter);
        }
        if (j.contains("realtime")) readKey(j["realtime"], "enabled", realtime.enabled);
    } catch (const json::exception& e) {
        logWarn("Config", "ignoring preferences in " + path + ": " + e.what());
        return false;
    }

    if (transcription.languages.empty()) transcription.languages = {"en", "el"};
    return true;
}

std::string Config::nextLanguage(const std::string& current) const {
    const auto& langs = transcription.languages;
    if (langs.empty()) return current;

    auto it = std::find(langs.begin(), langs.end(), current);
    if (it == langs.end() || ++it == langs.end()) return langs.front();
    return *it;
}

bool Config::shouldTranslate(const std::string& language) const {
    const auto& keep = transcription.transcribeLanguages;
    return std::find(keep.begin(), keep.end(), language) == keep.end();
}
