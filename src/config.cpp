#include "config.h"
#include "logger.h"
#include "utils.h"
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voicekit {

const char* mode_to_string(ListeningMode mode) {
    switch (mode) {
        case ListeningMode::Single: return "single";
        case ListeningMode::Continuous: return "continuous";
        case ListeningMode::ContinuousAndStop: return "continuous-and-stop";
    }
    return "single";
}

Result<ListeningMode> mode_from_string(const std::string& name) {
    std::string n = utils::normalize_copy(utils::trim_copy(name));
    if (n == "single") return ListeningMode::Single;
    if (n == "continuous") return ListeningMode::Continuous;
    if (n == "continuous-and-stop") return ListeningMode::ContinuousAndStop;
    return make_invalid_argument_error("Unknown listening mode: \"" + name + "\"");
}

VoidResult validate(const ListeningOptions& options) {
    if (utils::is_empty_or_whitespace(options.locale)) {
        return make_invalid_argument_error("locale must not be empty");
    }
    if (options.silence_timeout_ms < 0) {
        return make_invalid_argument_error("silence_timeout_ms must be >= 0, got " +
                                           std::to_string(options.silence_timeout_ms));
    }
    if (options.frame_length <= 0) {
        return make_invalid_argument_error("frame_length must be > 0, got " +
                                           std::to_string(options.frame_length));
    }
    if (!(options.sample_rate > 0.0) || !std::isfinite(options.sample_rate)) {
        std::ostringstream oss;
        oss << "sample_rate must be > 0, got " << options.sample_rate;
        return make_invalid_argument_error(oss.str());
    }
    return {};
}

namespace {

/// Read an integer key into out. Floats and other types leave out unchanged.
VoidResult read_int(const json& obj, const char* key, int& out) {
    if (!obj.contains(key) || !obj[key].is_number_integer()) return {};
    if (obj[key].is_number_unsigned()) {
        uint64_t value = obj[key].get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return make_invalid_argument_error(std::string(key) + " is out of range");
        }
        out = static_cast<int>(value);
        return {};
    }
    int64_t value = obj[key].get<int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return make_invalid_argument_error(std::string(key) + " is out of range");
    }
    out = static_cast<int>(value);
    return {};
}

/// Apply the "listening" section onto opts. Mode strings are checked; numeric bounds are left to validate().
VoidResult apply_listening(ListeningOptions& opts, const json& l) {
    if (l.contains("locale") && l["locale"].is_string()) opts.locale = l["locale"].get<std::string>();
    if (l.contains("mode") && l["mode"].is_string()) {
        auto mode = mode_from_string(l["mode"].get<std::string>());
        if (mode.is_error()) return mode.error();
        opts.mode = mode.value();
    }
    VoidResult timeout = read_int(l, "silence_timeout_ms", opts.silence_timeout_ms);
    if (timeout.is_error()) return timeout;
    VoidResult frame = read_int(l, "frame_length", opts.frame_length);
    if (frame.is_error()) return frame;
    if (l.contains("sample_rate") && l["sample_rate"].is_number())
        opts.sample_rate = l["sample_rate"].get<double>();
    if (l.contains("enable_audio_buffer") && l["enable_audio_buffer"].is_boolean())
        opts.enable_audio_buffer = l["enable_audio_buffer"];
    if (l.contains("use_on_device_recognizer") && l["use_on_device_recognizer"].is_boolean())
        opts.use_on_device_recognizer = l["use_on_device_recognizer"];
    if (l.contains("mute_external_audio") && l["mute_external_audio"].is_boolean())
        opts.mute_external_audio = l["mute_external_audio"];
    return {};
}

Result<AppConfig> apply_json_to_config(const json& j) {
    AppConfig cfg;
    if (!j.is_object()) {
        return make_config_error("Config root must be a JSON object");
    }

    if (j.contains("audio") && j["audio"].is_object()) {
        const auto& a = j["audio"];
        if (a.contains("input_device")) {
            // Accept a bare index as well as a name
            if (a["input_device"].is_string()) cfg.audio.input_device = a["input_device"].get<std::string>();
            else if (a["input_device"].is_number_integer()) cfg.audio.input_device = std::to_string(a["input_device"].get<int>());
        }
    }

    if (j.contains("stt") && j["stt"].is_object()) {
        const auto& s = j["stt"];
        if (s.contains("model_path") && s["model_path"].is_string()) cfg.stt.model_path = s["model_path"].get<std::string>();
        if (s.contains("use_gpu") && s["use_gpu"].is_boolean()) cfg.stt.use_gpu = s["use_gpu"];
        if (s.contains("n_threads") && s["n_threads"].is_number_integer()) cfg.stt.n_threads = s["n_threads"];
        if (s.contains("step_ms") && s["step_ms"].is_number_integer()) cfg.stt.step_ms = s["step_ms"];
        if (s.contains("no_speech_timeout_ms") && s["no_speech_timeout_ms"].is_number_integer())
            cfg.stt.no_speech_timeout_ms = s["no_speech_timeout_ms"];
        if (s.contains("blank_sentinel") && s["blank_sentinel"].is_string())
            cfg.stt.blank_sentinel = s["blank_sentinel"].get<std::string>();
    }

    if (j.contains("listening") && j["listening"].is_object()) {
        VoidResult applied = apply_listening(cfg.listening, j["listening"]);
        if (applied.is_error()) return applied.error();
    }

    if (j.contains("logging") && j["logging"].is_object()) {
        const auto& lg = j["logging"];
        if (lg.contains("level") && lg["level"].is_string()) cfg.logging.level = lg["level"].get<std::string>();
        if (lg.contains("file") && lg["file"].is_string()) cfg.logging.file = lg["file"].get<std::string>();
    }

    VoidResult valid = validate(cfg.listening);
    if (valid.is_error()) return valid.error();
    if (cfg.stt.step_ms <= 0) {
        return make_invalid_argument_error("stt.step_ms must be > 0");
    }
    if (cfg.stt.n_threads <= 0) {
        return make_invalid_argument_error("stt.n_threads must be > 0");
    }
    return cfg;
}

} // namespace

Result<AppConfig> AppConfig::parse(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::exception& e) {
        return make_config_error(std::string("Failed to parse config: ") + e.what());
    }
    try {
        return apply_json_to_config(j);
    } catch (const json::exception& e) {
        // Out-of-range or mistyped values inside a known key
        return make_config_error(std::string("Invalid config value: ") + e.what());
    }
}

Result<AppConfig> AppConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_config_error("Could not open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse(buffer.str());
    if (result.is_ok()) {
        Logger::info("Loaded config from " + path);
    }
    return result;
}

VoidResult AppConfig::save_to_file(const std::string& path) const {
    json j;
    j["audio"]["input_device"] = audio.input_device;

    j["stt"]["model_path"] = stt.model_path;
    j["stt"]["use_gpu"] = stt.use_gpu;
    j["stt"]["n_threads"] = stt.n_threads;
    j["stt"]["step_ms"] = stt.step_ms;
    j["stt"]["no_speech_timeout_ms"] = stt.no_speech_timeout_ms;
    j["stt"]["blank_sentinel"] = stt.blank_sentinel;

    j["listening"]["locale"] = listening.locale;
    j["listening"]["mode"] = mode_to_string(listening.mode);
    j["listening"]["silence_timeout_ms"] = listening.silence_timeout_ms;
    j["listening"]["frame_length"] = listening.frame_length;
    j["listening"]["sample_rate"] = listening.sample_rate;
    j["listening"]["enable_audio_buffer"] = listening.enable_audio_buffer;
    j["listening"]["use_on_device_recognizer"] = listening.use_on_device_recognizer;
    j["listening"]["mute_external_audio"] = listening.mute_external_audio;

    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;

    std::ofstream file(path);
    if (!file.is_open()) {
        return make_config_error("Could not write config file: " + path);
    }
    file << j.dump(2) << std::endl;
    if (!file.good()) {
        return make_config_error("Failed while writing config file: " + path);
    }
    return {};
}

} // namespace voicekit
