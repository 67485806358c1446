#pragma once

#include "common.h"
#include "errors.h"
#include <string>

namespace voicekit {

/**
 * @brief What happens after a final result is emitted
 */
enum class ListeningMode {
    Single,             ///< Stop after the first utterance
    Continuous,         ///< Keep listening until stopped or an error occurs
    ContinuousAndStop   ///< Listen through pauses, stop after the first final result
};

/// "single" | "continuous" | "continuous-and-stop"
const char* mode_to_string(ListeningMode mode);
Result<ListeningMode> mode_from_string(const std::string& name);

/**
 * @brief Per-session options, captured once by SessionController::start
 */
struct ListeningOptions {
    std::string locale = DEFAULT_LOCALE;
    ListeningMode mode = ListeningMode::Single;
    int silence_timeout_ms = DEFAULT_SILENCE_TIMEOUT_MS;  ///< Quiet gap after the last partial before finalizing
    int frame_length = DEFAULT_FRAME_LENGTH;              ///< Samples per tap buffer and per observer frame
    double sample_rate = DEFAULT_SAMPLE_RATE;             ///< Capture rate in Hz
    bool enable_audio_buffer = false;                     ///< Emit AudioBuffer events
    bool use_on_device_recognizer = false;
    bool mute_external_audio = false;                     ///< Mute (not just duck) other audio while capturing
};

/**
 * @brief Check option bounds
 * @return InvalidArgument describing the first offending field
 */
VoidResult validate(const ListeningOptions& options);

struct AudioConfig {
    std::string input_device = "default";  ///< "default", a device index, or an exact device name
};

struct STTConfig {
    std::string model_path;
    bool use_gpu = true;
    int n_threads = 4;
    int step_ms = 500;                    ///< Interval between partial transcriptions
    int no_speech_timeout_ms = 5000;      ///< Report NoSpeech if nothing is recognized within this window (0 = never)
    std::string blank_sentinel = "[BLANK_AUDIO]";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;  ///< Empty = console only
};

struct AppConfig {
    AudioConfig audio;
    STTConfig stt;
    ListeningOptions listening;
    LoggingConfig logging;

    /**
     * @brief Load configuration from a JSON file
     *
     * Missing sections and keys keep their defaults; unknown keys are ignored.
     * @return ConfigError if the file cannot be read or parsed, InvalidArgument for bad values
     */
    static Result<AppConfig> load_from_file(const std::string& path);

    /**
     * @brief Parse configuration from a JSON document held in memory
     */
    static Result<AppConfig> parse(const std::string& json_text);

    VoidResult save_to_file(const std::string& path) const;
};

} // namespace voicekit
