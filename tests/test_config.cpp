/**
 * AppConfig parsing, ListeningOptions validation and string helpers.
 *
 * Run from build dir: ./test_config
 */

#include "config.h"
#include "logger.h"
#include "test_helpers.h"
#include "utils.h"
#include <cstdio>

using namespace voicekit;

int main() {
    // --- defaults ---
    {
        ListeningOptions options;
        ASSERT(options.locale == "en-US");
        ASSERT(options.mode == ListeningMode::Single);
        ASSERT(options.silence_timeout_ms == 1000);
        ASSERT(options.frame_length == 512);
        ASSERT(options.sample_rate == 16000.0);
        ASSERT(!options.enable_audio_buffer);
        ASSERT(!options.use_on_device_recognizer);
        ASSERT(!options.mute_external_audio);
        ASSERT(validate(options).is_ok());
    }

    // --- validate ---
    {
        ListeningOptions options;
        options.silence_timeout_ms = 0;
        ASSERT(validate(options).is_ok());
        options.silence_timeout_ms = -1;
        ASSERT(validate(options).error().type == ErrorType::InvalidArgument);

        options = ListeningOptions();
        options.frame_length = -4;
        ASSERT(validate(options).error().type == ErrorType::InvalidArgument);

        options = ListeningOptions();
        options.sample_rate = 0.0;
        ASSERT(validate(options).is_error());

        options = ListeningOptions();
        options.locale = "  ";
        ASSERT(validate(options).is_error());
    }

    // --- mode strings ---
    ASSERT(mode_from_string("single").value() == ListeningMode::Single);
    ASSERT(mode_from_string("Continuous").value() == ListeningMode::Continuous);
    ASSERT(mode_from_string(" continuous-and-stop ").value() == ListeningMode::ContinuousAndStop);
    ASSERT(mode_from_string("forever").error().type == ErrorType::InvalidArgument);
    ASSERT(std::string(mode_to_string(ListeningMode::ContinuousAndStop)) == "continuous-and-stop");

    // --- parse: partial document keeps defaults ---
    {
        auto cfg = AppConfig::parse(R"({
            "stt": { "model_path": "models/ggml-tiny.bin", "step_ms": 250 },
            "listening": { "mode": "continuous", "silence_timeout_ms": 1500, "enable_audio_buffer": true },
            "audio": { "input_device": 3 },
            "unknown_section": { "ignored": true }
        })");
        ASSERT(cfg.is_ok());
        if (cfg.is_ok()) {
            const AppConfig& c = cfg.value();
            ASSERT(c.stt.model_path == "models/ggml-tiny.bin");
            ASSERT(c.stt.step_ms == 250);
            ASSERT(c.stt.n_threads == 4);
            ASSERT(c.stt.blank_sentinel == "[BLANK_AUDIO]");
            ASSERT(c.listening.mode == ListeningMode::Continuous);
            ASSERT(c.listening.silence_timeout_ms == 1500);
            ASSERT(c.listening.enable_audio_buffer);
            ASSERT(c.listening.locale == "en-US");
            ASSERT(c.audio.input_device == "3");
            ASSERT(c.logging.level == "info");
        }
    }

    // --- parse errors ---
    ASSERT(AppConfig::parse("{ not json").error().type == ErrorType::ConfigError);
    ASSERT(AppConfig::parse("[1, 2]").error().type == ErrorType::ConfigError);
    ASSERT(AppConfig::parse(R"({"listening": {"mode": "sometimes"}})").error().type == ErrorType::InvalidArgument);
    ASSERT(AppConfig::parse(R"({"listening": {"frame_length": 0}})").error().type == ErrorType::InvalidArgument);
    ASSERT(AppConfig::parse(R"({"stt": {"step_ms": 0}})").error().type == ErrorType::InvalidArgument);
    ASSERT(AppConfig::load_from_file("/nonexistent/voicekit.json").error().type == ErrorType::ConfigError);

    // --- integer keys ignore fractional values and reject out-of-range ones ---
    {
        auto c = AppConfig::parse(R"({"listening": {"frame_length": 512.7, "silence_timeout_ms": 1e12}})");
        ASSERT(c.is_ok());
        if (c.is_ok()) {
            ASSERT(c.value().listening.frame_length == 512);
            ASSERT(c.value().listening.silence_timeout_ms == 1000);
        }
        auto whole = AppConfig::parse(R"({"listening": {"frame_length": 1024, "silence_timeout_ms": 0}})");
        ASSERT(whole.is_ok());
        if (whole.is_ok()) {
            ASSERT(whole.value().listening.frame_length == 1024);
            ASSERT(whole.value().listening.silence_timeout_ms == 0);
        }
        ASSERT(AppConfig::parse(R"({"listening": {"frame_length": 4294967808}})").error().type ==
               ErrorType::InvalidArgument);
        ASSERT(AppConfig::parse(R"({"listening": {"silence_timeout_ms": -4294967296}})").error().type ==
               ErrorType::InvalidArgument);
    }

    // --- save then load ---
    {
        AppConfig original;
        original.stt.model_path = "m.bin";
        original.listening.mode = ListeningMode::ContinuousAndStop;
        original.listening.sample_rate = 44100.0;
        original.listening.mute_external_audio = true;
        original.logging.level = "debug";

        std::string path = "test_config_roundtrip.json";
        ASSERT(original.save_to_file(path).is_ok());
        auto loaded = AppConfig::load_from_file(path);
        ASSERT(loaded.is_ok());
        if (loaded.is_ok()) {
            ASSERT(loaded.value().stt.model_path == "m.bin");
            ASSERT(loaded.value().listening.mode == ListeningMode::ContinuousAndStop);
            ASSERT(loaded.value().listening.sample_rate == 44100.0);
            ASSERT(loaded.value().listening.mute_external_audio);
            ASSERT(loaded.value().logging.level == "debug");
        }
        std::remove(path.c_str());
    }

    // --- utils ---
    ASSERT(utils::is_blank_transcript("", "[BLANK_AUDIO]"));
    ASSERT(utils::is_blank_transcript("  [BLANK_AUDIO]  ", "[BLANK_AUDIO]"));
    ASSERT(!utils::is_blank_transcript("hello", "[BLANK_AUDIO]"));
    ASSERT(utils::locale_language("en-US") == "en");
    ASSERT(utils::locale_language("pt_BR") == "pt");
    ASSERT(utils::locale_language("DE") == "de");

    // --- logger levels ---
    ASSERT(Logger::level_from_string("DEBUG") == LogLevel::DEBUG);
    ASSERT(Logger::level_from_string("warn") == LogLevel::WARN);
    ASSERT(Logger::level_from_string("bogus") == LogLevel::INFO);

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
