#include "audio_io.h"
#include "audio_routing.h"
#include "config.h"
#include "dispatch_queue.h"
#include "logger.h"
#include "session_controller.h"
#include "stt_engine.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace voicekit {

static std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
    (void)signal;
    g_shutdown_requested = true;
}

static void print_event(const VoiceEvent& event) {
    if (auto* e = std::get_if<events::PartialResult>(&event)) {
        std::cout << "[partial] " << e->text << std::endl;
    } else if (auto* e = std::get_if<events::FinalResult>(&event)) {
        std::cout << "[result] " << e->text << std::endl;
    } else if (auto* e = std::get_if<events::ListeningStateChanged>(&event)) {
        std::cout << (e->listening ? "[listening]" : "[stopped]") << std::endl;
    } else if (auto* e = std::get_if<events::AvailabilityChanged>(&event)) {
        std::cout << "[available] " << (e->available ? "yes" : "no") << std::endl;
    } else if (auto* e = std::get_if<events::ErrorOccurred>(&event)) {
        std::cout << "[error] " << error_type_to_string(e->error.type) << ": " << e->error.message << std::endl;
    } else if (auto* e = std::get_if<events::AudioBuffer>(&event)) {
        Logger::debug("[audio-buffer] " + std::to_string(e->frame.size()) + " samples");
    }
}

} // namespace voicekit

int main(int argc, char* argv[]) {
    // Initialize logger (default to INFO level, console output)
    voicekit::Logger::initialize(voicekit::LogLevel::INFO);

    std::string arg = argc > 1 ? argv[1] : "";

    if (arg == "--list-devices") {
        voicekit::PortAudioInput::list_devices();
        voicekit::Logger::shutdown();
        return 0;
    }

    if (arg == "--list-locales") {
        voicekit::WhisperRecognitionEngine engine{voicekit::STTConfig()};
        for (const auto& locale : engine.supported_locales()) {
            std::cout << locale << "\n";
        }
        voicekit::Logger::shutdown();
        return 0;
    }

    std::string config_path = arg.empty() ? "config/config.json" : arg;
    auto loaded = voicekit::AppConfig::load_from_file(config_path);
    if (loaded.is_error()) {
        voicekit::Logger::error("Failed to load config: " + loaded.error().message);
        voicekit::Logger::shutdown();
        return 1;
    }
    const voicekit::AppConfig& config = loaded.value();

    voicekit::Logger::shutdown();
    voicekit::Logger::initialize(voicekit::Logger::level_from_string(config.logging.level), config.logging.file);

    voicekit::WhisperRecognitionEngine engine(config.stt);
    voicekit::PortAudioInput input(config.audio.input_device);
    voicekit::DispatchQueue queue("coordination");

    int exit_code = 0;
    {
        voicekit::SessionController controller(engine, input, voicekit::SharedAudioSession::instance(), queue);
        controller.subscribe(voicekit::print_event);

        auto model = engine.load_model();
        if (model.is_error()) {
            voicekit::Logger::error(model.error().message);
            exit_code = 1;
        } else {
            std::signal(SIGINT, voicekit::signal_handler);
            std::signal(SIGTERM, voicekit::signal_handler);

            auto started = controller.start(config.listening);
            if (started.is_error()) {
                exit_code = 1;
            } else {
                while (!voicekit::g_shutdown_requested &&
                       controller.state() == voicekit::SessionState::Listening) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
                if (controller.state() == voicekit::SessionState::Listening) {
                    voicekit::Logger::info("Shutting down...");
                    auto stopped = controller.stop();
                    if (stopped.is_error()) {
                        voicekit::Logger::warn("stop(): " + stopped.error().message);
                    }
                }
            }
        }
    }

    queue.shutdown();
    voicekit::Logger::shutdown();
    return exit_code;
}
