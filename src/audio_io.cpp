#include "audio_io.h"
#include "logger.h"
#include <portaudio.h>
#include <atomic>
#include <sstream>

namespace voicekit {

class PortAudioInput::Impl {
public:
    explicit Impl(const std::string& input_device)
        : input_device_(input_device), stream_(nullptr), overflow_count_(0) {}

    ~Impl() {
        remove_tap();
    }

    VoidResult install_tap(int frame_length, double sample_rate, InputBufferCallback callback) {
        if (stream_) {
            return make_invalid_state_error("Input tap already installed");
        }
        if (!callback) {
            return make_invalid_argument_error("Input tap callback must be set");
        }

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return fail("PortAudio init error: " + std::string(Pa_GetErrorText(err)), false);
        }

        int input_idx = find_device(input_device_);
        if (input_idx < 0) {
            return fail("Input device not found: " + input_device_, true);
        }

        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        if (!input_info || input_info->maxInputChannels == 0) {
            return fail("Device '" + input_device_ + "' has no input channels", true);
        }

        std::ostringstream dev_oss;
        dev_oss << "Using input device: [" << input_idx << "] " << input_info->name
                << " @ " << sample_rate << " Hz, " << frame_length << " frames/buffer";
        Logger::info(dev_oss.str());

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paFloat32;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_IsFormatSupported(&input_params, nullptr, sample_rate);
        if (err != paFormatIsSupported) {
            std::ostringstream oss;
            oss << "Input format not supported at " << sample_rate << " Hz: " << Pa_GetErrorText(err);
            return fail(oss.str(), true);
        }

        callback_ = std::move(callback);
        overflow_count_ = 0;

        err = Pa_OpenStream(&stream_, &input_params, nullptr, sample_rate,
                            static_cast<unsigned long>(frame_length), paClipOff, input_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            callback_ = nullptr;
            return fail("Failed to open input stream: " + std::string(Pa_GetErrorText(err)), true);
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            std::ostringstream err_oss;
            err_oss << "Failed to start input stream: " << Pa_GetErrorText(err)
                    << " (Error code: " << err << ")";
            if (err == paUnanticipatedHostError) {
                err_oss << "; check that this process has microphone access";
            }
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            callback_ = nullptr;
            return fail(err_oss.str(), true);
        }

        LOG_AUDIO("Input tap installed");
        return {};
    }

    void remove_tap() {
        if (!stream_) {
            return;
        }

        // Pa_StopStream returns only after the last callback has completed
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            Logger::warn("Failed to stop input stream: " + std::string(Pa_GetErrorText(err)));
            Pa_AbortStream(stream_);
        }
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        callback_ = nullptr;
        Pa_Terminate();

        if (overflow_count_ > 0) {
            Logger::warn("Input overflowed " + std::to_string(overflow_count_.load()) + " time(s) during capture");
        }
        LOG_AUDIO("Input tap removed");
    }

    bool is_tap_installed() const {
        return stream_ != nullptr;
    }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }

        int num_devices = Pa_GetDeviceCount();
        int default_idx = Pa_GetDefaultInputDevice();
        Logger::info("Available input devices:");

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info || info->maxInputChannels == 0) {
                continue;
            }
            std::ostringstream oss;
            oss << "  [" << i << "] " << info->name
                << " (IN:" << info->maxInputChannels
                << ", " << info->defaultSampleRate << " Hz)";
            if (i == default_idx) oss << " *default";
            Logger::info(oss.str());
        }

        Pa_Terminate();
    }

private:
    VoidResult fail(const std::string& message, bool terminate) {
        Logger::error(message);
        if (terminate) {
            Pa_Terminate();
        }
        return make_audio_device_error(message);
    }

    int find_device(const std::string& name) {
        int num_devices = Pa_GetDeviceCount();

        if (name == "default" || name.empty()) {
            int default_idx = Pa_GetDefaultInputDevice();
            if (default_idx != paNoDevice) {
                return default_idx;
            }
            return -1;
        }

        // Try parsing as numeric device index
        try {
            size_t consumed = 0;
            int device_idx = std::stoi(name, &consumed);
            if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices) {
                return device_idx;
            }
        } catch (const std::exception&) {
            // Not a number, continue to name matching
        }

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (info && info->name == name && info->maxInputChannels > 0) {
                return i;
            }
        }

        return -1;
    }

    static int input_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
        (void)output;
        (void)time_info;
        Impl* self = static_cast<Impl*>(user_data);

        if (status_flags & paInputOverflow) {
            self->overflow_count_.fetch_add(1, std::memory_order_relaxed);
        }

        if (input && self->callback_) {
            self->callback_(static_cast<const float*>(input), static_cast<size_t>(frame_count));
        }
        return paContinue;
    }

    std::string input_device_;
    PaStream* stream_;
    InputBufferCallback callback_;
    std::atomic<unsigned int> overflow_count_;
};

PortAudioInput::PortAudioInput(const std::string& input_device)
    : pimpl_(std::make_unique<Impl>(input_device)) {}

PortAudioInput::~PortAudioInput() = default;

VoidResult PortAudioInput::install_tap(int frame_length, double sample_rate, InputBufferCallback callback) {
    return pimpl_->install_tap(frame_length, sample_rate, std::move(callback));
}

void PortAudioInput::remove_tap() {
    pimpl_->remove_tap();
}

bool PortAudioInput::is_tap_installed() const {
    return pimpl_->is_tap_installed();
}

void PortAudioInput::list_devices() {
    Impl::list_devices();
}

} // namespace voicekit
