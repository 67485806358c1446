#include "stt_engine.h"
#include "logger.h"
#include "transcription_window.h"
#include "utils.h"
#include "utterance_tracker.h"
#include <whisper.h>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <thread>

namespace voicekit {

namespace {

/// Whisper only looks at the last 30 s
constexpr size_t MAX_WINDOW_SAMPLES = 30 * RECOGNIZER_SAMPLE_RATE;

/// whisper_full() ignores input shorter than one second
constexpr size_t MIN_INFERENCE_SAMPLES = RECOGNIZER_SAMPLE_RATE + RECOGNIZER_SAMPLE_RATE / 10;

struct WhisperModel {
    explicit WhisperModel(whisper_context* context) : ctx(context) {}
    ~WhisperModel() {
        if (ctx) {
            whisper_free(ctx);
        }
    }

    whisper_context* ctx;
    std::mutex inference_mutex;
};

class WhisperStream : public RecognitionStream {
public:
    WhisperStream(std::shared_ptr<WhisperModel> model, const STTConfig& config,
                  std::string language, double sample_rate, StreamCallbacks callbacks)
        : model_(std::move(model)), config_(config), language_(std::move(language)),
          callbacks_(std::move(callbacks)), window_(sample_rate, MAX_WINDOW_SAMPLES),
          tracker_(config), ended_(false), cancelled_(false) {
        pcm_.reserve(MAX_WINDOW_SAMPLES);
        worker_ = std::thread(&WhisperStream::run, this);
    }

    ~WhisperStream() override {
        cancel();
    }

    void append(const float* samples, size_t count) override {
        if (ended_ || cancelled_) {
            return;
        }
        window_.append(samples, count);
    }

    void end_audio() override {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            ended_ = true;
        }
        cv_.notify_all();
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            if (std::this_thread::get_id() == worker_.get_id()) {
                worker_.detach();
            } else {
                worker_.join();
            }
        }
    }

private:
    void run() {
        const TimePoint started = Clock::now();

        while (true) {
            bool ended = false;
            {
                std::unique_lock<std::mutex> lock(wake_mutex_);
                cv_.wait_for(lock, Duration(config_.step_ms), [this] { return cancelled_ || ended_; });
                if (cancelled_) {
                    return;
                }
                ended = ended_;
            }

            if (window_.snapshot(pcm_) && !pcm_.empty()) {
                std::string text;
                std::string error;
                if (!transcribe(text, error)) {
                    report_error(StreamErrorKind::Engine, error);
                    return;
                }

                switch (tracker_.on_pass(text)) {
                    case PassAction::Partial:
                        report_partial(text);
                        break;
                    case PassAction::Commit: {
                        size_t dropped = window_.commit();
                        LOG_STT("Utterance committed (" + std::to_string(dropped) + " samples)");
                        break;
                    }
                    case PassAction::None:
                        break;
                }
            }

            if (ended) {
                return;
            }

            if (tracker_.no_speech_expired(ms_since(started))) {
                report_error(StreamErrorKind::NoSpeech, "No speech detected");
                return;
            }
        }
    }

    /// Transcribe pcm_; short input is padded with silence, which the window never sees
    bool transcribe(std::string& text, std::string& error) {
        if (pcm_.size() < MIN_INFERENCE_SAMPLES) {
            pcm_.resize(MIN_INFERENCE_SAMPLES, 0.0f);
        }

        whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.print_timestamps = false;
        params.translate = false;
        params.language = language_.c_str();
        params.n_threads = config_.n_threads;
        params.no_context = true;
        params.single_segment = true;

        auto start = Clock::now();
        std::lock_guard<std::mutex> lock(model_->inference_mutex);
        int ret = whisper_full(model_->ctx, params, pcm_.data(), static_cast<int>(pcm_.size()));
        if (ret != 0) {
            std::ostringstream oss;
            oss << "whisper_full failed: " << ret;
            error = oss.str();
            return false;
        }

        int n_segments = whisper_full_n_segments(model_->ctx);
        for (int i = 0; i < n_segments; i++) {
            const char* seg_text = whisper_full_get_segment_text(model_->ctx, i);
            if (seg_text) {
                text += seg_text;
            }
        }
        utils::trim(text);

        Logger::debug("[STT] Pass over " + std::to_string(pcm_.size()) + " samples took " +
                      std::to_string(ms_since(start)) + " ms");
        return true;
    }

    void report_partial(const std::string& text) {
        if (callbacks_.on_partial) {
            callbacks_.on_partial(text);
        }
    }

    void report_error(StreamErrorKind kind, const std::string& message) {
        LOG_STT("Stream error: " + message);
        if (callbacks_.on_error) {
            StreamError error;
            error.kind = kind;
            error.message = message;
            callbacks_.on_error(error);
        }
    }

    std::shared_ptr<WhisperModel> model_;
    STTConfig config_;
    std::string language_;
    StreamCallbacks callbacks_;
    TranscriptionWindow window_;

    // Worker thread only
    UtteranceTracker tracker_;
    std::vector<float> pcm_;

    std::mutex wake_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> ended_;
    std::atomic<bool> cancelled_;

    std::thread worker_;
};

} // namespace

class WhisperRecognitionEngine::Impl {
public:
    explicit Impl(const STTConfig& config) : config_(config) {}

    VoidResult load_model() {
        if (config_.model_path.empty()) {
            LOG_STT("No model path specified");
            return make_engine_error("No whisper model path specified");
        }

        whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        whisper_context* ctx = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
        if (!ctx) {
            LOG_STT("Failed to load whisper model: " + config_.model_path);
            return make_engine_error("Failed to load whisper model: " + config_.model_path);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            model_ = std::make_shared<WhisperModel>(ctx);
        }
        LOG_STT("Model loaded successfully");
        notify_availability(true);
        return {};
    }

    void unload() {
        bool was_loaded;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            was_loaded = static_cast<bool>(model_);
            model_.reset();
        }
        if (was_loaded) {
            LOG_STT("Model unloaded");
            notify_availability(false);
        }
    }

    bool is_available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(model_);
    }

    void set_availability_callback(std::function<void(bool)> callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        availability_callback_ = std::move(callback);
    }

    Result<std::unique_ptr<RecognitionStream>> open_stream(const StreamRequest& request,
                                                           StreamCallbacks callbacks) {
        std::shared_ptr<WhisperModel> model;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            model = model_;
        }
        if (!model) {
            return make_engine_error("Speech recognizer is not available (model not loaded)");
        }
        if (!(request.sample_rate > 0.0)) {
            return make_engine_error("Invalid stream sample rate");
        }

        std::string language = utils::locale_language(request.locale);
        if (whisper_lang_id(language.c_str()) < 0) {
            return make_engine_error("Unsupported locale: " + request.locale);
        }
        if (request.use_on_device_recognizer) {
            LOG_STT("On-device recognition requested; whisper always runs locally");
        }

        LOG_STT("Opening stream (language=" + language + ")");
        return std::unique_ptr<RecognitionStream>(
            new WhisperStream(model, config_, language, request.sample_rate, std::move(callbacks)));
    }

    std::vector<std::string> supported_locales() const {
        std::vector<std::string> locales;
        int max_id = whisper_lang_max_id();
        for (int i = 0; i <= max_id; i++) {
            const char* code = whisper_lang_str(i);
            if (code) {
                locales.emplace_back(code);
            }
        }
        return locales;
    }

private:
    void notify_availability(bool available) {
        std::function<void(bool)> callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = availability_callback_;
        }
        if (callback) {
            callback(available);
        }
    }

    STTConfig config_;
    mutable std::mutex mutex_;
    std::shared_ptr<WhisperModel> model_;
    std::function<void(bool)> availability_callback_;
};

WhisperRecognitionEngine::WhisperRecognitionEngine(const STTConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

WhisperRecognitionEngine::~WhisperRecognitionEngine() = default;

VoidResult WhisperRecognitionEngine::load_model() {
    return pimpl_->load_model();
}

void WhisperRecognitionEngine::unload() {
    pimpl_->unload();
}

bool WhisperRecognitionEngine::is_available() const {
    return pimpl_->is_available();
}

void WhisperRecognitionEngine::set_availability_callback(std::function<void(bool available)> callback) {
    pimpl_->set_availability_callback(std::move(callback));
}

Result<std::unique_ptr<RecognitionStream>> WhisperRecognitionEngine::open_stream(const StreamRequest& request,
                                                                                 StreamCallbacks callbacks) {
    return pimpl_->open_stream(request, std::move(callbacks));
}

std::vector<std::string> WhisperRecognitionEngine::supported_locales() const {
    return pimpl_->supported_locales();
}

} // namespace voicekit
