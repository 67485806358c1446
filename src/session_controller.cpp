#include "session_controller.h"
#include "audio_tap_pipeline.h"
#include "finalization_scheduler.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <future>

namespace voicekit {

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Listening: return "listening";
    }
    return "unknown";
}

namespace {

/**
 * Run fn on the executor's context and wait for its result.
 * Runs inline when already on the context.
 */
template <typename T>
T run_on_context(IExecutor& executor, std::function<T()> fn, T fallback) {
    if (executor.is_current()) {
        return fn();
    }

    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> future = promise->get_future();
    if (!executor.post([promise, fn]() { promise->set_value(fn()); })) {
        return fallback;
    }
    try {
        return future.get();
    } catch (const std::future_error& e) {
        // Task dropped by a stopping executor
        Logger::error(std::string("Coordination task abandoned: ") + e.what());
        return fallback;
    }
}

} // namespace

class SessionController::Impl : public std::enable_shared_from_this<SessionController::Impl> {
public:
    Impl(RecognitionEngine& engine, AudioInput& input, AudioRoutingBackend& routing, IExecutor& executor)
        : engine_(engine), executor_(executor), scheduler_(executor), tap_(input, executor),
          routing_(routing), state_(SessionState::Idle), session_id_(0) {}

    void attach() {
        std::weak_ptr<Impl> weak = weak_from_this();
        IExecutor* executor = &executor_;
        engine_.set_availability_callback([weak, executor](bool available) {
            bool queued = executor->post([weak, available]() {
                if (auto self = weak.lock()) {
                    LOG_SESSION(std::string("Recognizer ") + (available ? "available" : "unavailable"));
                    self->events_.emit(events::AvailabilityChanged{available});
                }
            });
            if (!queued) {
                Logger::warn("[Session] Availability change dropped, coordination context stopped");
            }
        });
    }

    void detach() {
        engine_.set_availability_callback(nullptr);
    }

    VoidResult start(const ListeningOptions& options) {
        if (state_ == SessionState::Listening) {
            Logger::warn("[Session] Already listening, ignoring start()");
            return make_invalid_state_error("Already listening");
        }

        VoidResult valid = validate(options);
        if (valid.is_error()) {
            report_error(valid.error());
            return valid;
        }

        LOG_SESSION("Starting (locale=" + options.locale + ", mode=" + mode_to_string(options.mode) +
                    ", silence_timeout_ms=" + std::to_string(options.silence_timeout_ms) + ")");

        const uint64_t id = ++session_id_;

        routing_.save();
        VoidResult routed = routing_.apply(options.mute_external_audio);
        if (routed.is_error()) {
            restore_routing_quietly();
            report_error(routed.error());
            return routed;
        }

        StreamRequest request;
        request.locale = options.locale;
        request.use_on_device_recognizer = options.use_on_device_recognizer;
        request.sample_rate = options.sample_rate;

        auto opened = engine_.open_stream(request, make_stream_callbacks(id));
        if (opened.is_error()) {
            restore_routing_quietly();
            report_error(opened.error());
            return opened.error();
        }
        stream_ = std::move(opened.value());

        RecognitionStream* stream = stream_.get();
        ForwardCallback forward = [stream](const float* samples, size_t count) {
            stream->append(samples, count);
        };

        FrameHandler on_frame;
        if (options.enable_audio_buffer) {
            std::weak_ptr<Impl> weak = weak_from_this();
            on_frame = [weak, id](AudioFrame frame) {
                if (auto self = weak.lock()) {
                    self->handle_frame(id, std::move(frame));
                }
            };
        }

        VoidResult tapped = tap_.install(options.frame_length, options.sample_rate,
                                         std::move(forward), std::move(on_frame));
        if (tapped.is_error()) {
            close_stream();
            restore_routing_quietly();
            report_error(tapped.error());
            return tapped;
        }

        options_ = options;
        transcript_.clear();
        state_ = SessionState::Listening;
        LOG_SESSION("Listening");
        events_.emit(events::ListeningStateChanged{true});
        return {};
    }

    VoidResult stop() {
        if (state_ != SessionState::Listening) {
            Logger::warn("[Session] Not listening, ignoring stop()");
            return make_invalid_state_error("Not listening");
        }
        LOG_SESSION("Stopping");
        teardown(true);
        return {};
    }

    /// Silent teardown used on destruction
    void shutdown() {
        if (state_ == SessionState::Listening) {
            teardown(false);
        }
    }

    bool is_available() const {
        return engine_.is_available();
    }

    std::vector<std::string> supported_locales() const {
        return engine_.supported_locales();
    }

    SessionState state() const {
        return state_;
    }

    std::string transcript() const {
        return transcript_;
    }

    SubscriptionId subscribe(EventCallback callback) {
        return events_.subscribe(std::move(callback));
    }

    bool unsubscribe(SubscriptionId id) {
        return events_.unsubscribe(id);
    }

    IExecutor& executor() { return executor_; }

private:
    bool is_active(uint64_t id) const {
        return state_ == SessionState::Listening && id == session_id_;
    }

    StreamCallbacks make_stream_callbacks(uint64_t id) {
        std::weak_ptr<Impl> weak = weak_from_this();
        IExecutor* executor = &executor_;

        StreamCallbacks callbacks;
        callbacks.on_partial = [weak, executor, id](const std::string& text) {
            bool queued = executor->post([weak, id, text]() {
                if (auto self = weak.lock()) {
                    self->handle_partial(id, text);
                }
            });
            if (!queued) {
                Logger::warn("[Session] Partial result dropped, coordination context stopped");
            }
        };
        callbacks.on_error = [weak, executor, id](const StreamError& error) {
            bool queued = executor->post([weak, id, error]() {
                if (auto self = weak.lock()) {
                    self->handle_stream_error(id, error);
                }
            });
            if (!queued) {
                Logger::warn("[Session] Stream error dropped, coordination context stopped: " + error.message);
            }
        };
        return callbacks;
    }

    void handle_partial(uint64_t id, const std::string& text) {
        if (!is_active(id)) {
            Logger::debug("[Session] Discarding partial result from an ended session");
            return;
        }
        if (utils::is_empty_or_whitespace(text)) {
            return;
        }

        transcript_ = text;
        Logger::debug("[Session] Partial: " + text);

        std::weak_ptr<Impl> weak = weak_from_this();
        scheduler_.arm(options_.silence_timeout_ms, [weak, id]() {
            if (auto self = weak.lock()) {
                self->finalize(id);
            }
        });

        events_.emit(events::PartialResult{text});
    }

    void finalize(uint64_t id) {
        if (!is_active(id)) {
            return;
        }

        std::string text = transcript_;
        LOG_SESSION("Final result: " + text);
        events_.emit(events::FinalResult{text});

        if (options_.mode == ListeningMode::Continuous) {
            // Next partial rearms the timer
            return;
        }
        // A subscriber may already have stopped the session
        if (is_active(id)) {
            teardown(true);
        }
    }

    void handle_stream_error(uint64_t id, const StreamError& error) {
        if (!is_active(id)) {
            return;
        }

        if (error.kind == StreamErrorKind::NoSpeech) {
            LOG_SESSION("No speech detected");
            teardown(true);
            return;
        }

        Logger::error("[Session] Recognition failed: " + error.message);
        events_.emit(events::ErrorOccurred{make_engine_error(error.message)});
        if (is_active(id)) {
            teardown(true);
        }
    }

    void handle_frame(uint64_t id, AudioFrame frame) {
        if (!is_active(id)) {
            return;
        }
        events_.emit(events::AudioBuffer{std::move(frame)});
    }

    void teardown(bool emit_events) {
        scheduler_.cancel();
        tap_.remove();
        close_stream();
        VoidResult restored = routing_.restore();

        transcript_.clear();
        state_ = SessionState::Idle;
        LOG_SESSION("Idle");

        if (restored.is_error()) {
            Logger::error("[Session] Failed to restore audio routing: " + restored.error().message);
        }
        if (!emit_events) {
            return;
        }
        events_.emit(events::ListeningStateChanged{false});
        if (restored.is_error()) {
            events_.emit(events::ErrorOccurred{restored.error()});
        }
    }

    void close_stream() {
        if (!stream_) {
            return;
        }
        stream_->end_audio();
        stream_->cancel();
        stream_.reset();
    }

    void restore_routing_quietly() {
        VoidResult restored = routing_.restore();
        if (restored.is_error()) {
            Logger::error("[Session] Failed to restore audio routing during rollback: " +
                          restored.error().message);
        }
    }

    void report_error(const Error& error) {
        Logger::error("[Session] " + std::string(error_type_to_string(error.type)) + ": " + error.message);
        events_.emit(events::ErrorOccurred{error});
    }

    RecognitionEngine& engine_;
    IExecutor& executor_;
    EventBus events_;
    FinalizationScheduler scheduler_;
    AudioTapPipeline tap_;
    AudioRoutingGuard routing_;

    std::atomic<SessionState> state_;
    uint64_t session_id_;
    ListeningOptions options_;
    std::string transcript_;
    std::unique_ptr<RecognitionStream> stream_;
};

SessionController::SessionController(RecognitionEngine& engine, AudioInput& input,
                                     AudioRoutingBackend& routing, IExecutor& executor)
    : pimpl_(std::make_shared<Impl>(engine, input, routing, executor)) {
    pimpl_->attach();
}

SessionController::~SessionController() {
    pimpl_->detach();
    std::shared_ptr<Impl> impl = pimpl_;
    run_on_context<bool>(impl->executor(), [impl]() {
        impl->shutdown();
        return true;
    }, false);
    if (impl->state() == SessionState::Listening) {
        // Executor already stopped; tear down here
        impl->shutdown();
    }
}

VoidResult SessionController::start(const ListeningOptions& options) {
    std::shared_ptr<Impl> impl = pimpl_;
    return run_on_context<VoidResult>(impl->executor(), [impl, options]() {
        return impl->start(options);
    }, make_unknown_error("Coordination context is not running"));
}

VoidResult SessionController::stop() {
    std::shared_ptr<Impl> impl = pimpl_;
    return run_on_context<VoidResult>(impl->executor(), [impl]() {
        return impl->stop();
    }, make_unknown_error("Coordination context is not running"));
}

bool SessionController::is_available() const {
    return pimpl_->is_available();
}

std::vector<std::string> SessionController::supported_locales() const {
    return pimpl_->supported_locales();
}

SessionState SessionController::state() const {
    return pimpl_->state();
}

std::string SessionController::transcript() const {
    std::shared_ptr<Impl> impl = pimpl_;
    return run_on_context<std::string>(impl->executor(), [impl]() {
        return impl->transcript();
    }, std::string());
}

SubscriptionId SessionController::subscribe(EventCallback callback) {
    return pimpl_->subscribe(std::move(callback));
}

bool SessionController::unsubscribe(SubscriptionId id) {
    return pimpl_->unsubscribe(id);
}

} // namespace voicekit
