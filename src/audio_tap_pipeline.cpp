#include "audio_tap_pipeline.h"
#include "logger.h"
#include <algorithm>
#include <cmath>

namespace voicekit {

Sample to_pcm16(float sample) {
    if (std::isnan(sample)) {
        return 0;
    }
    float clamped = std::max(-1.0f, std::min(1.0f, sample));
    // Asymmetric scale so that -1.0 reaches -32768 and 1.0 reaches 32767
    float scaled = clamped >= 0.0f ? clamped * PCM16_POSITIVE_SCALE
                                   : clamped * PCM16_NEGATIVE_SCALE;
    return static_cast<Sample>(std::lround(scaled));
}

AudioFrame convert_to_pcm16(const float* samples, size_t count, int frame_length) {
    AudioFrame frame;
    if (!samples || frame_length <= 0) {
        return frame;
    }
    size_t n = std::min(count, static_cast<size_t>(frame_length));
    frame.resize(n);
    for (size_t i = 0; i < n; i++) {
        frame[i] = to_pcm16(samples[i]);
    }
    return frame;
}

AudioTapPipeline::AudioTapPipeline(AudioInput& input, IExecutor& executor)
    : input_(input), executor_(executor), installed_(false),
      counters_(std::make_shared<Counters>()) {}

AudioTapPipeline::~AudioTapPipeline() {
    remove();
}

VoidResult AudioTapPipeline::install(int frame_length, double sample_rate,
                                     ForwardCallback forward, FrameHandler on_frame) {
    if (installed_) {
        return make_invalid_state_error("Audio tap already installed");
    }
    if (frame_length <= 0 || !(sample_rate > 0.0)) {
        return make_invalid_argument_error("Audio tap needs frame_length > 0 and sample_rate > 0");
    }
    if (!forward) {
        return make_invalid_argument_error("Audio tap needs a forward callback");
    }

    counters_ = std::make_shared<Counters>();
    std::shared_ptr<Counters> counters = counters_;
    IExecutor* executor = &executor_;
    const bool observe = static_cast<bool>(on_frame);

    InputBufferCallback callback =
        [forward, on_frame, observe, frame_length, counters, executor](const float* samples, size_t count) {
            counters->buffers.fetch_add(1, std::memory_order_relaxed);

            // Recognizer first: observation must never delay it
            forward(samples, count);

            if (!observe) {
                return;
            }
            if (counters->pending.fetch_add(1, std::memory_order_acq_rel) >= MAX_PENDING_FRAMES) {
                // Coordination context is behind; drop instead of queueing without bound
                counters->pending.fetch_sub(1, std::memory_order_acq_rel);
                counters->dropped.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            AudioFrame frame = convert_to_pcm16(samples, count, frame_length);
            bool queued = executor->post([on_frame, counters, frame = std::move(frame)]() mutable {
                counters->pending.fetch_sub(1, std::memory_order_acq_rel);
                on_frame(std::move(frame));
            });
            if (!queued) {
                counters->pending.fetch_sub(1, std::memory_order_acq_rel);
                counters->dropped.fetch_add(1, std::memory_order_relaxed);
            }
        };

    VoidResult result = input_.install_tap(frame_length, sample_rate, std::move(callback));
    if (result.is_error()) {
        Logger::error("Failed to install audio tap: " + result.error().message);
        return result;
    }

    installed_ = true;
    LOG_TAP("Installed (frame_length=" + std::to_string(frame_length) +
            ", frames " + std::string(observe ? "observed" : "not observed") + ")");
    return {};
}

void AudioTapPipeline::remove() {
    if (!installed_) {
        return;
    }
    input_.remove_tap();
    installed_ = false;

    if (counters_->dropped > 0) {
        Logger::warn("Audio tap dropped " + std::to_string(counters_->dropped.load()) + " frame(s)");
    }
    LOG_TAP("Removed after " + std::to_string(counters_->buffers.load()) + " buffer(s)");
}

} // namespace voicekit
