#pragma once

#include "audio_io.h"
#include "common.h"
#include "dispatch_queue.h"
#include "errors.h"
#include <atomic>
#include <functional>
#include <memory>

namespace voicekit {

/// Convert one normalized sample to PCM16: clamp to [-1, 1], scale, round. NaN maps to 0.
Sample to_pcm16(float sample);

/// Convert the first min(count, frame_length) samples. Short input yields a short frame.
AudioFrame convert_to_pcm16(const float* samples, size_t count, int frame_length);

/// Audio-thread consumer of every captured buffer (the recognition stream)
using ForwardCallback = std::function<void(const float* samples, size_t count)>;

/// Frames posted but not yet handled before new ones are dropped
constexpr uint32_t MAX_PENDING_FRAMES = 100;

/// Coordination-context consumer of converted frames
using FrameHandler = std::function<void(AudioFrame frame)>;

/**
 * @brief Tap on the live audio input feeding the recognizer and an optional frame observer
 *
 * For every driver buffer, on the audio thread:
 *  1. forward(samples, count) runs synchronously, always;
 *  2. only if a FrameHandler was given, up to frame_length samples are
 *     converted to PCM16 and posted to the executor. The post never waits;
 *     if the executor refuses the frame, or MAX_PENDING_FRAMES are already
 *     waiting, it is counted as dropped.
 */
class AudioTapPipeline {
public:
    AudioTapPipeline(AudioInput& input, IExecutor& executor);

    /**
     * @brief Destructor - removes the tap if still installed
     */
    ~AudioTapPipeline();

    // Non-copyable
    AudioTapPipeline(const AudioTapPipeline&) = delete;
    AudioTapPipeline& operator=(const AudioTapPipeline&) = delete;

    /**
     * @brief Attach to the audio input
     * @param on_frame Empty disables frame observation
     * @return InvalidArgument for bad parameters, InvalidState if already installed,
     *         or the input's error if the tap cannot be attached
     */
    VoidResult install(int frame_length, double sample_rate,
                       ForwardCallback forward, FrameHandler on_frame = nullptr);

    /**
     * @brief Detach from the audio input. Idempotent.
     */
    void remove();

    bool is_installed() const { return installed_; }

    /// Buffers seen since the last install()
    uint64_t buffers_delivered() const { return counters_->buffers.load(); }

    /// Frames refused by the executor or over the pending limit since the last install()
    uint64_t frames_dropped() const { return counters_->dropped.load(); }

    /// Frames posted and not yet handled
    uint32_t frames_pending() const { return counters_->pending.load(); }

private:
    struct Counters {
        std::atomic<uint64_t> buffers{0};
        std::atomic<uint64_t> dropped{0};
        std::atomic<uint32_t> pending{0};
    };

    AudioInput& input_;
    IExecutor& executor_;
    bool installed_;
    std::shared_ptr<Counters> counters_;
};

} // namespace voicekit
