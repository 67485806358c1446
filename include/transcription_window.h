#pragma once

#include "resampler.h"
#include <cstdint>
#include <mutex>
#include <vector>

namespace voicekit {

/**
 * @brief Fixed-capacity window of recognizer-rate audio shared by the audio
 * thread and a transcription worker
 *
 * append() runs on the audio thread. It resamples outside the lock, then
 * copies the block into a ring; once full, the oldest samples are overwritten.
 * No call shifts or reallocates the ring.
 *
 * Samples are addressed by absolute position since the window was created, so
 * commit() drops exactly what the last snapshot covered, however much append()
 * has overwritten since.
 */
class TranscriptionWindow {
public:
    TranscriptionWindow(double input_rate, size_t capacity);

    // Non-copyable
    TranscriptionWindow(const TranscriptionWindow&) = delete;
    TranscriptionWindow& operator=(const TranscriptionWindow&) = delete;

    /**
     * @brief Add captured samples at input_rate. Audio thread only.
     */
    void append(const float* samples, size_t count);

    /**
     * @brief Copy the retained audio into out, oldest first
     *
     * Reserve out to capacity() to keep the copy allocation-free.
     * @return false, leaving out untouched, if nothing arrived since the last snapshot
     */
    bool snapshot(std::vector<float>& out);

    /**
     * @brief Drop the audio covered by the last snapshot
     *
     * Audio appended after that snapshot is kept.
     * @return Number of samples dropped (0 if append() already overwrote them)
     */
    size_t commit();

    /// Samples currently retained
    size_t size() const;

    size_t capacity() const { return capacity_; }

private:
    // Audio thread only
    LinearResampler resampler_;
    std::vector<float> resampled_;

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<float> ring_;
    uint64_t begin_;         ///< Absolute position of the oldest retained sample
    uint64_t end_;           ///< Absolute position one past the newest sample
    uint64_t snapshot_end_;  ///< end_ at the last snapshot
    bool new_audio_;
};

} // namespace voicekit
