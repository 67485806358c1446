#include "transcription_window.h"
#include <algorithm>

namespace voicekit {

TranscriptionWindow::TranscriptionWindow(double input_rate, size_t capacity)
    : resampler_(input_rate), capacity_(std::max<size_t>(capacity, 1)), ring_(capacity_),
      begin_(0), end_(0), snapshot_end_(0), new_audio_(false) {}

void TranscriptionWindow::append(const float* samples, size_t count) {
    if (!samples || count == 0) return;

    resampled_.clear();
    resampler_.process(samples, count, resampled_);
    if (resampled_.empty()) return;

    // Only the newest capacity_ samples can survive this block
    size_t n = std::min(resampled_.size(), capacity_);
    const float* data = resampled_.data() + (resampled_.size() - n);
    uint64_t skipped = resampled_.size() - n;

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t start = end_ + skipped;
    size_t write_idx = static_cast<size_t>(start % capacity_);

    // First chunk: from write position to end of ring, then wrap
    size_t first_chunk = std::min(n, capacity_ - write_idx);
    std::copy(data, data + first_chunk, ring_.begin() + write_idx);
    if (n > first_chunk) {
        std::copy(data + first_chunk, data + n, ring_.begin());
    }

    end_ = start + n;
    if (end_ - begin_ > capacity_) {
        begin_ = end_ - capacity_;
    }
    new_audio_ = true;
}

bool TranscriptionWindow::snapshot(std::vector<float>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!new_audio_) return false;

    size_t n = static_cast<size_t>(end_ - begin_);
    size_t read_idx = static_cast<size_t>(begin_ % capacity_);
    out.resize(n);

    size_t first_chunk = std::min(n, capacity_ - read_idx);
    std::copy(ring_.begin() + read_idx, ring_.begin() + read_idx + first_chunk, out.begin());
    if (n > first_chunk) {
        std::copy(ring_.begin(), ring_.begin() + (n - first_chunk), out.begin() + first_chunk);
    }

    snapshot_end_ = end_;
    new_audio_ = false;
    return true;
}

size_t TranscriptionWindow::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshot_end_ <= begin_) return 0;
    size_t dropped = static_cast<size_t>(snapshot_end_ - begin_);
    begin_ = snapshot_end_;
    return dropped;
}

size_t TranscriptionWindow::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(end_ - begin_);
}

} // namespace voicekit
