/**
 * Recognition stream bookkeeping: resampling to 16 kHz, the transcription
 * window shared with the audio thread, and the pass-to-partial/commit policy.
 * No whisper model required.
 *
 * Run from build dir: ./test_stt_stream
 */

#include "common.h"
#include "resampler.h"
#include "transcription_window.h"
#include "utterance_tracker.h"
#include "test_helpers.h"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <thread>
#include <vector>

using namespace voicekit;

namespace {

std::vector<float> ramp(size_t n, float start = 0.0f, float step = 1.0f) {
    std::vector<float> v(n);
    for (size_t i = 0; i < n; i++) {
        v[i] = start + step * static_cast<float>(i);
    }
    return v;
}

bool is_contiguous(const std::vector<float>& v) {
    for (size_t i = 1; i < v.size(); i++) {
        if (v[i] != v[i - 1] + 1.0f) return false;
    }
    return true;
}

void test_resampler() {
    // Recognizer rate passes through
    {
        LinearResampler r(RECOGNIZER_SAMPLE_RATE);
        std::vector<float> out;
        std::vector<float> in = {0.1f, 0.2f, -0.3f};
        r.process(in.data(), in.size(), out);
        ASSERT(out == in);
    }

    // 32 kHz keeps every other sample, across block boundaries
    {
        LinearResampler r(32000.0);
        std::vector<float> out;
        std::vector<float> first = ramp(6);
        std::vector<float> second = ramp(4, 6.0f);
        r.process(first.data(), first.size(), out);
        ASSERT(out == std::vector<float>({0.0f, 2.0f, 4.0f}));
        r.process(second.data(), second.size(), out);
        ASSERT(out == std::vector<float>({0.0f, 2.0f, 4.0f, 6.0f, 8.0f}));
    }

    // 8 kHz interpolates, including between the previous block's last sample and the next block
    {
        LinearResampler r(8000.0);
        std::vector<float> out;
        std::vector<float> first = {0.0f, 1.0f};
        std::vector<float> second = {2.0f};
        r.process(first.data(), first.size(), out);
        ASSERT(out == std::vector<float>({0.0f, 0.5f, 1.0f}));
        r.process(second.data(), second.size(), out);
        ASSERT(out == std::vector<float>({0.0f, 0.5f, 1.0f, 1.5f, 2.0f}));
    }

    // Empty block is a no-op
    {
        LinearResampler r(48000.0);
        std::vector<float> out;
        r.process(nullptr, 0, out);
        ASSERT(out.empty());
    }

    // 48 kHz and 44.1 kHz: one second in gives one second out, in one call or in driver-sized blocks
    const double rates[] = {48000.0, 44100.0};
    for (double rate : rates) {
        const size_t n = static_cast<size_t>(rate);
        std::vector<float> in = ramp(n, 0.0f, 1.0f / static_cast<float>(n));

        LinearResampler whole(rate);
        std::vector<float> whole_out;
        whole.process(in.data(), in.size(), whole_out);
        ASSERT(whole_out.size() == 16000);

        LinearResampler chunked(rate);
        std::vector<float> chunked_out;
        for (size_t pos = 0; pos < n; pos += 512) {
            size_t count = std::min<size_t>(512, n - pos);
            chunked.process(in.data() + pos, count, chunked_out);
        }
        ASSERT(chunked_out.size() == whole_out.size());

        bool close = chunked_out.size() == whole_out.size();
        for (size_t i = 0; close && i < whole_out.size(); i++) {
            if (std::fabs(chunked_out[i] - whole_out[i]) > 1e-4f) close = false;
        }
        ASSERT(close);
        // Output sample k sits at input time k / 16000 s
        ASSERT(std::fabs(whole_out[8000] - 0.5f) < 1e-4f);
    }
}

void test_window_snapshot_and_commit() {
    TranscriptionWindow window(16000.0, 10);
    std::vector<float> out;
    ASSERT(window.capacity() == 10);
    ASSERT(!window.snapshot(out));

    std::vector<float> first = ramp(4, 1.0f);
    window.append(first.data(), first.size());
    ASSERT(window.size() == 4);
    ASSERT(window.snapshot(out));
    ASSERT(out == std::vector<float>({1.0f, 2.0f, 3.0f, 4.0f}));
    ASSERT(!window.snapshot(out));  // nothing new

    // Audio after the snapshot survives the commit
    std::vector<float> second = {5.0f, 6.0f};
    window.append(second.data(), second.size());
    ASSERT(window.commit() == 4);
    ASSERT(window.size() == 2);
    ASSERT(window.snapshot(out));
    ASSERT(out == std::vector<float>({5.0f, 6.0f}));

    // A second commit for the same snapshot drops only what is left of it
    ASSERT(window.commit() == 2);
    ASSERT(window.commit() == 0);
    ASSERT(window.size() == 0);
    ASSERT(!window.snapshot(out));
}

void test_window_commit_when_full() {
    // Full window, snapshot, then new audio overwrites the oldest samples
    TranscriptionWindow window(16000.0, 10);
    std::vector<float> out;
    std::vector<float> full = ramp(10);
    window.append(full.data(), full.size());
    ASSERT(window.snapshot(out));
    ASSERT(out.size() == 10);

    std::vector<float> fresh = {10.0f, 11.0f, 12.0f};
    window.append(fresh.data(), fresh.size());
    ASSERT(window.size() == 10);

    // Only the 7 snapshot samples still held are dropped; the 3 new ones stay
    ASSERT(window.commit() == 7);
    ASSERT(window.size() == 3);
    ASSERT(window.snapshot(out));
    ASSERT(out == fresh);
}

void test_window_commit_ignores_caller_padding() {
    TranscriptionWindow window(16000.0, 100);
    std::vector<float> out;
    std::vector<float> first = {1.0f, 2.0f};
    window.append(first.data(), first.size());
    ASSERT(window.snapshot(out));

    // The transcriber pads its copy with silence
    out.resize(50, 0.0f);

    std::vector<float> later = {3.0f, 4.0f, 5.0f};
    window.append(later.data(), later.size());
    ASSERT(window.commit() == 2);
    ASSERT(window.snapshot(out));
    ASSERT(out == later);
}

void test_window_wraps_and_resamples() {
    // Wraps around the ring in order
    {
        TranscriptionWindow window(16000.0, 4);
        std::vector<float> out;
        std::vector<float> a = {1.0f, 2.0f, 3.0f};
        std::vector<float> b = {4.0f, 5.0f, 6.0f};
        window.append(a.data(), a.size());
        window.append(b.data(), b.size());
        ASSERT(window.snapshot(out));
        ASSERT(out == std::vector<float>({3.0f, 4.0f, 5.0f, 6.0f}));
    }

    // A block larger than the window keeps its newest samples
    {
        TranscriptionWindow window(16000.0, 4);
        std::vector<float> out;
        std::vector<float> big = ramp(10);
        window.append(big.data(), big.size());
        ASSERT(window.size() == 4);
        ASSERT(window.snapshot(out));
        ASSERT(out == std::vector<float>({6.0f, 7.0f, 8.0f, 9.0f}));
    }

    // Captured rate is converted on the way in
    {
        TranscriptionWindow window(32000.0, 100);
        std::vector<float> out;
        std::vector<float> in = ramp(8);
        window.append(in.data(), in.size());
        ASSERT(window.snapshot(out));
        ASSERT(out == std::vector<float>({0.0f, 2.0f, 4.0f, 6.0f}));
    }

    // Snapshot reuses a buffer reserved to capacity
    {
        TranscriptionWindow window(16000.0, 64);
        std::vector<float> out;
        out.reserve(window.capacity());
        const float* storage = out.data();
        std::vector<float> in = ramp(64);
        window.append(in.data(), in.size());
        window.append(in.data(), in.size());
        ASSERT(window.snapshot(out));
        ASSERT(out.size() == 64);
        ASSERT(out.data() == storage);
    }
}

void test_window_concurrent_append() {
    const size_t capacity = 1000;
    const size_t total = 100000;
    TranscriptionWindow window(16000.0, capacity);
    std::atomic<bool> done{false};

    std::thread audio([&]() {
        std::vector<float> block(160);
        for (size_t pos = 0; pos < total; pos += block.size()) {
            for (size_t i = 0; i < block.size(); i++) {
                block[i] = static_cast<float>(pos + i);
            }
            window.append(block.data(), block.size());
        }
        done = true;
    });

    std::vector<float> out;
    out.reserve(capacity);
    bool ordered = true;
    bool bounded = true;
    float committed_up_to = -1.0f;
    float last_seen = -1.0f;
    int passes = 0;
    while (true) {
        bool finished = done.load();
        if (window.snapshot(out)) {
            if (out.size() > capacity) bounded = false;
            if (!is_contiguous(out)) ordered = false;
            if (!out.empty()) {
                if (out.front() <= committed_up_to) ordered = false;
                last_seen = out.back();
            }
            if (++passes % 3 == 0 && !out.empty()) {
                (void)window.commit();
                committed_up_to = out.back();
            }
        }
        if (finished) break;
        std::this_thread::yield();
    }
    audio.join();

    ASSERT(bounded);
    ASSERT(ordered);
    ASSERT(last_seen == static_cast<float>(total - 1));
    ASSERT(window.size() <= capacity);
}

void test_tracker_partials_and_commit() {
    STTConfig config;
    UtteranceTracker tracker(config);

    ASSERT(tracker.on_pass("") == PassAction::None);
    ASSERT(tracker.on_pass("   ") == PassAction::None);
    ASSERT(tracker.on_pass(" [BLANK_AUDIO] ") == PassAction::None);
    ASSERT(!tracker.heard_speech());

    ASSERT(tracker.on_pass("turn left") == PassAction::Partial);
    ASSERT(tracker.heard_speech());
    ASSERT(tracker.text() == "turn left");

    // Three more identical passes commit; blank passes in between do not count or reset
    ASSERT(tracker.on_pass("turn left") == PassAction::None);
    ASSERT(tracker.on_pass("turn left") == PassAction::None);
    ASSERT(tracker.on_pass("[BLANK_AUDIO]") == PassAction::None);
    ASSERT(tracker.on_pass("turn left") == PassAction::Commit);
    ASSERT(tracker.text().empty());

    // Same words again start a new utterance
    ASSERT(tracker.on_pass("turn left") == PassAction::Partial);

    // A change restarts the count
    ASSERT(tracker.on_pass("turn left") == PassAction::None);
    ASSERT(tracker.on_pass("turn left now") == PassAction::Partial);
    ASSERT(tracker.on_pass("turn left now") == PassAction::None);
    ASSERT(tracker.on_pass("turn left now") == PassAction::None);
    ASSERT(tracker.on_pass("turn left now") == PassAction::Commit);
}

void test_tracker_no_speech() {
    STTConfig config;
    config.no_speech_timeout_ms = 5000;
    {
        UtteranceTracker tracker(config);
        ASSERT(!tracker.no_speech_expired(0));
        ASSERT(!tracker.no_speech_expired(4999));
        ASSERT(tracker.on_pass("[BLANK_AUDIO]") == PassAction::None);
        ASSERT(tracker.no_speech_expired(5000));
    }
    {
        UtteranceTracker tracker(config);
        ASSERT(tracker.on_pass("hello") == PassAction::Partial);
        ASSERT(!tracker.no_speech_expired(60000));
    }

    // 0 disables the timeout
    config.no_speech_timeout_ms = 0;
    {
        UtteranceTracker tracker(config);
        ASSERT(!tracker.no_speech_expired(1000000));
    }

    // Empty sentinel: only whitespace is blank
    config.blank_sentinel = "";
    {
        UtteranceTracker tracker(config);
        ASSERT(tracker.on_pass("[BLANK_AUDIO]") == PassAction::Partial);
    }
}

} // namespace

int main() {
    test_resampler();
    test_window_snapshot_and_commit();
    test_window_commit_when_full();
    test_window_commit_ignores_caller_padding();
    test_window_wraps_and_resamples();
    test_window_concurrent_append();
    test_tracker_partials_and_commit();
    test_tracker_no_speech();

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "All STT stream tests passed.\n";
    return 0;
}
