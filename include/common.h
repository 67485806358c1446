#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace voicekit {

// Audio types
using Sample = int16_t;
using AudioFrame = std::vector<Sample>;   ///< PCM16 frame delivered to observers

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = Clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

// Listening defaults
constexpr const char* DEFAULT_LOCALE = "en-US";
constexpr int DEFAULT_SILENCE_TIMEOUT_MS = 1000;
constexpr int DEFAULT_FRAME_LENGTH = 512;
constexpr double DEFAULT_SAMPLE_RATE = 16000.0;

// Recognizer input is 16 kHz mono
constexpr int RECOGNIZER_SAMPLE_RATE = 16000;

// PCM16 conversion
constexpr int PCM16_POSITIVE_SCALE = 32767;
constexpr int PCM16_NEGATIVE_SCALE = 32768;

} // namespace voicekit
