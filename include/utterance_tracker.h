#pragma once

#include "config.h"
#include <cstdint>
#include <string>

namespace voicekit {

/// Passes with identical text before an utterance is committed
constexpr int UTTERANCE_COMMIT_PASSES = 3;

/// What a transcription pass asks the stream to do
enum class PassAction {
    None,     ///< Blank output or text still settling
    Partial,  ///< Text changed: report it
    Commit    ///< Text stable: drop the audio it came from
};

/**
 * @brief Turns the text of successive transcription passes into partials and commits
 *
 * Blank passes (whitespace or the blank sentinel) are ignored entirely. A
 * changed text is a partial; the same text UTTERANCE_COMMIT_PASSES more times
 * commits the utterance and starts the next one.
 */
class UtteranceTracker {
public:
    explicit UtteranceTracker(const STTConfig& config);

    PassAction on_pass(const std::string& text);

    /// True once any pass produced non-blank text
    bool heard_speech() const { return heard_speech_; }

    /// Text of the utterance in progress (empty right after a commit)
    const std::string& text() const { return text_; }

    /**
     * @brief Whether a stream open for elapsed_ms should give up with NoSpeech
     *
     * Never true after speech was heard or when the timeout is 0.
     */
    bool no_speech_expired(int64_t elapsed_ms) const;

private:
    std::string blank_sentinel_;
    int no_speech_timeout_ms_;
    bool heard_speech_;
    int unchanged_passes_;
    std::string text_;
};

} // namespace voicekit
