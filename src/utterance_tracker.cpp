#include "utterance_tracker.h"
#include "utils.h"

namespace voicekit {

UtteranceTracker::UtteranceTracker(const STTConfig& config)
    : blank_sentinel_(config.blank_sentinel), no_speech_timeout_ms_(config.no_speech_timeout_ms),
      heard_speech_(false), unchanged_passes_(0) {}

PassAction UtteranceTracker::on_pass(const std::string& text) {
    if (utils::is_blank_transcript(text, blank_sentinel_)) {
        return PassAction::None;
    }
    heard_speech_ = true;

    if (text != text_) {
        text_ = text;
        unchanged_passes_ = 0;
        return PassAction::Partial;
    }
    if (++unchanged_passes_ < UTTERANCE_COMMIT_PASSES) {
        return PassAction::None;
    }
    text_.clear();
    unchanged_passes_ = 0;
    return PassAction::Commit;
}

bool UtteranceTracker::no_speech_expired(int64_t elapsed_ms) const {
    return !heard_speech_ && no_speech_timeout_ms_ > 0 && elapsed_ms >= no_speech_timeout_ms_;
}

} // namespace voicekit
