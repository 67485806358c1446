#pragma once

#include "common.h"
#include "errors.h"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <variant>

namespace voicekit {

/**
 * @brief Event payloads emitted by SessionController
 *
 * One struct per notification kind; a VoiceEvent holds exactly one of them.
 */
namespace events {

struct AvailabilityChanged {
    bool available = false;
};

struct ListeningStateChanged {
    bool listening = false;
};

struct PartialResult {
    std::string text;
};

struct FinalResult {
    std::string text;
};

struct ErrorOccurred {
    VoiceError error;
};

struct AudioBuffer {
    AudioFrame frame;  ///< PCM16, at most frame_length samples
};

} // namespace events

using VoiceEvent = std::variant<events::AvailabilityChanged,
                                events::ListeningStateChanged,
                                events::PartialResult,
                                events::FinalResult,
                                events::ErrorOccurred,
                                events::AudioBuffer>;

/// Event name for logging ("availability-change", "partial-result", ...)
const char* event_name(const VoiceEvent& event);

using EventCallback = std::function<void(const VoiceEvent&)>;
using SubscriptionId = uint64_t;

/**
 * @brief Subscriber list for VoiceEvents
 *
 * emit() runs on the coordination context. Subscribers may subscribe or
 * unsubscribe from inside a callback; such changes take effect from the next
 * emit(). Exceptions thrown by a subscriber are logged and do not reach the
 * emitter.
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(EventCallback callback);

    /// @return True if the id was subscribed
    bool unsubscribe(SubscriptionId id);

    void emit(const VoiceEvent& event);

    size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, EventCallback> subscribers_;
    SubscriptionId next_id_ = 1;
};

} // namespace voicekit
