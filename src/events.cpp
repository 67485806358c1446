#include "events.h"
#include "logger.h"
#include <vector>

namespace voicekit {

namespace {

struct EventNameVisitor {
    const char* operator()(const events::AvailabilityChanged&) const { return "availability-change"; }
    const char* operator()(const events::ListeningStateChanged&) const { return "listening-state-change"; }
    const char* operator()(const events::PartialResult&) const { return "partial-result"; }
    const char* operator()(const events::FinalResult&) const { return "result"; }
    const char* operator()(const events::ErrorOccurred&) const { return "error"; }
    const char* operator()(const events::AudioBuffer&) const { return "audio-buffer"; }
};

} // namespace

const char* event_name(const VoiceEvent& event) {
    return std::visit(EventNameVisitor{}, event);
}

SubscriptionId EventBus::subscribe(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.erase(id) > 0;
}

void EventBus::emit(const VoiceEvent& event) {
    // Snapshot so callbacks can (un)subscribe without deadlocking
    std::vector<EventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.reserve(subscribers_.size());
        for (const auto& entry : subscribers_) {
            callbacks.push_back(entry.second);
        }
    }

    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            Logger::error(std::string("Event subscriber threw on ") + event_name(event) + ": " + e.what());
        }
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace voicekit
