#include "audio_routing.h"
#include "logger.h"
#include <sstream>

namespace voicekit {

namespace {

const char* category_string(RoutingCategory category) {
    switch (category) {
        case RoutingCategory::Ambient: return "ambient";
        case RoutingCategory::Playback: return "playback";
        case RoutingCategory::Record: return "record";
        case RoutingCategory::PlayAndRecord: return "play-and-record";
    }
    return "unknown";
}

const char* mode_string(RoutingMode mode) {
    switch (mode) {
        case RoutingMode::Default: return "default";
        case RoutingMode::Measurement: return "measurement";
        case RoutingMode::VoiceChat: return "voice-chat";
    }
    return "unknown";
}

} // namespace

std::string to_string(const RoutingConfiguration& config) {
    std::ostringstream oss;
    oss << category_string(config.category) << "/" << mode_string(config.mode) << " [";
    bool first = true;
    auto flag = [&](uint32_t bit, const char* name) {
        if (config.options & bit) {
            oss << (first ? "" : ",") << name;
            first = false;
        }
    };
    flag(RoutingOptionMixWithOthers, "mix");
    flag(RoutingOptionDuckOthers, "duck");
    flag(RoutingOptionMuteOthers, "mute");
    flag(RoutingOptionNotifyOthersOnDeactivation, "notify");
    oss << "]";
    return oss.str();
}

SharedAudioSession::SharedAudioSession() : config_(system_default()) {}

RoutingConfiguration SharedAudioSession::system_default() {
    RoutingConfiguration config;
    config.category = RoutingCategory::Ambient;
    config.mode = RoutingMode::Default;
    config.options = RoutingOptionMixWithOthers;
    return config;
}

SharedAudioSession& SharedAudioSession::instance() {
    static SharedAudioSession session;
    return session;
}

std::optional<RoutingConfiguration> SharedAudioSession::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

VoidResult SharedAudioSession::set(const RoutingConfiguration& config) {
    if ((config.options & RoutingOptionMixWithOthers) &&
        (config.options & (RoutingOptionDuckOthers | RoutingOptionMuteOthers)) &&
        config.category == RoutingCategory::Record) {
        return make_routing_error("Record category cannot mix with audio it ducks or mutes: " +
                                  to_string(config));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    return {};
}

void SharedAudioSession::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = system_default();
}

AudioRoutingGuard::AudioRoutingGuard(AudioRoutingBackend& backend)
    : backend_(backend) {}

void AudioRoutingGuard::save() {
    snapshot_ = backend_.current();
    if (snapshot_) {
        LOG_ROUTING("Saved routing " + to_string(*snapshot_));
    } else {
        LOG_ROUTING("Backend reported no routing configuration, nothing to restore later");
    }
}

RoutingConfiguration AudioRoutingGuard::capture_configuration(bool mute_external_audio) {
    RoutingConfiguration config;
    config.category = RoutingCategory::Record;
    config.mode = RoutingMode::Measurement;
    config.options = RoutingOptionDuckOthers | RoutingOptionNotifyOthersOnDeactivation;
    if (mute_external_audio) {
        config.options |= RoutingOptionMuteOthers;
    }
    return config;
}

VoidResult AudioRoutingGuard::apply(bool mute_external_audio) {
    RoutingConfiguration config = capture_configuration(mute_external_audio);
    VoidResult result = backend_.set(config);
    if (result.is_error()) {
        Logger::error("Failed to apply capture routing: " + result.error().message);
        return make_routing_error(result.error().message);
    }
    LOG_ROUTING("Applied routing " + to_string(config));
    return {};
}

VoidResult AudioRoutingGuard::restore() {
    if (!snapshot_) {
        LOG_ROUTING("No original routing configuration to restore");
        return {};
    }

    RoutingConfiguration original = *snapshot_;
    snapshot_.reset();

    VoidResult result = backend_.set(original);
    if (result.is_error()) {
        Logger::error("Failed to restore routing: " + result.error().message);
        return make_routing_error(result.error().message);
    }
    LOG_ROUTING("Restored routing " + to_string(original));
    return {};
}

} // namespace voicekit
