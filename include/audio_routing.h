#pragma once

#include "errors.h"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace voicekit {

/**
 * @brief Exclusivity of the shared audio configuration
 */
enum class RoutingCategory {
    Ambient,        ///< Mixes with others, no input
    Playback,       ///< Output only
    Record,         ///< Input only, exclusive
    PlayAndRecord
};

/**
 * @brief Signal-processing mode applied on top of the category
 */
enum class RoutingMode {
    Default,
    Measurement,    ///< Minimal input processing, suited to recognition
    VoiceChat
};

/// Bit flags describing how other audio is treated
enum RoutingOption : uint32_t {
    RoutingOptionNone = 0,
    RoutingOptionMixWithOthers = 1u << 0,
    RoutingOptionDuckOthers = 1u << 1,
    RoutingOptionMuteOthers = 1u << 2,
    RoutingOptionNotifyOthersOnDeactivation = 1u << 3
};

struct RoutingConfiguration {
    RoutingCategory category = RoutingCategory::Ambient;
    RoutingMode mode = RoutingMode::Default;
    uint32_t options = RoutingOptionNone;

    bool operator==(const RoutingConfiguration& other) const {
        return category == other.category && mode == other.mode && options == other.options;
    }
    bool operator!=(const RoutingConfiguration& other) const { return !(*this == other); }
};

std::string to_string(const RoutingConfiguration& config);

/**
 * @brief Access to the shared, system-level routing configuration
 */
class AudioRoutingBackend {
public:
    virtual ~AudioRoutingBackend() = default;

    /**
     * @brief Currently active configuration
     * @return nullopt when the backend cannot report one (nothing to preserve)
     */
    virtual std::optional<RoutingConfiguration> current() const = 0;

    virtual VoidResult set(const RoutingConfiguration& config) = 0;
};

/**
 * @brief Process-wide routing configuration
 *
 * Stands in for the platform audio session: every component in the process
 * sees the same configuration, which starts out as system_default().
 * Thread-safe.
 */
class SharedAudioSession : public AudioRoutingBackend {
public:
    static SharedAudioSession& instance();

    std::optional<RoutingConfiguration> current() const override;
    VoidResult set(const RoutingConfiguration& config) override;

    /// Return to system_default()
    void reset();

    /// Ambient, default mode, mixing with other audio
    static RoutingConfiguration system_default();

private:
    SharedAudioSession();

    mutable std::mutex mutex_;
    RoutingConfiguration config_;
};

/**
 * @brief Saves and restores the shared routing configuration around a session
 *
 * Usage: save(), apply(), ... , restore(). The snapshot is consumed by
 * restore(); calling restore() without a snapshot is a no-op.
 */
class AudioRoutingGuard {
public:
    explicit AudioRoutingGuard(AudioRoutingBackend& backend);

    // Non-copyable
    AudioRoutingGuard(const AudioRoutingGuard&) = delete;
    AudioRoutingGuard& operator=(const AudioRoutingGuard&) = delete;

    /**
     * @brief Capture the active configuration, or record that there is nothing to restore
     */
    void save();

    /**
     * @brief Activate capture routing: Record + Measurement + DuckOthers (+ MuteOthers)
     * @return RoutingError if the backend rejects the configuration
     */
    VoidResult apply(bool mute_external_audio);

    /**
     * @brief Reapply the saved configuration and discard the snapshot
     * @return RoutingError on backend failure; the snapshot is discarded either way
     */
    VoidResult restore();

    bool has_snapshot() const { return snapshot_.has_value(); }

    /// Configuration apply() activates
    static RoutingConfiguration capture_configuration(bool mute_external_audio);

private:
    AudioRoutingBackend& backend_;
    std::optional<RoutingConfiguration> snapshot_;
};

} // namespace voicekit
