#pragma once

#include "common.h"
#include "errors.h"
#include <string>
#include <memory>
#include <functional>

namespace voicekit {

/**
 * @brief Receives each driver buffer as normalized mono float samples
 *
 * Runs on the audio thread: must not block, allocate heavily or wait on
 * another thread.
 */
using InputBufferCallback = std::function<void(const float* samples, size_t count)>;

/**
 * @brief Live audio input that a single tap can be attached to
 */
class AudioInput {
public:
    virtual ~AudioInput() = default;

    /**
     * @brief Start delivering input buffers to callback
     * @param frame_length Samples per delivered buffer (drivers may deliver fewer)
     * @param sample_rate Capture rate in Hz
     * @return AudioDeviceError if the device cannot be opened, InvalidState if a tap is already installed
     */
    virtual VoidResult install_tap(int frame_length, double sample_rate, InputBufferCallback callback) = 0;

    /**
     * @brief Detach the tap. Once this returns the callback is never invoked again.
     * No-op if no tap is installed.
     */
    virtual void remove_tap() = 0;

    virtual bool is_tap_installed() const = 0;
};

/**
 * @brief AudioInput using a PortAudio callback stream
 *
 * Opens a mono paFloat32 input stream per install_tap() and closes it in
 * remove_tap(). The PortAudio callback thread is the audio-delivery context.
 *
 * Thread Safety:
 * - install_tap()/remove_tap() must not be called concurrently with each other
 * - The tap callback runs on PortAudio's thread
 */
class PortAudioInput : public AudioInput {
public:
    /**
     * @param input_device Device name, numeric index, or "default" for the system default
     */
    explicit PortAudioInput(const std::string& input_device = "default");
    ~PortAudioInput() override;

    // Non-copyable
    PortAudioInput(const PortAudioInput&) = delete;
    PortAudioInput& operator=(const PortAudioInput&) = delete;

    VoidResult install_tap(int frame_length, double sample_rate, InputBufferCallback callback) override;
    void remove_tap() override;
    bool is_tap_installed() const override;

    /**
     * @brief List all available input devices to the log
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voicekit
