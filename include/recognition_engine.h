#pragma once

#include "errors.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace voicekit {

/**
 * @brief Failure reported by a recognition stream
 */
enum class StreamErrorKind {
    NoSpeech,   ///< Nothing recognizable was heard; not surfaced as an error event
    Engine      ///< Any other engine failure
};

struct StreamError {
    StreamErrorKind kind = StreamErrorKind::Engine;
    std::string message;
};

/**
 * @brief Callbacks a stream invokes from its own thread
 *
 * Neither callback may be invoked after RecognitionStream::cancel() returns.
 */
struct StreamCallbacks {
    std::function<void(const std::string& text)> on_partial;
    std::function<void(const StreamError& error)> on_error;
};

struct StreamRequest {
    std::string locale = "en-US";
    bool use_on_device_recognizer = false;
    double sample_rate = 16000.0;  ///< Rate of the samples passed to append()
};

/**
 * @brief One live recognition request fed with captured audio
 */
class RecognitionStream {
public:
    virtual ~RecognitionStream() = default;

    /**
     * @brief Feed normalized mono samples. Called on the audio thread; must not block.
     */
    virtual void append(const float* samples, size_t count) = 0;

    /**
     * @brief No more audio will be appended
     */
    virtual void end_audio() = 0;

    /**
     * @brief Abort recognition. No callbacks run after this returns. Idempotent.
     */
    virtual void cancel() = 0;
};

/**
 * @brief Speech-to-text capability used by SessionController
 */
class RecognitionEngine {
public:
    virtual ~RecognitionEngine() = default;

    virtual bool is_available() const = 0;

    /**
     * @brief Register the availability signal (replaces any previous callback)
     *
     * May be invoked from any thread.
     */
    virtual void set_availability_callback(std::function<void(bool available)> callback) = 0;

    /**
     * @brief Start a new recognition stream
     * @return EngineError if the engine is unavailable or rejects the request
     */
    virtual Result<std::unique_ptr<RecognitionStream>> open_stream(const StreamRequest& request,
                                                                   StreamCallbacks callbacks) = 0;

    virtual std::vector<std::string> supported_locales() const = 0;
};

} // namespace voicekit
