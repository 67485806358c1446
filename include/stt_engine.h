#pragma once

#include "common.h"
#include "config.h"
#include "recognition_engine.h"
#include <string>
#include <memory>

namespace voicekit {

/**
 * @brief RecognitionEngine backed by whisper.cpp
 *
 * Streams are emulated on top of whisper's batch API: appended audio is
 * accumulated (resampled to 16 kHz) and a worker thread re-transcribes it
 * every step_ms, reporting the text as a partial result when it changes.
 * Once the text has stayed unchanged for a few steps the utterance is
 * considered committed and its audio is dropped, so the next partial starts
 * with new speech. A stream that recognizes nothing within
 * no_speech_timeout_ms reports StreamErrorKind::NoSpeech.
 *
 * One whisper context is shared by all streams; inference is serialized.
 */
class WhisperRecognitionEngine : public RecognitionEngine {
public:
    explicit WhisperRecognitionEngine(const STTConfig& config);
    ~WhisperRecognitionEngine() override;

    // Non-copyable
    WhisperRecognitionEngine(const WhisperRecognitionEngine&) = delete;
    WhisperRecognitionEngine& operator=(const WhisperRecognitionEngine&) = delete;

    /**
     * @brief Load the ggml model from config.model_path
     *
     * On success availability becomes true and the availability callback fires.
     * @return EngineError if the path is empty or the model cannot be loaded
     */
    VoidResult load_model();

    /**
     * @brief Release the model; open streams keep their reference until they end
     */
    void unload();

    bool is_available() const override;
    void set_availability_callback(std::function<void(bool available)> callback) override;
    Result<std::unique_ptr<RecognitionStream>> open_stream(const StreamRequest& request,
                                                           StreamCallbacks callbacks) override;
    std::vector<std::string> supported_locales() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voicekit
