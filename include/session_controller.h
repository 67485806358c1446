#pragma once

#include "audio_io.h"
#include "audio_routing.h"
#include "config.h"
#include "dispatch_queue.h"
#include "errors.h"
#include "events.h"
#include "recognition_engine.h"
#include <memory>
#include <string>
#include <vector>

namespace voicekit {

/**
 * @brief Listening session state
 */
enum class SessionState {
    Idle,       ///< No session; start() is allowed
    Listening   ///< One session active; start() is rejected
};

const char* session_state_to_string(SessionState state);

/**
 * @brief Owns the lifecycle of one listening session
 *
 * start() saves and applies audio routing, opens a recognition stream and
 * installs the audio tap. Partial results update the transcript and rearm the
 * silence timer; when it fires the transcript is emitted as a final result and,
 * unless the mode is Continuous, the session is torn down. Every path back to
 * Idle cancels the timer, removes the tap, closes the stream and restores
 * routing.
 *
 * State transitions and event emission happen only on the executor's context.
 * start() and stop() may be called from any thread: off the context they are
 * posted to it and the caller waits for the result.
 *
 * - Idle -> Listening (start)
 * - Listening -> Idle (stop, final result outside Continuous mode, stream error)
 * - Listening -> Listening (partial result, final result in Continuous mode)
 */
class SessionController {
public:
    /**
     * @brief Construct controller; all collaborators must outlive it
     */
    SessionController(RecognitionEngine& engine, AudioInput& input,
                      AudioRoutingBackend& routing, IExecutor& executor);

    /**
     * @brief Destructor - tears down an active session without emitting events
     */
    ~SessionController();

    // Non-copyable
    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /**
     * @brief Begin a listening session
     * @return InvalidState if already listening (the active session is untouched),
     *         InvalidArgument for bad options, or the setup error after rollback
     */
    VoidResult start(const ListeningOptions& options);

    /**
     * @brief End the active session
     * @return InvalidState if idle
     */
    VoidResult stop();

    bool is_available() const;
    std::vector<std::string> supported_locales() const;

    SessionState state() const;

    /**
     * @brief Last partial text of the active session (empty when idle)
     */
    std::string transcript() const;

    SubscriptionId subscribe(EventCallback callback);
    bool unsubscribe(SubscriptionId id);

private:
    class Impl;
    std::shared_ptr<Impl> pimpl_;
};

} // namespace voicekit
