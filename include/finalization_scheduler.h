#pragma once

#include "dispatch_queue.h"
#include <functional>
#include <memory>

namespace voicekit {

/**
 * @brief Single-slot, restartable silence timer
 *
 * arm() replaces whatever was pending, so a stream of partial results keeps
 * pushing finalization into the future and only a quiet gap of at least the
 * armed delay lets the callback run. All calls, and the callback itself, run
 * on the executor's context.
 */
class FinalizationScheduler {
public:
    explicit FinalizationScheduler(IExecutor& executor);

    /**
     * @brief Destructor - cancels any pending callback
     */
    ~FinalizationScheduler();

    // Non-copyable
    FinalizationScheduler(const FinalizationScheduler&) = delete;
    FinalizationScheduler& operator=(const FinalizationScheduler&) = delete;

    /**
     * @brief Cancel any pending callback and schedule a new one
     * @param delay_ms Delay in milliseconds (negative treated as 0)
     * @param callback Runs at most once
     */
    void arm(int delay_ms, std::function<void()> callback);

    /**
     * @brief Cancel the pending callback, if any. Idempotent.
     */
    void cancel();

    bool is_armed() const;

private:
    struct Slot {
        uint64_t generation = 0;
        TimerId timer = 0;
        std::function<void()> callback;
    };

    IExecutor& executor_;
    std::shared_ptr<Slot> slot_;
};

} // namespace voicekit
