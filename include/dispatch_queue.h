#pragma once

#include "common.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace voicekit {

using Task = std::function<void()>;
using TimerId = uint64_t;  ///< 0 is never a valid id

/**
 * @brief Serial execution context
 *
 * Tasks posted to one executor never run concurrently with each other.
 * post() and post_delayed() may be called from any thread, including the
 * real-time audio thread: they only take a short lock and never wait for
 * queued work.
 */
class IExecutor {
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Enqueue a task to run as soon as possible
     * @return False if the executor no longer accepts work
     */
    virtual bool post(Task task) = 0;

    /**
     * @brief Enqueue a task to run after a delay
     * @return Timer id for cancel(), or 0 if the executor no longer accepts work
     */
    virtual TimerId post_delayed(Duration delay, Task task) = 0;

    /**
     * @brief Cancel a delayed task that has not started yet
     * @return True if the task was removed; false if unknown, already running or done
     */
    virtual bool cancel(TimerId id) = 0;

    /**
     * @brief True when called from a task running on this executor
     */
    virtual bool is_current() const = 0;
};

/**
 * @brief IExecutor backed by a single worker thread
 *
 * Ready tasks run in FIFO order; delayed tasks run once due, ordered by due
 * time and then by post order. Exceptions escaping a task are logged.
 */
class DispatchQueue : public IExecutor {
public:
    explicit DispatchQueue(const std::string& name = "coordination");

    /**
     * @brief Destructor - stops the worker; queued tasks that have not started are dropped
     */
    ~DispatchQueue() override;

    // Non-copyable
    DispatchQueue(const DispatchQueue&) = delete;
    DispatchQueue& operator=(const DispatchQueue&) = delete;

    bool post(Task task) override;
    TimerId post_delayed(Duration delay, Task task) override;
    bool cancel(TimerId id) override;
    bool is_current() const override;

    /**
     * @brief Stop accepting work and join the worker thread
     *
     * Must not be called from a task on this queue.
     */
    void shutdown();

    /// Number of ready plus delayed tasks not yet started
    size_t pending_count() const;

private:
    struct TimerKey {
        TimePoint due;
        TimerId id;
        bool operator<(const TimerKey& other) const {
            return due < other.due || (due == other.due && id < other.id);
        }
    };

    void worker_thread();

    std::string name_;
    std::atomic<bool> running_;
    std::thread::id worker_id_;

    std::deque<Task> ready_;
    std::map<TimerKey, Task> timers_;
    std::map<TimerId, TimePoint> timer_due_;
    TimerId next_timer_id_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::thread worker_;
};

} // namespace voicekit
