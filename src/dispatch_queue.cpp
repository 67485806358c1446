#include "dispatch_queue.h"
#include "logger.h"

namespace voicekit {

DispatchQueue::DispatchQueue(const std::string& name)
    : name_(name), running_(true), next_timer_id_(1) {
    worker_ = std::thread(&DispatchQueue::worker_thread, this);
    worker_id_ = worker_.get_id();
}

DispatchQueue::~DispatchQueue() {
    shutdown();
}

bool DispatchQueue::post(Task task) {
    if (!task) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            return false;
        }
        ready_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

TimerId DispatchQueue::post_delayed(Duration delay, Task task) {
    if (!task) {
        return 0;
    }
    if (delay.count() < 0) {
        delay = Duration(0);
    }
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            return 0;
        }
        id = next_timer_id_++;
        TimePoint due = Clock::now() + delay;
        timers_.emplace(TimerKey{due, id}, std::move(task));
        timer_due_.emplace(id, due);
    }
    queue_cv_.notify_one();
    return id;
}

bool DispatchQueue::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    auto it = timer_due_.find(id);
    if (it == timer_due_.end()) {
        return false;
    }
    timers_.erase(TimerKey{it->second, id});
    timer_due_.erase(it);
    return true;
}

bool DispatchQueue::is_current() const {
    return std::this_thread::get_id() == worker_id_;
}

void DispatchQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    queue_cv_.notify_all();

    if (worker_.joinable()) {
        if (is_current()) {
            // Called from our own task; the thread exits after this task returns
            Logger::error("DispatchQueue '" + name_ + "' shut down from its own thread");
            worker_.detach();
        } else {
            worker_.join();
        }
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!ready_.empty() || !timers_.empty()) {
        Logger::debug("DispatchQueue '" + name_ + "' dropped " +
                      std::to_string(ready_.size() + timers_.size()) + " pending task(s)");
    }
    ready_.clear();
    timers_.clear();
    timer_due_.clear();
}

size_t DispatchQueue::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return ready_.size() + timers_.size();
}

void DispatchQueue::worker_thread() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            while (running_) {
                // Move due timers behind already-ready work
                TimePoint now = Clock::now();
                while (!timers_.empty() && timers_.begin()->first.due <= now) {
                    auto it = timers_.begin();
                    timer_due_.erase(it->first.id);
                    ready_.push_back(std::move(it->second));
                    timers_.erase(it);
                }

                if (!ready_.empty()) {
                    break;
                }

                if (timers_.empty()) {
                    queue_cv_.wait(lock);
                } else {
                    queue_cv_.wait_until(lock, timers_.begin()->first.due);
                }
            }

            if (!running_) {
                break;
            }

            task = std::move(ready_.front());
            ready_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            Logger::error("Task on '" + name_ + "' threw: " + e.what());
        }
    }
}

} // namespace voicekit
