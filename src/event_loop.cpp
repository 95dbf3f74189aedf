#include "event_loop.hpp"

namespace middleman {

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

bool EventLoop::run_one() {
    Task task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return false;
        task = std::move(queue_.front());
        queue_.pop_front();
    }
    // Run without the lock held: tasks post follow-up work.
    task();
    return true;
}

size_t EventLoop::run() {
    size_t executed = 0;
    while (run_one()) {
        ++executed;
    }
    return executed;
}

void EventLoop::run_until(const std::function<bool()>& done) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = false;
    }
    while (!done()) {
        if (run_one()) continue;

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || interrupted_; });
        if (interrupted_) return;
    }
}

void EventLoop::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
    }
    cv_.notify_all();
}

size_t EventLoop::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace middleman
