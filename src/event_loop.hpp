#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace middleman {

// Single-threaded cooperative scheduler. Tasks run one at a time, in the
// order they were posted, on whichever thread drives the loop. post() is
// safe from any thread so out-of-process stores can deliver completions.
//
// Exceptions thrown by a task propagate out of run()/run_one()/run_until().
class EventLoop {
public:
    using Task = std::function<void()>;

    void post(Task task);

    // Run a single queued task. Returns false if the queue was empty.
    bool run_one();

    // Run until the queue is empty (tasks posted while draining included).
    // Returns the number of tasks executed.
    size_t run();

    // Run tasks until done() holds, sleeping while idle. Returns early after
    // interrupt(). done() is checked before each task and after each task.
    void run_until(const std::function<bool()>& done);

    // Make a blocked run_until() return. Sticky until the next run_until().
    void interrupt();

    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    bool interrupted_ = false;
};

} // namespace middleman
