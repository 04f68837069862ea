#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <queue>
#include <vector>

namespace hotview::platform {

// Single-threaded task loop for the host side. Any thread may post; tasks run
// on the thread that calls run(), run_for() or run_pending().
class EventLoop {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    EventLoop();
    ~EventLoop();

    // Non-copyable, non-movable
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post_task(Task task);
    void post_delayed_task(Task task, std::chrono::milliseconds delay);

    // Blocks until quit() is called. A quit() issued before run() makes the
    // next run() return immediately.
    void run();

    // Like run(), but also returns once the timeout elapses. Returns true when
    // the loop stopped because of quit().
    bool run_for(std::chrono::milliseconds timeout);

    // Run pending tasks and return (non-blocking)
    void run_pending();

    void quit();

    bool is_running() const;
    size_t pending_count() const;

private:
    struct DelayedTask {
        TimePoint run_at;
        Task task;
        bool operator>(const DelayedTask& other) const {
            return run_at > other.run_at;
        }
    };

    bool run_until(TimePoint deadline);
    void promote_ready_locked(TimePoint now);

    std::deque<Task> tasks_;
    std::priority_queue<DelayedTask, std::vector<DelayedTask>, std::greater<>> delayed_tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::atomic<bool> quit_requested_{false};
};

} // namespace hotview::platform
