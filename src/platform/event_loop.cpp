#include <hotview/platform/event_loop.h>

namespace hotview::platform {

EventLoop::EventLoop() = default;

EventLoop::~EventLoop() {
    quit();
}

void EventLoop::post_task(Task task) {
    {
        std::lock_guard lock(mutex_);
        tasks_.emplace_back(std::move(task));
    }
    cv_.notify_one();
}

void EventLoop::post_delayed_task(Task task, std::chrono::milliseconds delay) {
    {
        std::lock_guard lock(mutex_);
        delayed_tasks_.push(DelayedTask{Clock::now() + delay, std::move(task)});
    }
    cv_.notify_one();
}

void EventLoop::promote_ready_locked(TimePoint now) {
    while (!delayed_tasks_.empty() && delayed_tasks_.top().run_at <= now) {
        // top() is const; the task is moved out right before pop()
        tasks_.emplace_back(std::move(const_cast<DelayedTask&>(delayed_tasks_.top()).task));
        delayed_tasks_.pop();
    }
}

bool EventLoop::run_until(TimePoint deadline) {
    running_.store(true);

    while (!quit_requested_.load()) {
        std::unique_lock lock(mutex_);
        auto now = Clock::now();
        promote_ready_locked(now);

        if (!tasks_.empty()) {
            auto task = std::move(tasks_.front());
            tasks_.pop_front();
            lock.unlock();
            task();
            continue;
        }

        if (now >= deadline) break;

        auto wake_at = deadline;
        if (!delayed_tasks_.empty() && delayed_tasks_.top().run_at < wake_at) {
            wake_at = delayed_tasks_.top().run_at;
        }
        auto ready = [this]() { return !tasks_.empty() || quit_requested_.load(); };
        if (wake_at == TimePoint::max()) {
            cv_.wait(lock, ready);
        } else {
            cv_.wait_until(lock, wake_at, ready);
        }
    }

    bool quit = quit_requested_.exchange(false);
    running_.store(false);
    return quit;
}

void EventLoop::run() {
    run_until(TimePoint::max());
}

bool EventLoop::run_for(std::chrono::milliseconds timeout) {
    return run_until(Clock::now() + timeout);
}

void EventLoop::run_pending() {
    std::deque<Task> batch;
    {
        std::lock_guard lock(mutex_);
        promote_ready_locked(Clock::now());
        batch.swap(tasks_);
    }

    for (auto& task : batch) {
        task();
    }
}

void EventLoop::quit() {
    {
        std::lock_guard lock(mutex_);
        quit_requested_.store(true);
    }
    cv_.notify_all();
}

bool EventLoop::is_running() const {
    return running_.load();
}

size_t EventLoop::pending_count() const {
    std::lock_guard lock(mutex_);
    return tasks_.size() + delayed_tasks_.size();
}

} // namespace hotview::platform
