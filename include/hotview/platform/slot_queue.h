#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace hotview::platform {

// Bounded queue with a single slot. push() blocks while the slot is occupied,
// so a fast producer is throttled to the consumer's pace instead of dropping
// items. close() releases every blocked producer and consumer; items already
// in the slot can still be popped after close().
template<typename T>
class SlotQueue {
public:
    SlotQueue() = default;

    // Non-copyable, non-movable
    SlotQueue(const SlotQueue&) = delete;
    SlotQueue& operator=(const SlotQueue&) = delete;

    // Returns false if the queue was closed or the stop was requested before
    // the slot became free. The value is discarded in that case.
    bool push(T value, std::stop_token stop = {});

    // Blocks until an item arrives. Returns nullopt once the queue is closed
    // and empty, or when the stop is requested.
    std::optional<T> pop(std::stop_token stop = {});

    // Like pop(), but gives up after the timeout.
    template<typename Rep, typename Period>
    std::optional<T> try_pop_for(std::chrono::duration<Rep, Period> timeout,
                                 std::stop_token stop = {});

    // Non-blocking
    std::optional<T> try_pop();

    void close();
    bool closed() const;
    bool empty() const;

private:
    std::optional<T> take_locked();

    std::optional<T> slot_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable_any not_empty_;
    std::condition_variable_any not_full_;
};

// Template implementation
template<typename T>
bool SlotQueue<T>::push(T value, std::stop_token stop) {
    {
        std::unique_lock lock(mutex_);
        bool free = not_full_.wait(lock, stop, [this]() {
            return !slot_.has_value() || closed_;
        });
        if (!free || closed_) {
            return false;
        }
        slot_.emplace(std::move(value));
    }
    not_empty_.notify_one();
    return true;
}

template<typename T>
std::optional<T> SlotQueue<T>::take_locked() {
    std::optional<T> item = std::move(slot_);
    slot_.reset();
    return item;
}

template<typename T>
std::optional<T> SlotQueue<T>::pop(std::stop_token stop) {
    std::optional<T> item;
    {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, stop, [this]() {
            return slot_.has_value() || closed_;
        });
        if (stop.stop_requested() && !slot_) {
            return std::nullopt;
        }
        item = take_locked();
    }
    not_full_.notify_one();
    return item;
}

template<typename T>
template<typename Rep, typename Period>
std::optional<T> SlotQueue<T>::try_pop_for(std::chrono::duration<Rep, Period> timeout,
                                           std::stop_token stop) {
    std::optional<T> item;
    {
        std::unique_lock lock(mutex_);
        not_empty_.wait_for(lock, stop, timeout, [this]() {
            return slot_.has_value() || closed_;
        });
        item = take_locked();
    }
    if (item) {
        not_full_.notify_one();
    }
    return item;
}

template<typename T>
std::optional<T> SlotQueue<T>::try_pop() {
    std::optional<T> item;
    {
        std::lock_guard lock(mutex_);
        item = take_locked();
    }
    if (item) {
        not_full_.notify_one();
    }
    return item;
}

template<typename T>
void SlotQueue<T>::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

template<typename T>
bool SlotQueue<T>::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

template<typename T>
bool SlotQueue<T>::empty() const {
    std::lock_guard lock(mutex_);
    return !slot_.has_value();
}

} // namespace hotview::platform
