#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <chrono>
#include <optional>
#include <condition_variable>

namespace networking {

// Bounded queue between transfer threads and a front end. push() never blocks:
// when full the oldest entry is dropped so the newest (often terminal) events survive.
template <typename T>
class EventQueue {
public:
    explicit EventQueue(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

    void push(T event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            if (items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_;
            }
            items_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) return std::nullopt;
        T front = std::move(items_.front());
        items_.pop_front();
        return front;
    }

    // Empty result on timeout or once closed and drained
    template <typename Rep, typename Period>
    std::optional<T> wait_pop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) return std::nullopt;
        T front = std::move(items_.front());
        items_.pop_front();
        return front;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace networking
