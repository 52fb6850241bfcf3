#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace omnifetch::orchestrator {

/**
 * Bounded multi-producer queue drained by one subscriber.
 *
 * Non-essential items (progress samples) are dropped when the queue is full; essential items
 * (state changes, terminal events) may exceed the capacity so a subscriber sees every
 * transition. A subscriber that lets essential items pile up to four times the capacity is
 * cut off: the channel closes and reports overflowed().
 * After close() pushes are rejected and waitNext() drains what is left, then returns nullopt.
 */
template <typename T> class EventChannel {
public:
    explicit EventChannel(std::size_t capacity = 1024)
        : cap_(capacity ? capacity : 1), hardCap_(cap_ * 4) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    bool push(T item, bool essential = false) {
        bool cutOff = false;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_)
                return false;
            if (!essential && buf_.size() >= cap_) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            if (buf_.size() >= hardCap_) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                overflowed_ = true;
                closed_ = true;
                cutOff = true;
            } else {
                buf_.push_back(std::move(item));
            }
        }
        if (cutOff) {
            cv_.notify_all();
            return false;
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> tryNext() {
        std::lock_guard<std::mutex> lk(mu_);
        if (buf_.empty())
            return std::nullopt;
        T out = std::move(buf_.front());
        buf_.pop_front();
        return out;
    }

    /**
     * Next item, waiting up to `timeout`. nullopt on timeout or once closed and drained.
     */
    std::optional<T> waitNext(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, timeout, [this] { return !buf_.empty() || closed_; });
        if (buf_.empty())
            return std::nullopt;
        T out = std::move(buf_.front());
        buf_.pop_front();
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    // Closed and nothing left to read
    bool finished() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_ && buf_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return buf_.size();
    }

    // Closed because essential items exceeded the hard limit
    bool overflowed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return overflowed_;
    }

    std::size_t capacity() const noexcept { return cap_; }
    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> buf_;
    const std::size_t cap_;
    const std::size_t hardCap_;
    bool closed_{false};
    bool overflowed_{false};
    std::atomic<std::uint64_t> dropped_{0};
};

} // namespace omnifetch::orchestrator
