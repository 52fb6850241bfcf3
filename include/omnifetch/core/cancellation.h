#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace omnifetch {

/**
 * Cooperative cancellation flag shared between the scheduler (requester) and the
 * execution unit running a job (observer). Copies share the same underlying state.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void requestCancel() noexcept {
        {
            std::lock_guard lock(state_->mutex);
            state_->cancelled.store(true, std::memory_order_release);
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool isCancelled() const noexcept {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    /**
     * Sleep for up to `duration`, waking early on cancellation.
     * @return true if cancellation was requested before the wait elapsed
     */
    bool waitFor(std::chrono::milliseconds duration) const {
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, duration, [this] {
            return state_->cancelled.load(std::memory_order_acquire);
        });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};

} // namespace omnifetch
