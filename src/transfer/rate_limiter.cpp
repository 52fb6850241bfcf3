/*
 * Token-bucket RateLimiter
 * - One bucket shared by every transfer holding the limiter (global bandwidth cap)
 * - Capacity = rate (burst <= 1 second of allowance)
 * - A request larger than the capacity is admitted once the bucket is full and drives the
 *   balance negative; later callers wait for the debt to be repaid, so the long-run rate holds
 * - Cooperative cancellation via ShouldCancel
 */

#include <omnifetch/transfer/transfer.hpp>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>

namespace omnifetch::transfer {

namespace {

using clock_t = std::chrono::steady_clock;

class TokenBucketLimiter final : public IRateLimiter {
public:
    explicit TokenBucketLimiter(std::uint64_t bytesPerSecond) { setRate(bytesPerSecond); }
    ~TokenBucketLimiter() override = default;

    void setRate(std::uint64_t bytesPerSecond) override {
        std::lock_guard<std::mutex> lk(mutex_);
        rate_bps_ = static_cast<double>(bytesPerSecond);
        capacity_ = rate_bps_;
        tokens_ = capacity_;
        last_refill_ = clock_t::now();
    }

    bool acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) override {
        if (bytes == 0)
            return true;

        while (true) {
            if (shouldCancel && shouldCancel()) {
                return false;
            }

            double wait_seconds = 0.0;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                if (rate_bps_ <= 0.0) {
                    return true; // unlimited
                }
                refill(clock_t::now());

                const double need = std::min(static_cast<double>(bytes), capacity_);
                if (tokens_ >= need) {
                    tokens_ -= static_cast<double>(bytes);
                    return true;
                }
                wait_seconds = (need - tokens_) / rate_bps_;
            }

            // Sleep in small increments to allow cancel checks
            constexpr auto max_slice = std::chrono::milliseconds(50);
            auto sleep_for = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::duration<double>(wait_seconds));
            if (sleep_for.count() <= 0) {
                std::this_thread::yield();
            } else {
                std::this_thread::sleep_for(std::min(sleep_for, max_slice));
            }
        }
    }

private:
    void refill(clock_t::time_point now) {
        const auto dt = std::chrono::duration<double>(now - last_refill_).count();
        if (dt <= 0.0)
            return;
        tokens_ = std::min(capacity_, tokens_ + rate_bps_ * dt);
        last_refill_ = now;
    }

    std::mutex mutex_;
    double rate_bps_{0.0};
    double capacity_{0.0};
    double tokens_{0.0};
    clock_t::time_point last_refill_{clock_t::now()};
};

} // namespace

std::unique_ptr<IRateLimiter> makeTokenBucketLimiter(std::uint64_t bytesPerSecond) {
    return std::make_unique<TokenBucketLimiter>(bytesPerSecond);
}

} // namespace omnifetch::transfer
