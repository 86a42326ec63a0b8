#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace docs_fetch::crawler {

/**
 * Cooperative cancellation shared by every branch of one exploration.
 * Cancelled either explicitly or implicitly once the deadline passes.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;
    explicit CancellationToken(Clock::time_point deadline);

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();

    // True once cancel() was called or the deadline has passed
    bool isCancelled() const;

    void setDeadline(Clock::time_point deadline);

    // Time left before the deadline, zero when cancelled; max() without a deadline
    std::chrono::milliseconds remaining() const;

    /**
     * Sleep for the given duration unless cancelled first.
     * @return false if the wait was interrupted by cancellation
     */
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<Clock::rep> deadline_{0};
    std::atomic<bool> hasDeadline_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace docs_fetch::crawler
