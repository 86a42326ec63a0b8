#include "FetchLimiter.h"
#include <algorithm>

namespace docs_fetch::crawler {

namespace {
// The token signals its own condition variable, so waiters poll it at this interval
constexpr std::chrono::milliseconds kCancelPollInterval{20};
}

FetchLimiter::FetchLimiter(size_t maxConcurrent)
    : maxConcurrent(std::max<size_t>(1, maxConcurrent)) {
}

std::optional<FetchLimiter::Permit> FetchLimiter::acquire(const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex);
    while (inUse >= maxConcurrent) {
        if (token.isCancelled()) {
            return std::nullopt;
        }
        cv.wait_for(lock, kCancelPollInterval);
    }
    if (token.isCancelled()) {
        return std::nullopt;
    }
    ++inUse;
    highWater = std::max(highWater, inUse);
    return std::optional<Permit>(std::in_place, *this);
}

void FetchLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        --inUse;
    }
    cv.notify_one();
}

size_t FetchLimiter::active() const {
    std::lock_guard<std::mutex> lock(mutex);
    return inUse;
}

size_t FetchLimiter::peak() const {
    std::lock_guard<std::mutex> lock(mutex);
    return highWater;
}

} // namespace docs_fetch::crawler
