#include "../../include/docs_fetch/crawler/CancellationToken.h"
#include <algorithm>

namespace docs_fetch::crawler {

CancellationToken::CancellationToken(Clock::time_point deadline) {
    setDeadline(deadline);
}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::isCancelled() const {
    if (cancelled_.load()) return true;
    if (!hasDeadline_.load()) return false;
    return Clock::now().time_since_epoch().count() >= deadline_.load();
}

void CancellationToken::setDeadline(Clock::time_point deadline) {
    deadline_.store(deadline.time_since_epoch().count());
    hasDeadline_.store(true);
    cv_.notify_all();
}

std::chrono::milliseconds CancellationToken::remaining() const {
    if (cancelled_.load()) return std::chrono::milliseconds(0);
    if (!hasDeadline_.load()) return std::chrono::milliseconds::max();
    auto deadline = Clock::time_point(Clock::duration(deadline_.load()));
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    auto wakeAt = Clock::now() + duration;
    if (hasDeadline_.load()) {
        wakeAt = std::min(wakeAt, Clock::time_point(Clock::duration(deadline_.load())));
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, wakeAt, [this] { return cancelled_.load(); });
    return !isCancelled();
}

} // namespace docs_fetch::crawler
