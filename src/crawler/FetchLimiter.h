#pragma once

#include <mutex>
#include <condition_variable>
#include <optional>
#include "../../include/docs_fetch/crawler/CancellationToken.h"

namespace docs_fetch::crawler {

// Counting semaphore bounding simultaneous fetches across all branches of one request
class FetchLimiter {
public:
    // Held for the duration of one fetch, released on destruction
    class Permit {
    public:
        explicit Permit(FetchLimiter& limiter) : limiter(&limiter) {}
        Permit(Permit&& other) noexcept : limiter(other.limiter) { other.limiter = nullptr; }
        Permit& operator=(Permit&&) = delete;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        ~Permit() { if (limiter) limiter->release(); }

    private:
        FetchLimiter* limiter;
    };

    explicit FetchLimiter(size_t maxConcurrent);

    // Block until a slot is free; nullopt if the token is cancelled first
    std::optional<Permit> acquire(const CancellationToken& token);

    size_t active() const;

    // Highest number of permits held at once
    size_t peak() const;

private:
    void release();

    const size_t maxConcurrent;
    mutable std::mutex mutex;
    std::condition_variable cv;
    size_t inUse = 0;
    size_t highWater = 0;
};

} // namespace docs_fetch::crawler
