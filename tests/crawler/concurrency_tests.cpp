#include <catch2/catch_test_macros.hpp>
#include "VisitedSet.h"
#include "FetchLimiter.h"
#include "DeadlineGuard.h"
#include "docs_fetch/crawler/CancellationToken.h"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace docs_fetch::crawler;
using namespace std::chrono_literals;

TEST_CASE("VisitedSet claims each URL once", "[VisitedSet]") {
    VisitedSet visited;

    SECTION("Normalized forms share one claim") {
        REQUIRE(visited.tryClaim("https://Example.com/docs#intro"));
        REQUIRE_FALSE(visited.tryClaim("https://example.com/docs"));
        REQUIRE_FALSE(visited.tryClaim("HTTPS://EXAMPLE.COM/docs#other"));
        REQUIRE(visited.size() == 1);
    }

    SECTION("Invalid URLs are never claimed") {
        REQUIRE_FALSE(visited.tryClaim("mailto:someone@example.com"));
        REQUIRE(visited.size() == 0);
    }

    SECTION("Concurrent claims hand out each URL exactly once") {
        constexpr int kThreads = 8;
        constexpr int kUrls = 100;
        std::atomic<int> claimed{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&visited, &claimed]() {
                for (int i = 0; i < kUrls; ++i) {
                    if (visited.tryClaim("https://example.com/page/" + std::to_string(i))) {
                        ++claimed;
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        REQUIRE(claimed.load() == kUrls);
        REQUIRE(visited.size() == kUrls);
    }
}

TEST_CASE("FetchLimiter bounds concurrent holders", "[FetchLimiter]") {
    CancellationToken token;

    SECTION("Never exceeds capacity") {
        FetchLimiter limiter(3);
        std::atomic<int> current{0};
        std::atomic<int> maxSeen{0};
        std::atomic<int> refused{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 12; ++t) {
            threads.emplace_back([&]() {
                auto permit = limiter.acquire(token);
                if (!permit) {
                    ++refused;
                    return;
                }
                int now = ++current;
                int seen = maxSeen.load();
                while (now > seen && !maxSeen.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(10ms);
                --current;
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        REQUIRE(refused.load() == 0);
        REQUIRE(maxSeen.load() <= 3);
        REQUIRE(limiter.peak() <= 3);
        REQUIRE(limiter.active() == 0);
    }

    SECTION("Permits are released on destruction") {
        FetchLimiter limiter(1);
        {
            auto permit = limiter.acquire(token);
            REQUIRE(permit.has_value());
            REQUIRE(limiter.active() == 1);
        }
        REQUIRE(limiter.active() == 0);
    }

    SECTION("Waiters give up when cancelled") {
        FetchLimiter limiter(1);
        auto held = limiter.acquire(token);
        REQUIRE(held.has_value());

        CancellationToken cancelled;
        std::thread canceller([&cancelled]() {
            std::this_thread::sleep_for(50ms);
            cancelled.cancel();
        });
        auto waiting = limiter.acquire(cancelled);
        canceller.join();

        REQUIRE_FALSE(waiting.has_value());
        REQUIRE(limiter.active() == 1);
    }
}

TEST_CASE("CancellationToken observes cancel and deadline", "[CancellationToken]") {
    SECTION("Explicit cancel") {
        CancellationToken token;
        REQUIRE_FALSE(token.isCancelled());
        REQUIRE(token.remaining() == std::chrono::milliseconds::max());
        token.cancel();
        REQUIRE(token.isCancelled());
        REQUIRE(token.remaining() == 0ms);
    }

    SECTION("Deadline expiry") {
        CancellationToken token(CancellationToken::Clock::now() + 30ms);
        REQUIRE_FALSE(token.isCancelled());
        REQUIRE(token.remaining() <= 30ms);
        std::this_thread::sleep_for(60ms);
        REQUIRE(token.isCancelled());
    }

    SECTION("sleepFor is interrupted by cancel") {
        CancellationToken token;
        std::thread canceller([&token]() {
            std::this_thread::sleep_for(30ms);
            token.cancel();
        });
        auto start = std::chrono::steady_clock::now();
        bool completed = token.sleepFor(10s);
        auto elapsed = std::chrono::steady_clock::now() - start;
        canceller.join();

        REQUIRE_FALSE(completed);
        REQUIRE(elapsed < 5s);
    }

    SECTION("sleepFor completes when not cancelled") {
        CancellationToken token;
        REQUIRE(token.sleepFor(5ms));
    }
}

TEST_CASE("DeadlineGuard enforces a time budget", "[DeadlineGuard]") {
    SECTION("Work within the budget finishes") {
        CancellationToken token;
        DeadlineGuard guard(1000ms);
        bool ran = false;
        REQUIRE(guard.run(token, [&ran]() { ran = true; }));
        REQUIRE(ran);
        REQUIRE_FALSE(token.isCancelled());
    }

    SECTION("Overrunning work is cancelled and joined") {
        CancellationToken token;
        DeadlineGuard guard(50ms);
        std::atomic<bool> unwound{false};
        auto start = std::chrono::steady_clock::now();
        bool finished = guard.run(token, [&token, &unwound]() {
            while (token.sleepFor(1000ms)) {
            }
            unwound = true;
        });
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(finished);
        REQUIRE(token.isCancelled());
        REQUIRE(unwound.load());
        REQUIRE(elapsed < 1000ms);
        REQUIRE(guard.lastUnwindTime() < 1000ms);
    }

    SECTION("Exceptions from the work propagate") {
        CancellationToken token;
        DeadlineGuard guard(1000ms);
        REQUIRE_THROWS_AS(guard.run(token, []() { throw std::runtime_error("boom"); }), std::runtime_error);
    }
}
