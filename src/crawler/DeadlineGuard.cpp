#include "DeadlineGuard.h"
#include "../../include/Logger.h"
#include <future>
#include <thread>

namespace docs_fetch::crawler {

DeadlineGuard::DeadlineGuard(std::chrono::milliseconds budget)
    : budgetMs(budget) {
}

bool DeadlineGuard::run(CancellationToken& token, const std::function<void()>& work) {
    using Clock = CancellationToken::Clock;
    const auto deadline = Clock::now() + budgetMs;
    token.setDeadline(deadline);

    std::packaged_task<void()> task(work);
    std::future<void> done = task.get_future();
    std::thread worker(std::move(task));

    bool finished = done.wait_until(deadline) == std::future_status::ready;
    if (!finished) {
        LOG_WARNING("Deadline of " + std::to_string(budgetMs.count()) + "ms reached, cancelling exploration");
        token.cancel();
    }

    // Cancellation is cooperative, every suspension point observes the token
    const auto joinStart = Clock::now();
    worker.join();
    if (!finished) {
        unwindTime = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - joinStart);
        LOG_DEBUG("Exploration unwound " + std::to_string(unwindTime.count()) + "ms after the deadline");
    }

    done.get();
    return finished;
}

} // namespace docs_fetch::crawler
