#pragma once

#include <chrono>
#include <functional>
#include "../../include/docs_fetch/crawler/CancellationToken.h"

namespace docs_fetch::crawler {

// Runs a unit of work under a global time budget
class DeadlineGuard {
public:
    explicit DeadlineGuard(std::chrono::milliseconds budget);

    /**
     * Run work on a worker thread with token's deadline set to now + budget.
     * On expiry the token is cancelled and the worker is joined before returning,
     * so everything the work owns has been released.
     * Exceptions thrown by work are rethrown here.
     * @return true if work finished within the budget, false if it timed out
     */
    bool run(CancellationToken& token, const std::function<void()>& work);

    std::chrono::milliseconds budget() const { return budgetMs; }

    // Time from expiry until the worker had unwound, for the last timed-out run
    std::chrono::milliseconds lastUnwindTime() const { return unwindTime; }

private:
    std::chrono::milliseconds budgetMs;
    std::chrono::milliseconds unwindTime{0};
};

} // namespace docs_fetch::crawler
