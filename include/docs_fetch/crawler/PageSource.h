#pragma once

#include <string>
#include "CancellationToken.h"
#include "models/FetchOutcome.h"

namespace docs_fetch::crawler {

// One way of retrieving a page. Implementations must be safe to call from several threads.
class PageSource {
public:
    virtual ~PageSource() = default;

    // Never throws for transport problems; failures come back as Retryable or Fatal outcomes
    virtual FetchOutcome fetch(const std::string& url, const CancellationToken& token) = 0;
};

} // namespace docs_fetch::crawler
