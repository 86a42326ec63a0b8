#include "FetchStrategySelector.h"
#include "../../include/Logger.h"

namespace docs_fetch::crawler {

FetchStrategySelector::FetchStrategySelector(PageSource& lightweight, PageSource* rendered)
    : lightweight(lightweight)
    , rendered(rendered) {
}

FetchOutcome FetchStrategySelector::fetch(const std::string& url, const CancellationToken& token) {
    if (token.isCancelled()) {
        return FetchOutcome::fatal(FetchError::DEADLINE_EXCEEDED, "Cancelled before fetch");
    }

    FetchOutcome outcome = lightweight.fetch(url, token);
    if (outcome.disposition != FetchDisposition::RETRYABLE) {
        return outcome;
    }

    if (!rendered) {
        LOG_DEBUG("Lightweight fetch failed for " + url + " (" + outcome.describe() + "), rendering disabled");
        return outcome;
    }

    if (token.isCancelled()) {
        return FetchOutcome::fatal(FetchError::DEADLINE_EXCEEDED, "Cancelled before rendered fetch");
    }

    LOG_INFO("Falling back to rendered fetch for " + url + " (" + outcome.describe() + ")");
    return rendered->fetch(url, token);
}

} // namespace docs_fetch::crawler
