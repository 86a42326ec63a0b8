#pragma once

#include <string>
#include "../../include/docs_fetch/crawler/PageSource.h"

namespace docs_fetch::crawler {

/**
 * Probe-and-fallback policy: the lightweight source first, the rendered source
 * when the lightweight outcome is Retryable. Fatal outcomes never fall back.
 * A null rendered source disables the fallback.
 */
class FetchStrategySelector : public PageSource {
public:
    FetchStrategySelector(PageSource& lightweight, PageSource* rendered);

    FetchOutcome fetch(const std::string& url, const CancellationToken& token) override;

private:
    PageSource& lightweight;
    PageSource* rendered;
};

} // namespace docs_fetch::crawler
