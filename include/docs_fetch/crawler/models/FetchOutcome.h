#pragma once

#include <string>
#include "FetchError.h"

namespace docs_fetch::crawler {

// Which strategy produced an outcome
enum class FetchStrategy {
    LIGHTWEIGHT,
    RENDERED
};

// Tagged result of one fetch attempt: Success{content} | Retryable{reason} | Fatal{reason}.
struct FetchOutcome {
    FetchDisposition disposition = FetchDisposition::FATAL;
    FetchError error = FetchError::NONE;
    FetchStrategy strategy = FetchStrategy::LIGHTWEIGHT;
    int statusCode = 0;
    std::string contentType;
    std::string content;
    std::string finalUrl;  // After redirects
    std::string reason;

    bool ok() const { return disposition == FetchDisposition::SUCCESS; }

    static FetchOutcome success(std::string content, std::string finalUrl, int statusCode,
                                std::string contentType, FetchStrategy strategy) {
        FetchOutcome outcome;
        outcome.disposition = FetchDisposition::SUCCESS;
        outcome.content = std::move(content);
        outcome.finalUrl = std::move(finalUrl);
        outcome.statusCode = statusCode;
        outcome.contentType = std::move(contentType);
        outcome.strategy = strategy;
        return outcome;
    }

    static FetchOutcome retryable(FetchError error, std::string reason, int statusCode = 0) {
        FetchOutcome outcome;
        outcome.disposition = FetchDisposition::RETRYABLE;
        outcome.error = error;
        outcome.reason = std::move(reason);
        outcome.statusCode = statusCode;
        return outcome;
    }

    static FetchOutcome fatal(FetchError error, std::string reason, int statusCode = 0) {
        FetchOutcome outcome;
        outcome.disposition = FetchDisposition::FATAL;
        outcome.error = error;
        outcome.reason = std::move(reason);
        outcome.statusCode = statusCode;
        return outcome;
    }

    // "HttpStatusError{404}: ..." style description for logs and error fields
    std::string describe() const {
        std::string name = fetchErrorName(error);
        if (error == FetchError::HTTP_STATUS_ERROR) {
            name += "{" + std::to_string(statusCode) + "}";
        }
        return reason.empty() ? name : name + ": " + reason;
    }
};

} // namespace docs_fetch::crawler
