#pragma once

#include <string>

namespace docs_fetch::crawler {

// Classified fetch failures
enum class FetchError {
    NONE,
    NETWORK_ERROR,      // DNS/connect/transfer failure, always recoverable by fallback or branch skip
    HTTP_STATUS_ERROR,  // non-2xx response
    NON_TEXT_RESPONSE,  // binary or unexpected content type
    RENDER_TIMEOUT,     // every navigation attempt timed out
    EMPTY_CONTENT,      // rendered page has no usable text
    INVALID_URL,        // malformed or non-http(s) URL, never retried
    DEADLINE_EXCEEDED   // request budget expired
};

// How the strategy selector should treat an outcome
enum class FetchDisposition {
    SUCCESS,
    RETRYABLE,  // try the next strategy
    FATAL       // abort this branch
};

inline std::string fetchErrorName(FetchError error) {
    switch (error) {
        case FetchError::NONE: return "None";
        case FetchError::NETWORK_ERROR: return "NetworkError";
        case FetchError::HTTP_STATUS_ERROR: return "HttpStatusError";
        case FetchError::NON_TEXT_RESPONSE: return "NonTextResponse";
        case FetchError::RENDER_TIMEOUT: return "RenderTimeout";
        case FetchError::EMPTY_CONTENT: return "EmptyContent";
        case FetchError::INVALID_URL: return "InvalidUrl";
        case FetchError::DEADLINE_EXCEEDED: return "DeadlineExceeded";
    }
    return "Unknown";
}

} // namespace docs_fetch::crawler
