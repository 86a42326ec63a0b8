#pragma once

#include <string>
#include <optional>
#include <curl/curl.h>
#include "../../include/docs_fetch/crawler/models/FetchOutcome.h"

namespace docs_fetch::crawler {

class FetchClassifier {
public:
    /**
     * Classify a failed curl transfer
     * @param curlCode CURL error code (not CURLE_OK)
     * @param errorMessage Error message string for the reason field
     * @param cancelled Whether the request's cancellation token fired
     * @param bodyTooLarge Whether the transfer was aborted by the body size cap
     * @return Fatal DeadlineExceeded when cancelled, Fatal InvalidUrl for malformed URLs,
     *         otherwise Retryable NetworkError
     */
    static FetchOutcome classifyTransferError(CURLcode curlCode,
                                              const std::string& errorMessage,
                                              bool cancelled,
                                              bool bodyTooLarge = false);

    /**
     * Classify a completed HTTP response
     * @return nullopt when the response is usable, otherwise the failure outcome.
     *         Non-2xx and non-text responses are Retryable on the lightweight path
     *         and Fatal on the rendered path.
     */
    static std::optional<FetchOutcome> classifyResponse(int statusCode,
                                                        const std::string& contentType,
                                                        const std::string& body,
                                                        FetchStrategy strategy);

    // text/*, application/xhtml+xml, application/xml, or no type with a markup-looking body
    static bool isTextualContent(const std::string& contentType, const std::string& body);

    static bool isSuccessStatus(int statusCode) { return statusCode >= 200 && statusCode < 300; }

private:
    static bool isInvalidUrlError(CURLcode curlCode);
};

} // namespace docs_fetch::crawler
