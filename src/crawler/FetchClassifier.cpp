#include "FetchClassifier.h"
#include "../../include/docs_fetch/common/TextUtils.h"
#include "../../include/Logger.h"

namespace docs_fetch::crawler {

FetchOutcome FetchClassifier::classifyTransferError(CURLcode curlCode,
                                                    const std::string& errorMessage,
                                                    bool cancelled,
                                                    bool bodyTooLarge) {
    LOG_DEBUG("Classifying transfer failure - CURL: " + std::to_string(static_cast<int>(curlCode)) +
              ", Error: " + errorMessage);

    // The progress callback aborts transfers once the token fires
    if (cancelled) {
        LOG_DEBUG("Classified as DeadlineExceeded (cancelled)");
        return FetchOutcome::fatal(FetchError::DEADLINE_EXCEEDED, "Request cancelled: " + errorMessage);
    }

    if (isInvalidUrlError(curlCode)) {
        LOG_DEBUG("Classified as InvalidUrl (CURL error " + std::to_string(static_cast<int>(curlCode)) + ")");
        return FetchOutcome::fatal(FetchError::INVALID_URL, errorMessage);
    }

    if (bodyTooLarge) {
        return FetchOutcome::retryable(FetchError::NETWORK_ERROR, "Response body exceeds size limit");
    }

    return FetchOutcome::retryable(FetchError::NETWORK_ERROR, errorMessage);
}

std::optional<FetchOutcome> FetchClassifier::classifyResponse(int statusCode,
                                                              const std::string& contentType,
                                                              const std::string& body,
                                                              FetchStrategy strategy) {
    const bool rendered = strategy == FetchStrategy::RENDERED;

    if (!isSuccessStatus(statusCode)) {
        std::string reason = "HTTP " + std::to_string(statusCode);
        LOG_DEBUG("Classified as HttpStatusError (" + reason + ", " +
                  (rendered ? "rendered" : "lightweight") + ")");
        return rendered ? FetchOutcome::fatal(FetchError::HTTP_STATUS_ERROR, reason, statusCode)
                        : FetchOutcome::retryable(FetchError::HTTP_STATUS_ERROR, reason, statusCode);
    }

    if (!isTextualContent(contentType, body)) {
        std::string reason = "Unsupported content type: " + (contentType.empty() ? std::string("<none>") : contentType);
        LOG_DEBUG("Classified as NonTextResponse (" + reason + ")");
        return rendered ? FetchOutcome::fatal(FetchError::NON_TEXT_RESPONSE, reason, statusCode)
                        : FetchOutcome::retryable(FetchError::NON_TEXT_RESPONSE, reason, statusCode);
    }

    return std::nullopt;
}

bool FetchClassifier::isTextualContent(const std::string& contentType, const std::string& body) {
    std::string type = common::toLowerAscii(common::trim(contentType));
    auto semicolon = type.find(';');
    if (semicolon != std::string::npos) {
        type = common::trim(type.substr(0, semicolon));
    }

    if (type.empty()) {
        // No declared type: accept bodies that look like markup
        std::string head = common::trim(body.substr(0, 512));
        return !head.empty() && head[0] == '<';
    }

    return common::startsWithIgnoreCase(type, "text/") ||
           type == "application/xhtml+xml" ||
           type == "application/xml";
}

bool FetchClassifier::isInvalidUrlError(CURLcode curlCode) {
    switch (curlCode) {
        case CURLE_URL_MALFORMAT:         // URL malformed
        case CURLE_UNSUPPORTED_PROTOCOL:  // Protocol not supported
            return true;
        default:
            return false;
    }
}

} // namespace docs_fetch::crawler
