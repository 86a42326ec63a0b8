#pragma once

#include <string>
#include <chrono>
#include <curl/curl.h>
#include "../../include/docs_fetch/crawler/CancellationToken.h"

namespace docs_fetch::crawler {

struct RenderResponse {
    bool success = false;       // Service answered 2xx with a document
    std::string html;
    std::string error;
    int serviceStatus = 0;      // Status of the rendering service itself
    int targetStatus = 0;       // Status of the rendered page, 0 when unknown
    std::string finalUrl;       // Page URL after navigation, empty when unknown
    CURLcode curlCode = CURLE_OK;
    bool timedOut = false;      // Navigation or transfer exceeded its timeout
    std::chrono::milliseconds renderTime{0};
};

// Headless browser reachable over HTTP
class RenderService {
public:
    virtual ~RenderService() = default;

    // Health probe used when a session is launched
    virtual bool probe(const CancellationToken& token) = 0;

    // Navigate, wait for the network to settle and return the serialized DOM
    virtual RenderResponse render(const std::string& url,
                                  std::chrono::milliseconds navigationTimeout,
                                  const CancellationToken& token) = 0;

    virtual void close() {}
};

} // namespace docs_fetch::crawler
