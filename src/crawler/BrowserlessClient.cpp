#include "BrowserlessClient.h"
#include "CurlTransfer.h"
#include "../../include/Logger.h"
#include "../../include/docs_fetch/common/Url.h"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace docs_fetch::crawler {

class BrowserlessClient::Impl {
public:
    Impl(const std::string& browserlessUrl,
         const std::string& userAgent,
         const std::vector<std::string>& blockedResourceTypes)
        : browserless_url_(browserlessUrl)
        , user_agent_(userAgent)
        , blocked_resource_types_(blockedResourceTypes) {
        while (!browserless_url_.empty() && browserless_url_.back() == '/') {
            browserless_url_.pop_back();
        }
        initCurlGlobal();
    }

    bool probe(const CancellationToken& token) {
        // Newer Browserless images expose /json/version, older ones /health
        for (const char* path : {"/json/version", "/health"}) {
            if (token.isCancelled()) return false;
            if (probePath(browserless_url_ + path, token)) {
                LOG_DEBUG("Browserless probe succeeded on " + std::string(path));
                return true;
            }
        }
        return false;
    }

    RenderResponse render(const std::string& url,
                          std::chrono::milliseconds navigationTimeout,
                          const CancellationToken& token) {
        RenderResponse result;
        auto startTime = std::chrono::steady_clock::now();
        const std::string cleanedUrl = common::sanitizeUrl(url);
        LOG_INFO("Starting headless browser rendering for: " + cleanedUrl);

        CurlEasyHandle curl(curl_easy_init());
        if (!curl) {
            result.error = "Failed to create CURL handle";
            LOG_ERROR("Failed to create local CURL handle for BrowserlessClient");
            return result;
        }

        const std::string endpoint = browserless_url_ + "/content";

        json payload = {
            {"url", cleanedUrl},
            {"gotoOptions", {
                {"waitUntil", "networkidle2"},
                {"timeout", navigationTimeout.count()}
            }},
            {"rejectResourceTypes", blocked_resource_types_},
            {"userAgent", user_agent_}
        };
        const std::string jsonPayload = payload.dump();
        LOG_DEBUG("Browserless endpoint: " + endpoint + ", payload: " + jsonPayload);

        // Transfer gets a little longer than the navigation so the service can report its own timeout
        auto transferTimeout = std::min(navigationTimeout + std::chrono::milliseconds(2000), token.remaining());
        if (transferTimeout.count() <= 0) {
            result.error = "No time left for rendering";
            result.curlCode = CURLE_ABORTED_BY_CALLBACK;
            return result;
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, jsonPayload.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(jsonPayload.size()));
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(transferTimeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, 5000L);
        curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
        curl_easy_setopt(curl.get(), CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
        char errbuf[CURL_ERROR_SIZE] = {0};
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);

        curl_slist* rawHeaders = nullptr;
        rawHeaders = curl_slist_append(rawHeaders, "Content-Type: application/json");
        rawHeaders = curl_slist_append(rawHeaders, "Accept: text/html");
        CurlHeaderList headers(rawHeaders);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

        CurlTransfer transfer;
        transfer.token = &token;
        transfer.attach(curl.get());

        CURLcode res = curl_easy_perform(curl.get());
        result.renderTime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);
        result.curlCode = res;

        if (res != CURLE_OK) {
            result.error = "CURL error: " + std::string(curl_easy_strerror(res)) +
                           (errbuf[0] ? std::string(" | errbuf=") + errbuf : "");
            result.timedOut = res == CURLE_OPERATION_TIMEDOUT;
            LOG_WARNING("Browserless request failed for " + cleanedUrl + ": " + result.error +
                        " (duration_ms=" + std::to_string(result.renderTime.count()) + ")");
            return result;
        }

        long httpCode = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
        result.serviceStatus = static_cast<int>(httpCode);

        auto code = transfer.headers.find("x-response-code");
        if (code != transfer.headers.end()) {
            try {
                result.targetStatus = std::stoi(code->second);
            } catch (const std::exception& e) {
                LOG_WARNING("Unparseable X-Response-Code '" + code->second + "': " + e.what());
            }
        }
        auto finalUrl = transfer.headers.find("x-response-url");
        if (finalUrl != transfer.headers.end()) {
            result.finalUrl = finalUrl->second;
        }

        if (httpCode >= 200 && httpCode < 300) {
            result.html = std::move(transfer.body);
            result.success = true;
            LOG_INFO("Successfully rendered page via browserless: " + cleanedUrl +
                     ", size: " + std::to_string(result.html.size()) + " bytes" +
                     ", render_time_ms=" + std::to_string(result.renderTime.count()));
        } else {
            // Browserless answers 408 when the navigation itself timed out
            result.timedOut = httpCode == 408 || httpCode == 504;
            result.error = "Browserless returned HTTP " + std::to_string(httpCode) + ": " +
                           transfer.body.substr(0, 200);
            LOG_WARNING("Browserless error for " + cleanedUrl + ": " + result.error);
        }
        return result;
    }

private:
    bool probePath(const std::string& probeUrl, const CancellationToken& token) {
        // A zero curl timeout would mean no timeout at all
        auto timeout = std::min(std::chrono::milliseconds(5000), token.remaining());
        if (timeout.count() <= 0) return false;

        CurlEasyHandle curl(curl_easy_init());
        if (!curl) return false;

        curl_easy_setopt(curl.get(), CURLOPT_URL, probeUrl.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
        curl_easy_setopt(curl.get(), CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);

        CurlTransfer transfer;
        transfer.token = &token;
        transfer.maxBodyBytes = 64 * 1024;
        transfer.attach(curl.get());

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            LOG_DEBUG("Browserless probe " + probeUrl + " failed: " + curl_easy_strerror(res));
            return false;
        }
        long httpCode = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
        return httpCode >= 200 && httpCode < 300;
    }

    std::string browserless_url_;
    std::string user_agent_;
    std::vector<std::string> blocked_resource_types_;
};

BrowserlessClient::BrowserlessClient(const std::string& browserlessUrl,
                                     const std::string& userAgent,
                                     const std::vector<std::string>& blockedResourceTypes)
    : pImpl(std::make_unique<Impl>(browserlessUrl, userAgent, blockedResourceTypes)) {}

BrowserlessClient::~BrowserlessClient() = default;

bool BrowserlessClient::probe(const CancellationToken& token) {
    return pImpl->probe(token);
}

RenderResponse BrowserlessClient::render(const std::string& url,
                                         std::chrono::milliseconds navigationTimeout,
                                         const CancellationToken& token) {
    return pImpl->render(url, navigationTimeout, token);
}

} // namespace docs_fetch::crawler
