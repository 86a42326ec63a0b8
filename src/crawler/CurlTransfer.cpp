#include "CurlTransfer.h"
#include "../../include/docs_fetch/common/TextUtils.h"
#include "../../include/Logger.h"
#include <mutex>

namespace docs_fetch::crawler {

void initCurlGlobal() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            LOG_ERROR("curl_global_init failed: " + std::string(curl_easy_strerror(rc)));
        }
    });
}

void CurlTransfer::attach(CURL* handle) {
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, this);
    // Required for timeouts in multi-threaded programs
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
}

size_t CurlTransfer::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* transfer = static_cast<CurlTransfer*>(userp);
    size_t totalSize = size * nmemb;
    if (transfer->maxBodyBytes > 0 && transfer->body.size() + totalSize > transfer->maxBodyBytes) {
        transfer->bodyTooLarge = true;
        return 0;  // Makes curl fail with CURLE_WRITE_ERROR
    }
    transfer->body.append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

size_t CurlTransfer::headerCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* transfer = static_cast<CurlTransfer*>(userp);
    size_t totalSize = size * nitems;
    std::string line(buffer, totalSize);

    // A new status line starts a new header block (redirects)
    if (common::startsWithIgnoreCase(line, "HTTP/")) {
        transfer->headers.clear();
        return totalSize;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = common::toLowerAscii(common::trim(line.substr(0, colon)));
        transfer->headers[name] = common::trim(line.substr(colon + 1));
    }
    return totalSize;
}

int CurlTransfer::progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                   curl_off_t ultotal, curl_off_t ulnow) {
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    auto* transfer = static_cast<CurlTransfer*>(clientp);
    if (transfer->token && transfer->token->isCancelled()) {
        return 1;  // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

} // namespace docs_fetch::crawler
