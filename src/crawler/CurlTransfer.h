#pragma once

#include <string>
#include <map>
#include <memory>
#include <curl/curl.h>
#include "../../include/docs_fetch/crawler/CancellationToken.h"

namespace docs_fetch::crawler {

// curl_global_init exactly once per process
void initCurlGlobal();

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
using CurlEasyHandle = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using CurlHeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// Per-transfer state handed to the callbacks below
struct CurlTransfer {
    const CancellationToken* token = nullptr;
    size_t maxBodyBytes = 0;  // 0 means unbounded
    bool bodyTooLarge = false;
    std::string body;
    std::map<std::string, std::string> headers;  // Keys lower-cased

    // Install write, header and progress callbacks on handle
    void attach(CURL* handle);

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp);
    // Aborts the transfer once the token is cancelled
    static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                curl_off_t ultotal, curl_off_t ulnow);
};

} // namespace docs_fetch::crawler
