#pragma once

#include <string>
#include <unordered_set>
#include <mutex>

namespace docs_fetch::crawler {

// URIs fetched or in flight during one exploration, keyed by their normalized form
class VisitedSet {
public:
    /**
     * Atomically check-and-insert
     * @return true if the URL was not seen before and is now claimed by the caller;
     *         false if already claimed or not a valid http(s) URL
     */
    bool tryClaim(const std::string& url);

    size_t size() const;

private:
    mutable std::mutex mutex;
    std::unordered_set<std::string> urls;
};

} // namespace docs_fetch::crawler
