#include "VisitedSet.h"
#include "../../include/docs_fetch/common/Url.h"

namespace docs_fetch::crawler {

bool VisitedSet::tryClaim(const std::string& url) {
    auto key = common::normalizeUrl(url);
    if (!key) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    return urls.insert(*key).second;
}

size_t VisitedSet::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return urls.size();
}

} // namespace docs_fetch::crawler
