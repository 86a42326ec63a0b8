#include "LinkScorer.h"
#include "../../include/docs_fetch/common/TextUtils.h"
#include "../../include/docs_fetch/common/Url.h"
#include <algorithm>
#include <unordered_set>

namespace docs_fetch::crawler {

namespace {

const std::vector<std::string> kSkippedHrefPrefixes = {"#", "javascript:", "mailto:", "tel:"};

const std::vector<std::string> kBoilerplateLabels = {
    "home", "contact", "about", "login", "sign up",
    "register", "search", "privacy", "terms", "cookies"
};

} // namespace

const std::vector<std::string>& LinkScorer::informativeTerms() {
    static const std::vector<std::string> terms = {
        "guide", "docs", "tutorial", "reference", "example", "api", "learn", "how to"
    };
    return terms;
}

double LinkScorer::score(const std::string& text, bool inMainContent) {
    double relevance = std::min(static_cast<double>(common::utf8Length(text)) / 10.0, 5.0);

    if (inMainContent) {
        relevance += 5.0;
    }

    for (const auto& term : informativeTerms()) {
        if (common::containsIgnoreCase(text, term)) {
            relevance += 2.0;
        }
    }
    return relevance;
}

std::optional<LinkCandidate> LinkScorer::makeCandidate(const std::string& href,
                                                       const std::string& rawText,
                                                       const std::string& baseUrl,
                                                       bool inMainContent) {
    std::string target = common::trim(href);
    if (target.empty()) {
        return std::nullopt;
    }
    for (const auto& prefix : kSkippedHrefPrefixes) {
        if (common::startsWithIgnoreCase(target, prefix)) {
            return std::nullopt;
        }
    }

    auto resolved = common::resolveUrl(target, baseUrl);
    if (!resolved) {
        return std::nullopt;
    }

    LinkCandidate candidate;
    candidate.url = *resolved;
    candidate.text = common::collapseWhitespace(rawText);
    candidate.inMainContent = inMainContent;
    candidate.relevance = score(candidate.text, inMainContent);
    return candidate;
}

bool LinkScorer::isBoilerplate(const std::string& text) {
    std::string label = common::toLowerAscii(common::trim(text));
    return std::find(kBoilerplateLabels.begin(), kBoilerplateLabels.end(), label) != kBoilerplateLabels.end();
}

std::vector<LinkCandidate> LinkScorer::rank(std::vector<LinkCandidate> links, size_t maxLinks) {
    links.erase(std::remove_if(links.begin(), links.end(),
                               [](const LinkCandidate& link) { return isBoilerplate(link.text); }),
                links.end());

    std::stable_sort(links.begin(), links.end(),
                     [](const LinkCandidate& a, const LinkCandidate& b) { return a.relevance > b.relevance; });

    std::vector<LinkCandidate> ranked;
    std::unordered_set<std::string> seen;
    for (auto& link : links) {
        if (ranked.size() >= maxLinks) break;
        if (seen.insert(link.url).second) {
            ranked.push_back(std::move(link));
        }
    }
    return ranked;
}

} // namespace docs_fetch::crawler
