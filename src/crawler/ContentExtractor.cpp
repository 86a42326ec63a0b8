#include "ContentExtractor.h"
#include "HtmlDocument.h"
#include "LinkScorer.h"
#include "../../include/docs_fetch/common/TextUtils.h"
#include "../../include/docs_fetch/common/Url.h"
#include "../../include/Logger.h"
#include <regex>

namespace docs_fetch::crawler {

namespace {

void collectAnchors(const GumboNode* node, std::vector<const GumboNode*>& anchors) {
    if (node->type != GUMBO_NODE_ELEMENT) return;
    if (node->v.element.tag == GUMBO_TAG_A) {
        anchors.push_back(node);
    }
    for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
        collectAnchors(static_cast<const GumboNode*>(node->v.element.children.data[i]), anchors);
    }
}

} // namespace

ContentExtractor::ContentExtractor(size_t maxContentLength, size_t mainContentThreshold)
    : maxContentLength(maxContentLength)
    , mainContentThreshold(mainContentThreshold) {
}

const std::vector<std::string>& ContentExtractor::mainContentSelectors() {
    static const std::vector<std::string> selectors = {
        ".markdown-body", ".readme", ".documentation", "[role=\"main\"]", "main", "article",
        ".content", "#content", ".main-content", "#main-content",
        ".docs-content", ".docs-body", ".docs-markdown", "body"
    };
    return selectors;
}

ContentExtractor::MainContent ContentExtractor::selectMainContent(const HtmlDocument& document) const {
    MainContent fallback;
    size_t fallbackLength = 0;

    for (const auto& selector : mainContentSelectors()) {
        // Longest match for this selector, the first one wins ties
        MainContent best;
        size_t bestLength = 0;
        for (const GumboNode* node : document.select(selector)) {
            std::string text = common::cleanText(HtmlDocument::textOf(node));
            size_t length = common::utf8Length(text);
            if (!best.node || length > bestLength) {
                best.node = node;
                best.text = std::move(text);
                best.selector = selector;
                bestLength = length;
            }
        }
        if (!best.node) {
            continue;
        }
        if (bestLength > mainContentThreshold) {
            LOG_DEBUG("Main content selected by '" + selector + "' (" + std::to_string(bestLength) + " chars)");
            return best;
        }
        if (!fallback.node || bestLength > fallbackLength) {
            fallback = std::move(best);
            fallbackLength = bestLength;
        }
    }

    if (fallback.node) {
        LOG_DEBUG("No element above threshold, using longest candidate '" + fallback.selector + "'");
        return fallback;
    }

    // Documents without a body element (fragments) fall back to the whole tree
    MainContent whole;
    whole.node = document.root();
    whole.text = common::cleanText(HtmlDocument::textOf(whole.node));
    return whole;
}

std::string ContentExtractor::extractText(const std::string& html) const {
    HtmlDocument document(html);
    return selectMainContent(document).text;
}

ExtractedPage ContentExtractor::extract(const std::string& html, const std::string& pageUrl) const {
    LOG_DEBUG("ContentExtractor::extract called for URL: " + pageUrl + " with HTML length: " +
              std::to_string(html.length()) + " bytes");
    ExtractedPage page;
    HtmlDocument document(html);

    MainContent main = selectMainContent(document);
    page.matchedSelector = main.selector;
    page.content = common::truncateContent(main.text, maxContentLength);

    page.title = document.title();
    if (!page.title) {
        page.title = titleFromUrl(pageUrl);
    }

    // <base href> overrides the document URL for relative links
    std::string base = pageUrl;
    if (auto baseHref = document.baseHref()) {
        if (auto resolvedBase = common::resolveUrl(*baseHref, pageUrl)) {
            base = *resolvedBase;
        }
    }

    std::vector<const GumboNode*> anchors;
    collectAnchors(document.root(), anchors);
    for (const GumboNode* anchor : anchors) {
        auto href = HtmlDocument::attribute(anchor, "href");
        if (!href) {
            continue;
        }
        bool inMain = HtmlDocument::isAncestorOf(main.node, anchor);
        if (auto candidate = LinkScorer::makeCandidate(*href, HtmlDocument::textOf(anchor), base, inMain)) {
            page.links.push_back(std::move(*candidate));
        }
    }

    LOG_DEBUG("Extracted " + std::to_string(common::utf8Length(page.content)) + " chars and " +
              std::to_string(page.links.size()) + " links from " + pageUrl);
    return page;
}

std::optional<std::string> ContentExtractor::titleFromUrl(const std::string& url) {
    auto decoded = common::extractPath(url);
    if (!decoded) {
        return std::nullopt;
    }
    std::string path = *decoded;

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    auto slash = path.rfind('/');
    std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);
    if (segment.empty()) {
        return std::nullopt;
    }

    static const std::regex separators("[_-]");
    static const std::regex extension("\\.\\w+$");
    static const std::regex camelCase("([a-z])([A-Z])");
    segment = std::regex_replace(segment, separators, " ");
    segment = std::regex_replace(segment, extension, "");
    segment = std::regex_replace(segment, camelCase, "$1 $2");
    segment = common::trim(segment);

    if (segment.empty()) {
        return std::nullopt;
    }
    return segment;
}

} // namespace docs_fetch::crawler
