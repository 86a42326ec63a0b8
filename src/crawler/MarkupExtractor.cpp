#include "MarkupExtractor.h"
#include "LinkScorer.h"
#include "ContentExtractor.h"
#include "../../include/docs_fetch/common/TextUtils.h"
#include "../../include/docs_fetch/common/Url.h"
#include "../../include/Logger.h"
#include <regex>
#include <cctype>
#include <algorithm>

namespace docs_fetch::crawler {

namespace {

const std::vector<std::string> kRemovedBlocks = {"head", "script", "style", "noscript", "template"};

const std::vector<std::string> kBlockTags = {
    "p", "div", "br", "hr", "h1", "h2", "h3", "h4", "h5", "h6", "ul", "ol", "li",
    "dl", "dt", "dd", "pre", "blockquote", "table", "tr", "section", "article",
    "main", "header", "footer", "nav", "aside", "figure", "form"
};

// Position of the next "<tag" followed by whitespace, '>' or '/', case-insensitive
size_t findOpenTag(const std::string& lower, const std::string& tag, size_t from) {
    const std::string needle = "<" + tag;
    size_t pos = lower.find(needle, from);
    while (pos != std::string::npos) {
        size_t after = pos + needle.size();
        if (after >= lower.size()) return std::string::npos;
        char c = lower[after];
        if (c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c))) {
            return pos;
        }
        pos = lower.find(needle, after);
    }
    return std::string::npos;
}

// Position of the next "</tag" followed by whitespace or '>', case-insensitive
size_t findCloseTag(const std::string& lower, const std::string& tag, size_t from) {
    const std::string needle = "</" + tag;
    size_t pos = lower.find(needle, from);
    while (pos != std::string::npos) {
        size_t after = pos + needle.size();
        if (after >= lower.size()) return std::string::npos;
        char c = lower[after];
        if (c == '>' || std::isspace(static_cast<unsigned char>(c))) {
            return pos;
        }
        pos = lower.find(needle, after);
    }
    return std::string::npos;
}

std::string tagName(const std::string& tag) {
    size_t i = 1;
    if (i < tag.size() && tag[i] == '/') ++i;
    size_t start = i;
    while (i < tag.size() && std::isalnum(static_cast<unsigned char>(tag[i]))) ++i;
    return common::toLowerAscii(tag.substr(start, i - start));
}

} // namespace

MarkupExtractor::MarkupExtractor(size_t maxContentLength)
    : maxContentLength(maxContentLength) {
}

std::string MarkupExtractor::removeBlocks(const std::string& html, const std::string& tag) {
    const std::string lower = common::toLowerAscii(html);
    std::string out;
    out.reserve(html.size());

    size_t pos = 0;
    while (pos < html.size()) {
        size_t start = findOpenTag(lower, tag, pos);
        if (start == std::string::npos) {
            out.append(html, pos, std::string::npos);
            break;
        }
        out.append(html, pos, start - pos);

        size_t end = findCloseTag(lower, tag, start);
        if (end == std::string::npos) {
            // Unterminated block swallows the rest of the document
            break;
        }
        size_t close = lower.find('>', end);
        pos = close == std::string::npos ? html.size() : close + 1;
        out += ' ';
    }
    return out;
}

std::string MarkupExtractor::stripTags(const std::string& html) {
    std::string out;
    out.reserve(html.size());

    size_t pos = 0;
    while (pos < html.size()) {
        size_t open = html.find('<', pos);
        if (open == std::string::npos) {
            out.append(html, pos, std::string::npos);
            break;
        }
        out.append(html, pos, open - pos);

        // Comments may contain '>'
        if (html.compare(open, 4, "<!--") == 0) {
            size_t end = html.find("-->", open + 4);
            pos = end == std::string::npos ? html.size() : end + 3;
            continue;
        }

        size_t close = html.find('>', open);
        if (close == std::string::npos) {
            break;
        }
        std::string name = tagName(html.substr(open, close - open + 1));
        bool block = std::find(kBlockTags.begin(), kBlockTags.end(), name) != kBlockTags.end();
        out += block ? '\n' : ' ';
        pos = close + 1;
    }
    return out;
}

std::string MarkupExtractor::extractText(const std::string& html) {
    std::string stripped = html;
    for (const auto& tag : kRemovedBlocks) {
        stripped = removeBlocks(stripped, tag);
    }
    stripped = stripTags(stripped);
    return common::cleanText(common::decodeBasicEntities(stripped));
}

std::optional<std::string> MarkupExtractor::extractTitle(const std::string& html) {
    const std::string lower = common::toLowerAscii(html);
    size_t open = findOpenTag(lower, "title", 0);
    if (open == std::string::npos) return std::nullopt;
    size_t contentStart = lower.find('>', open);
    if (contentStart == std::string::npos) return std::nullopt;
    size_t end = findCloseTag(lower, "title", contentStart);
    if (end == std::string::npos) return std::nullopt;

    std::string title = common::collapseWhitespace(
        common::decodeBasicEntities(html.substr(contentStart + 1, end - contentStart - 1)));
    if (title.empty()) return std::nullopt;
    return title;
}

std::optional<std::string> MarkupExtractor::attributeValue(const std::string& tag, const std::string& name) {
    // Only ever applied to a single start tag, never to the whole document
    const std::regex pattern("\\s" + name + "\\s*=\\s*(?:\"([^\"]*)\"|'([^']*)'|([^\\s>]+))",
                             std::regex::icase);
    std::smatch match;
    if (!std::regex_search(tag, match, pattern)) {
        return std::nullopt;
    }
    for (size_t group = 1; group <= 3; ++group) {
        if (match[group].matched) {
            return common::decodeBasicEntities(match[group].str());
        }
    }
    return std::nullopt;
}

ExtractedPage MarkupExtractor::extract(const std::string& html, const std::string& pageUrl) const {
    LOG_DEBUG("MarkupExtractor::extract called for URL: " + pageUrl + " with HTML length: " +
              std::to_string(html.length()) + " bytes");
    ExtractedPage page;
    page.content = common::truncateContent(extractText(html), maxContentLength);

    page.title = extractTitle(html);
    if (!page.title) {
        page.title = ContentExtractor::titleFromUrl(pageUrl);
    }

    const std::string lower = common::toLowerAscii(html);

    std::string base = pageUrl;
    size_t baseTag = findOpenTag(lower, "base", 0);
    if (baseTag != std::string::npos) {
        size_t close = lower.find('>', baseTag);
        if (close != std::string::npos) {
            if (auto href = attributeValue(html.substr(baseTag, close - baseTag + 1), "href")) {
                if (auto resolved = common::resolveUrl(*href, pageUrl)) {
                    base = *resolved;
                }
            }
        }
    }

    size_t pos = 0;
    while ((pos = findOpenTag(lower, "a", pos)) != std::string::npos) {
        size_t tagEnd = lower.find('>', pos);
        if (tagEnd == std::string::npos) break;
        std::string startTag = html.substr(pos, tagEnd - pos + 1);

        size_t closeTag = findCloseTag(lower, "a", tagEnd);
        size_t textEnd = closeTag == std::string::npos ? tagEnd + 1 : closeTag;
        std::string inner = html.substr(tagEnd + 1, textEnd - tagEnd - 1);
        pos = textEnd;

        auto href = attributeValue(startTag, "href");
        if (!href) continue;

        std::string text = common::decodeBasicEntities(stripTags(inner));
        if (auto candidate = LinkScorer::makeCandidate(*href, text, base, false)) {
            page.links.push_back(std::move(*candidate));
        }
    }

    LOG_DEBUG("Markup extraction produced " + std::to_string(page.links.size()) + " links for " + pageUrl);
    return page;
}

} // namespace docs_fetch::crawler
