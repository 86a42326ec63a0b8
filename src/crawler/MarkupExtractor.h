#pragma once

#include <string>
#include <optional>
#include "models/ExtractedPage.h"

namespace docs_fetch::crawler {

/**
 * Pattern-based extraction that works on raw markup without building a tree.
 * It has no notion of a main-content element, so link scores carry no main-content bonus.
 */
class MarkupExtractor {
public:
    explicit MarkupExtractor(size_t maxContentLength = 10000);

    ExtractedPage extract(const std::string& html, const std::string& pageUrl) const;

    // Strip head/script/style/noscript/template blocks and all tags, decode entities, clean
    static std::string extractText(const std::string& html);

    static std::optional<std::string> extractTitle(const std::string& html);

private:
    // Remove every <tag ...>...</tag> block, case-insensitively
    static std::string removeBlocks(const std::string& html, const std::string& tag);

    // Drop tags, turning block-level boundaries into line breaks
    static std::string stripTags(const std::string& html);

    static std::optional<std::string> attributeValue(const std::string& tag, const std::string& name);

    size_t maxContentLength;
};

} // namespace docs_fetch::crawler
