#pragma once

#include <string>
#include <vector>
#include <optional>
#include <gumbo.h>

namespace docs_fetch::crawler {

/**
 * Owns one gumbo parse tree and answers the small set of queries extraction needs.
 * Selectors are single simple selectors: "tag", ".class", "#id" or "[attr=\"value\"]".
 */
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html);
    ~HtmlDocument();

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    const GumboNode* root() const;
    const GumboNode* body() const;

    // <title> text, whitespace-collapsed; nullopt when missing or blank
    std::optional<std::string> title() const;

    // href of the first <base> element, if any
    std::optional<std::string> baseHref() const;

    // All elements matching the selector, in document order
    std::vector<const GumboNode*> select(const std::string& selector) const;

    // Visible text of a subtree; script, style, noscript and template are skipped
    // and block-level elements are separated by line breaks
    static std::string textOf(const GumboNode* node);

    static bool matches(const GumboNode* node, const std::string& selector);

    static std::optional<std::string> attribute(const GumboNode* node, const char* name);

    static bool isAncestorOf(const GumboNode* ancestor, const GumboNode* node);

private:
    GumboOutput* output;
    std::string source;  // gumbo keeps pointers into the input buffer
};

} // namespace docs_fetch::crawler
