#include "HtmlDocument.h"
#include "../../include/docs_fetch/common/TextUtils.h"
#include "../../include/Logger.h"
#include <stdexcept>
#include <cctype>

namespace docs_fetch::crawler {

namespace {

bool isSkippedTag(GumboTag tag) {
    return tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE ||
           tag == GUMBO_TAG_NOSCRIPT || tag == GUMBO_TAG_TEMPLATE;
}

bool isBlockTag(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_P: case GUMBO_TAG_DIV: case GUMBO_TAG_BR: case GUMBO_TAG_HR:
        case GUMBO_TAG_H1: case GUMBO_TAG_H2: case GUMBO_TAG_H3:
        case GUMBO_TAG_H4: case GUMBO_TAG_H5: case GUMBO_TAG_H6:
        case GUMBO_TAG_UL: case GUMBO_TAG_OL: case GUMBO_TAG_LI:
        case GUMBO_TAG_DL: case GUMBO_TAG_DT: case GUMBO_TAG_DD:
        case GUMBO_TAG_PRE: case GUMBO_TAG_BLOCKQUOTE: case GUMBO_TAG_TABLE:
        case GUMBO_TAG_TR: case GUMBO_TAG_THEAD: case GUMBO_TAG_TBODY:
        case GUMBO_TAG_SECTION: case GUMBO_TAG_ARTICLE: case GUMBO_TAG_MAIN:
        case GUMBO_TAG_HEADER: case GUMBO_TAG_FOOTER: case GUMBO_TAG_NAV:
        case GUMBO_TAG_ASIDE: case GUMBO_TAG_FIGURE: case GUMBO_TAG_FIGCAPTION:
        case GUMBO_TAG_FORM: case GUMBO_TAG_DETAILS: case GUMBO_TAG_SUMMARY:
            return true;
        default:
            return false;
    }
}

void appendText(const GumboNode* node, std::string& text) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_CDATA:
        case GUMBO_NODE_WHITESPACE:
            text += node->v.text.text;
            break;
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE: {
            GumboTag tag = node->v.element.tag;
            if (node->type == GUMBO_NODE_TEMPLATE || isSkippedTag(tag)) {
                return;
            }
            bool block = isBlockTag(tag);
            if (block) text += '\n';
            // Table cells stay on one line
            if (tag == GUMBO_TAG_TD || tag == GUMBO_TAG_TH) text += ' ';
            for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
                appendText(static_cast<const GumboNode*>(node->v.element.children.data[i]), text);
            }
            if (block) text += '\n';
            break;
        }
        default:
            break;
    }
}

void collect(const GumboNode* node, const std::string& selector, std::vector<const GumboNode*>& out) {
    if (node->type != GUMBO_NODE_ELEMENT) return;
    if (HtmlDocument::matches(node, selector)) {
        out.push_back(node);
    }
    for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
        collect(static_cast<const GumboNode*>(node->v.element.children.data[i]), selector, out);
    }
}

const GumboNode* findFirst(const GumboNode* node, GumboTag tag) {
    if (node->type != GUMBO_NODE_ELEMENT) return nullptr;
    if (node->v.element.tag == tag) return node;
    for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
        if (auto* found = findFirst(static_cast<const GumboNode*>(node->v.element.children.data[i]), tag)) {
            return found;
        }
    }
    return nullptr;
}

bool hasClass(const GumboNode* node, const std::string& cls) {
    auto classes = HtmlDocument::attribute(node, "class");
    if (!classes) return false;
    const std::string& list = *classes;
    size_t pos = 0;
    while (pos < list.size()) {
        while (pos < list.size() && std::isspace(static_cast<unsigned char>(list[pos]))) ++pos;
        size_t end = pos;
        while (end < list.size() && !std::isspace(static_cast<unsigned char>(list[end]))) ++end;
        if (end > pos && list.compare(pos, end - pos, cls) == 0) return true;
        pos = end;
    }
    return false;
}

} // namespace

HtmlDocument::HtmlDocument(const std::string& html)
    : output(nullptr)
    , source(html) {
    output = gumbo_parse_with_options(&kGumboDefaultOptions, source.c_str(), source.size());
    if (!output) {
        LOG_ERROR("Failed to parse HTML with Gumbo");
        throw std::runtime_error("Failed to parse HTML");
    }
}

HtmlDocument::~HtmlDocument() {
    if (output) {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
}

const GumboNode* HtmlDocument::root() const {
    return output->root;
}

const GumboNode* HtmlDocument::body() const {
    return findFirst(output->root, GUMBO_TAG_BODY);
}

std::optional<std::string> HtmlDocument::title() const {
    const GumboNode* titleNode = findFirst(output->root, GUMBO_TAG_TITLE);
    if (!titleNode) {
        return std::nullopt;
    }
    std::string text;
    for (unsigned int i = 0; i < titleNode->v.element.children.length; ++i) {
        auto* child = static_cast<const GumboNode*>(titleNode->v.element.children.data[i]);
        if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_WHITESPACE) {
            text += child->v.text.text;
        }
    }
    text = common::collapseWhitespace(text);
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

std::optional<std::string> HtmlDocument::baseHref() const {
    const GumboNode* base = findFirst(output->root, GUMBO_TAG_BASE);
    if (!base) {
        return std::nullopt;
    }
    return attribute(base, "href");
}

std::vector<const GumboNode*> HtmlDocument::select(const std::string& selector) const {
    std::vector<const GumboNode*> matches;
    collect(output->root, selector, matches);
    return matches;
}

std::string HtmlDocument::textOf(const GumboNode* node) {
    std::string text;
    if (node) {
        appendText(node, text);
    }
    return text;
}

bool HtmlDocument::matches(const GumboNode* node, const std::string& selector) {
    if (node->type != GUMBO_NODE_ELEMENT || selector.empty()) {
        return false;
    }

    if (selector[0] == '.') {
        return hasClass(node, selector.substr(1));
    }

    if (selector[0] == '#') {
        auto id = attribute(node, "id");
        return id && *id == selector.substr(1);
    }

    if (selector[0] == '[') {
        // [attr="value"] or [attr]
        std::string inner = selector.substr(1, selector.size() - 2);
        auto eq = inner.find('=');
        std::string name = inner.substr(0, eq);
        auto value = attribute(node, name.c_str());
        if (eq == std::string::npos) {
            return value.has_value();
        }
        std::string expected = inner.substr(eq + 1);
        if (expected.size() >= 2 && (expected.front() == '"' || expected.front() == '\'')) {
            expected = expected.substr(1, expected.size() - 2);
        }
        return value && *value == expected;
    }

    GumboTag tag = gumbo_tag_enum(selector.c_str());
    return tag != GUMBO_TAG_UNKNOWN && node->v.element.tag == tag;
}

std::optional<std::string> HtmlDocument::attribute(const GumboNode* node, const char* name) {
    if (node->type != GUMBO_NODE_ELEMENT) {
        return std::nullopt;
    }
    GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    if (!attr) {
        return std::nullopt;
    }
    return std::string(attr->value);
}

bool HtmlDocument::isAncestorOf(const GumboNode* ancestor, const GumboNode* node) {
    if (!ancestor) return false;
    for (const GumboNode* current = node; current; current = current->parent) {
        if (current == ancestor) return true;
    }
    return false;
}

} // namespace docs_fetch::crawler
