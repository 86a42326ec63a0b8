#include "../../include/docs_fetch/common/TextUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace docs_fetch::common {

namespace {

inline bool isInlineSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

inline bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Collapse inline whitespace within one line; U+00A0 counts as a space.
std::string collapseLine(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    bool pendingSpace = false;
    for (size_t i = 0; i < line.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        bool space = isInlineSpace(c);
        if (c == 0xC2 && i + 1 < line.size() && static_cast<unsigned char>(line[i + 1]) == 0xA0) {
            space = true;
            ++i;
        }
        if (space) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !out.empty()) {
            out.push_back(' ');
        }
        pendingSpace = false;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

} // namespace

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string toUpperAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool startsWithIgnoreCase(const std::string& s, const std::string& prefix) {
    if (prefix.size() > s.size()) {
        return false;
    }
    return toLowerAscii(s.substr(0, prefix.size())) == toLowerAscii(prefix);
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLowerAscii(haystack).find(toLowerAscii(needle)) != std::string::npos;
}

size_t utf8Length(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if (!isContinuationByte(c)) {
            ++count;
        }
    }
    return count;
}

std::string cleanText(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            c = '\n';
        }
        if (c == '\n') {
            lines.push_back(collapseLine(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    lines.push_back(collapseLine(current));

    std::string out;
    bool blankPending = false;
    for (const auto& line : lines) {
        if (line.empty()) {
            blankPending = !out.empty();
            continue;
        }
        if (!out.empty()) {
            out += blankPending ? "\n\n" : "\n";
        }
        blankPending = false;
        out += line;
    }
    return out;
}

std::string collapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !out.empty()) {
            out.push_back(' ');
        }
        pendingSpace = false;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string truncateContent(const std::string& text, size_t maxChars) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (isContinuationByte(static_cast<unsigned char>(text[i]))) {
            continue;
        }
        if (seen == maxChars) {
            return text.substr(0, i) + kTruncationMarker;
        }
        ++seen;
    }
    return text;
}

std::string decodeBasicEntities(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            out.push_back(text[i]);
            continue;
        }
        size_t semi = text.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 10) {
            out.push_back('&');
            continue;
        }
        const std::string entity = text.substr(i + 1, semi - i - 1);
        bool decoded = true;
        if (entity == "amp") out.push_back('&');
        else if (entity == "lt") out.push_back('<');
        else if (entity == "gt") out.push_back('>');
        else if (entity == "quot") out.push_back('"');
        else if (entity == "apos" || entity == "#39") out.push_back('\'');
        else if (entity == "nbsp") out.push_back(' ');
        else if (entity.size() > 1 && entity[0] == '#') {
            try {
                uint32_t cp = (entity[1] == 'x' || entity[1] == 'X')
                    ? static_cast<uint32_t>(std::stoul(entity.substr(2), nullptr, 16))
                    : static_cast<uint32_t>(std::stoul(entity.substr(1), nullptr, 10));
                appendUtf8(out, cp);
            } catch (const std::exception&) {
                decoded = false;
            }
        } else {
            decoded = false;
        }

        if (decoded) {
            i = semi;
        } else {
            out.push_back('&');
        }
    }
    return out;
}

} // namespace docs_fetch::common
