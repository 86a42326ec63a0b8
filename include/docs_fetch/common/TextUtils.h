#pragma once

#include <string>
#include <cstddef>

namespace docs_fetch::common {

// Appended to content cut at the length bound.
inline const std::string kTruncationMarker = "\n\n[Content truncated]";

std::string trim(const std::string& s);

std::string toLowerAscii(std::string s);
std::string toUpperAscii(std::string s);

bool startsWithIgnoreCase(const std::string& s, const std::string& prefix);

bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

// Number of UTF-8 code points. Stray continuation bytes count as one each.
size_t utf8Length(const std::string& s);

// Collapse runs of spaces/tabs (and other inline whitespace) to one space,
// trim every line, collapse runs of blank lines to a single blank line and
// trim the whole text. cleanText(cleanText(x)) == cleanText(x).
std::string cleanText(const std::string& text);

// Collapse every whitespace run (including newlines) to one space and trim.
std::string collapseWhitespace(const std::string& text);

// Cut to exactly maxChars code points and append kTruncationMarker when
// longer, otherwise return the text unchanged.
std::string truncateContent(const std::string& text, size_t maxChars);

// Decode the handful of HTML entities that survive regex tag stripping:
// &amp; &lt; &gt; &quot; &#39; &apos; &nbsp; and decimal/hex numeric references.
std::string decodeBasicEntities(const std::string& text);

} // namespace docs_fetch::common
