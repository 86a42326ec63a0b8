#pragma once

#include <string>
#include <optional>
#include <map>
#include <string_view>

namespace docs_fetch::common {

// Drop zero-width characters (U+200B..U+200D, U+2060), the BOM, bidi controls,
// ASCII control bytes and malformed UTF-8, then trim surrounding spaces.
// Other non-ASCII characters pass through untouched.
std::string sanitizeUrl(const std::string& input);

// Parse an absolute http(s) URL and return its canonical form
// (scheme and host lower-cased, fragment dropped). nullopt when the input
// is not an absolute http or https URL.
std::optional<std::string> normalizeUrl(const std::string& url);

// Resolve href against base per RFC 3986 and normalize the result.
// nullopt when the base is unusable, the reference cannot be parsed,
// or the result is not http(s).
std::optional<std::string> resolveUrl(const std::string& href, const std::string& base);

// Lower-cased hostname of an absolute URL, empty when unparseable.
std::string extractHost(const std::string& url);

// Percent-decoded path of an absolute URL, nullopt when unparseable.
std::optional<std::string> extractPath(const std::string& url);

bool isSameHost(const std::string& a, const std::string& b);

// Decode %XX escapes and '+' as used in query strings. Malformed escapes are kept verbatim.
std::string urlDecode(std::string_view encoded);

// Split "a=1&b=2" into decoded key/value pairs; later keys overwrite earlier ones.
std::map<std::string, std::string> parseQueryString(std::string_view query);

} // namespace docs_fetch::common
