#include "../../include/docs_fetch/common/Url.h"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>

namespace docs_fetch::common {

namespace {

// Bytes in the UTF-8 sequence opened by lead, 0 when lead cannot start one
size_t sequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead < 0xC0) return 0;
    if (lead < 0xE0) return 2;
    if (lead < 0xF0) return 3;
    if (lead < 0xF8) return 4;
    return 0;
}

uint32_t decodeThreeByte(const std::string& s, size_t at) {
    return (static_cast<uint32_t>(static_cast<unsigned char>(s[at]) & 0x0F) << 12) |
           (static_cast<uint32_t>(static_cast<unsigned char>(s[at + 1]) & 0x3F) << 6) |
           static_cast<uint32_t>(static_cast<unsigned char>(s[at + 2]) & 0x3F);
}

// Zero-width characters, BOM and bidi controls. All of them encode in three bytes.
bool isInvisibleCodepoint(uint32_t cp) {
    return cp == 0x200B || cp == 0x200C || cp == 0x200D || cp == 0x2060 || cp == 0xFEFF ||
           cp == 0x200E || cp == 0x200F ||
           (cp >= 0x202A && cp <= 0x202E) ||
           (cp >= 0x2066 && cp <= 0x2069);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

struct CurlUrlDeleter {
    void operator()(CURLU* h) const { curl_url_cleanup(h); }
};
using CurlUrlHandle = std::unique_ptr<CURLU, CurlUrlDeleter>;

// curl_url_get hands out strings the caller must curl_free
std::optional<std::string> getPart(CURLU* h, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    if (curl_url_get(h, part, &value, flags) != CURLUE_OK || !value) {
        return std::nullopt;
    }
    std::string out(value);
    curl_free(value);
    return out;
}

// Scheme must be http(s) and a host must be present. Drops the fragment and
// lower-cases the host before producing the final string.
std::optional<std::string> canonicalize(CURLU* h) {
    auto scheme = getPart(h, CURLUPART_SCHEME);
    if (!scheme) {
        return std::nullopt;
    }
    std::string lowerScheme = toLower(*scheme);
    if (lowerScheme != "http" && lowerScheme != "https") {
        return std::nullopt;
    }

    auto host = getPart(h, CURLUPART_HOST);
    if (!host || host->empty()) {
        return std::nullopt;
    }
    if (curl_url_set(h, CURLUPART_HOST, toLower(*host).c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    curl_url_set(h, CURLUPART_FRAGMENT, nullptr, 0);

    return getPart(h, CURLUPART_URL);
}

} // namespace

std::string sanitizeUrl(const std::string& input) {
    std::string out;
    out.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char lead = static_cast<unsigned char>(input[i]);
        size_t length = sequenceLength(lead);
        if (length == 0 || i + length > input.size()) {
            // Stray continuation byte or truncated sequence
            ++i;
            continue;
        }
        if (length == 1) {
            if (lead >= 0x20 && lead != 0x7F) {
                out.push_back(static_cast<char>(lead));
            }
        } else if (length != 3 || !isInvisibleCodepoint(decodeThreeByte(input, i))) {
            out.append(input, i, length);
        }
        i += length;
    }

    size_t first = out.find_first_not_of(' ');
    if (first == std::string::npos) {
        return "";
    }
    return out.substr(first, out.find_last_not_of(' ') - first + 1);
}

std::optional<std::string> normalizeUrl(const std::string& url) {
    const std::string cleaned = sanitizeUrl(url);
    if (cleaned.empty()) {
        return std::nullopt;
    }

    CurlUrlHandle h(curl_url());
    if (!h) {
        return std::nullopt;
    }
    // Non-ASCII paths are common on documentation sites; let curl percent-encode them.
    if (curl_url_set(h.get(), CURLUPART_URL, cleaned.c_str(), CURLU_URLENCODE) != CURLUE_OK) {
        return std::nullopt;
    }
    return canonicalize(h.get());
}

std::optional<std::string> resolveUrl(const std::string& href, const std::string& base) {
    const std::string cleanedHref = sanitizeUrl(href);
    if (cleanedHref.empty()) {
        return std::nullopt;
    }

    CurlUrlHandle h(curl_url());
    if (!h) {
        return std::nullopt;
    }
    if (curl_url_set(h.get(), CURLUPART_URL, sanitizeUrl(base).c_str(), CURLU_URLENCODE) != CURLUE_OK) {
        return std::nullopt;
    }
    // With a base already set, curl resolves relative references against it.
    if (curl_url_set(h.get(), CURLUPART_URL, cleanedHref.c_str(), CURLU_URLENCODE) != CURLUE_OK) {
        return std::nullopt;
    }
    return canonicalize(h.get());
}

std::string extractHost(const std::string& url) {
    CurlUrlHandle h(curl_url());
    if (!h) {
        return "";
    }
    if (curl_url_set(h.get(), CURLUPART_URL, sanitizeUrl(url).c_str(), CURLU_URLENCODE) != CURLUE_OK) {
        return "";
    }
    auto host = getPart(h.get(), CURLUPART_HOST);
    return host ? toLower(*host) : "";
}

std::optional<std::string> extractPath(const std::string& url) {
    CurlUrlHandle h(curl_url());
    if (!h) {
        return std::nullopt;
    }
    if (curl_url_set(h.get(), CURLUPART_URL, sanitizeUrl(url).c_str(), CURLU_URLENCODE) != CURLUE_OK) {
        return std::nullopt;
    }
    return getPart(h.get(), CURLUPART_PATH, CURLU_URLDECODE);
}

bool isSameHost(const std::string& a, const std::string& b) {
    const std::string hostA = extractHost(a);
    return !hostA.empty() && hostA == extractHost(b);
}

std::string urlDecode(std::string_view encoded) {
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < encoded.size()) {
            int hi = hexValue(encoded[i + 1]);
            int lo = hexValue(encoded[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::map<std::string, std::string> parseQueryString(std::string_view query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        std::string_view pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string_view::npos) {
                params[urlDecode(pair)] = "";
            } else {
                params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
            }
        }
        if (amp == std::string_view::npos) break;
        pos = amp + 1;
    }
    return params;
}

} // namespace docs_fetch::common
