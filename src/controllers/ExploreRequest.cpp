#include "ExploreRequest.h"
#include "../../include/docs_fetch/common/Url.h"
#include "../../include/docs_fetch/common/TextUtils.h"
#include <algorithm>
#include <cmath>
#include <cctype>

namespace docs_fetch::api {

namespace {

ExploreRequestParse fail(const std::string& message) {
    ExploreRequestParse parse;
    parse.errorMessage = message;
    return parse;
}

// Strict integer parse: optional sign and digits only
bool parseInteger(const std::string& raw, long long& out) {
    std::string value = common::trim(raw);
    if (value.empty()) return false;
    size_t i = (value[0] == '-' || value[0] == '+') ? 1 : 0;
    if (i == value.size()) return false;
    if (!std::all_of(value.begin() + i, value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        out = std::stoll(value);
    } catch (const std::out_of_range&) {
        out = value[0] == '-' ? kMinDepth : kMaxDepth;
    }
    return true;
}

ExploreRequestParse validateUrl(const std::string& rawUrl, int depth) {
    std::string url = common::trim(rawUrl);
    if (url.empty()) {
        return fail("Missing required parameter: url");
    }
    if (!common::normalizeUrl(url)) {
        return fail("Invalid url: must be an absolute http or https URL");
    }
    ExploreRequestParse parse;
    parse.success = true;
    parse.request.url = url;
    parse.request.depth = depth;
    return parse;
}

} // namespace

int clampDepth(long long depth) {
    return static_cast<int>(std::clamp<long long>(depth, kMinDepth, kMaxDepth));
}

ExploreRequestParse parseExploreQuery(const std::map<std::string, std::string>& params) {
    int depth = kDefaultDepth;
    auto depthParam = params.find("depth");
    if (depthParam != params.end() && !common::trim(depthParam->second).empty()) {
        long long value = 0;
        if (!parseInteger(depthParam->second, value)) {
            return fail("Invalid depth: must be an integer");
        }
        depth = clampDepth(value);
    }

    auto urlParam = params.find("url");
    return validateUrl(urlParam == params.end() ? "" : urlParam->second, depth);
}

ExploreRequestParse parseExploreBody(const std::string& body) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return fail(std::string("Invalid JSON body: ") + e.what());
    }
    if (!json.is_object()) {
        return fail("Request body must be a JSON object");
    }

    int depth = kDefaultDepth;
    if (json.contains("depth") && !json["depth"].is_null()) {
        const auto& value = json["depth"];
        if (value.is_number_integer()) {
            depth = clampDepth(value.get<long long>());
        } else if (value.is_number_float() && std::trunc(value.get<double>()) == value.get<double>() &&
                   std::isfinite(value.get<double>())) {
            depth = clampDepth(static_cast<long long>(std::clamp(value.get<double>(), -1e9, 1e9)));
        } else if (value.is_string()) {
            long long parsed = 0;
            if (!parseInteger(value.get<std::string>(), parsed)) {
                return fail("Invalid depth: must be an integer");
            }
            depth = clampDepth(parsed);
        } else {
            return fail("Invalid depth: must be an integer");
        }
    }

    if (!json.contains("url") || !json["url"].is_string()) {
        return fail("Missing required parameter: url");
    }
    return validateUrl(json["url"].get<std::string>(), depth);
}

ExploreResponse buildExploreResponse(const crawler::ExplorationResult& result) {
    ExploreResponse response;
    response.body = crawler::toJson(result);
    if (result.failed()) {
        response.status = "502 Bad Gateway";
        response.body["isError"] = true;
    } else {
        response.status = "200 OK";
    }
    return response;
}

} // namespace docs_fetch::api
