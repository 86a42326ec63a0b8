#pragma once
#include <string>
#include <string_view>
#include "../docs_fetch/common/TextUtils.h"

namespace routing {

struct UnmatchedRequestError {
    std::string status;
    std::string code;
    std::string message;
};

/**
 * Error for a request no route matched. pathKnown means the path is routed
 * for some other method, which makes it a 405 instead of a 404.
 * uWS reports methods in lower case.
 */
inline UnmatchedRequestError unmatchedRequestError(std::string_view method, std::string_view path, bool pathKnown) {
    const std::string methodName = docs_fetch::common::toUpperAscii(std::string(method));
    const std::string target(path);
    if (pathKnown) {
        return {"405 Method Not Allowed", "METHOD_NOT_ALLOWED",
                "Method " + methodName + " is not supported on " + target};
    }
    return {"404 Not Found", "NOT_FOUND", "No route for " + methodName + " " + target};
}

} // namespace routing
