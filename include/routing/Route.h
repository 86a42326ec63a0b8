#pragma once
#include <string>
#include <functional>
#include <uwebsockets/App.h>

namespace routing {

enum class HttpMethod {
    GET,
    POST,
    OPTIONS
};

using RouteHandler = std::function<void(uWS::HttpResponse<false>*, uWS::HttpRequest*)>;

inline std::string methodToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::OPTIONS: return "OPTIONS";
    }
    return "UNKNOWN";
}

struct Route {
    HttpMethod method;
    std::string path;            // Exact path, no parameters
    RouteHandler handler;
    std::string controllerName;
    std::string actionName;

    // "GET /api/explore -> ExploreController::exploreGet"
    std::string describe() const {
        return methodToString(method) + " " + path + " -> " + controllerName + "::" + actionName;
    }
};

} // namespace routing
