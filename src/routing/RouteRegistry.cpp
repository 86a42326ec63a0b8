#include "../../include/routing/RouteRegistry.h"
#include "../../include/routing/Controller.h"
#include "../../include/routing/UnmatchedRequest.h"
#include "../../include/Logger.h"
#include <algorithm>

namespace routing {

void RouteRegistry::registerRoute(const Route& route) {
    std::lock_guard<std::mutex> lock(mutex);
    bool duplicate = std::any_of(routes.begin(), routes.end(), [&route](const Route& existing) {
        return existing.method == route.method && existing.path == route.path;
    });
    if (duplicate) {
        LOG_WARNING("Ignoring duplicate route: " + route.describe());
        return;
    }
    routes.push_back(route);
    LOG_DEBUG("Registered route: " + route.describe());
}

std::vector<Route> RouteRegistry::getRoutes() const {
    std::lock_guard<std::mutex> lock(mutex);
    return routes;
}

bool RouteRegistry::hasPath(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex);
    return std::any_of(routes.begin(), routes.end(), [&path](const Route& route) { return route.path == path; });
}

void RouteRegistry::applyRoutes(uWS::App& app) {
    const bool trace = traceRequests;
    for (const Route& route : getRoutes()) {
        // NOTE: nothing is written before the handler so it can choose the status line
        auto handler = [route, trace](uWS::HttpResponse<false>* res, uWS::HttpRequest* req) {
            if (trace) {
                std::string line = methodToString(route.method) + " " + route.path;
                if (!req->getQuery().empty()) {
                    line += "?" + std::string(req->getQuery());
                }
                LOG_DEBUG(line);
            }
            route.handler(res, req);
        };

        switch (route.method) {
            case HttpMethod::GET:
                app.get(route.path, std::move(handler));
                break;
            case HttpMethod::POST:
                app.post(route.path, std::move(handler));
                break;
            case HttpMethod::OPTIONS:
                app.options(route.path, std::move(handler));
                break;
        }
    }

    app.any("/*", [this](uWS::HttpResponse<false>* res, uWS::HttpRequest* req) {
        std::string path(req->getUrl());
        UnmatchedRequestError error = unmatchedRequestError(req->getMethod(), path, hasPath(path));
        LOG_DEBUG(error.message);
        writeJsonError(res, error.status, error.code, error.message);
    });
}

} // namespace routing
