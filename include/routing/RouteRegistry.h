#pragma once
#include "Route.h"
#include <vector>
#include <mutex>

namespace routing {

// Collects routes registered by controllers during static initialization
class RouteRegistry {
public:
    static RouteRegistry& getInstance() {
        static RouteRegistry instance;
        return instance;
    }

    // Duplicates (same method and path) are logged and ignored
    void registerRoute(const Route& route);

    std::vector<Route> getRoutes() const;

    /**
     * Install every route on the app, followed by a catch-all that answers
     * 405 for known paths requested with another method and 404 otherwise.
     */
    void applyRoutes(uWS::App& app);

    // Log "METHOD /path?query" for every request at DEBUG level
    void setTraceRequests(bool trace) { traceRequests = trace; }

private:
    RouteRegistry() = default;
    RouteRegistry(const RouteRegistry&) = delete;
    RouteRegistry& operator=(const RouteRegistry&) = delete;

    bool hasPath(const std::string& path) const;

    std::vector<Route> routes;
    mutable std::mutex mutex;
    bool traceRequests = true;
};

} // namespace routing
