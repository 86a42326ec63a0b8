#pragma once
#include "RouteRegistry.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace routing {

// Writes {"error": {"code": ..., "message": ...}} with the given status line
void writeJsonError(uWS::HttpResponse<false>* res,
                    const std::string& status,
                    const std::string& code,
                    const std::string& message);

class Controller {
public:
    virtual ~Controller() = default;

    // Request bodies above this size are answered with 413
    static constexpr size_t kMaxBodyBytes = 64 * 1024;

protected:
    void json(uWS::HttpResponse<false>* res, const nlohmann::json& data, const std::string& status = "200 OK");

    void badRequest(uWS::HttpResponse<false>* res, const std::string& message);
    void serverError(uWS::HttpResponse<false>* res, const std::string& message);

    // 204 answer for CORS preflight requests
    void preflight(uWS::HttpResponse<false>* res, const std::string& allowMethods);

    // Decoded query string parameters of the request
    std::map<std::string, std::string> parseQuery(uWS::HttpRequest* req);

    /**
     * Buffer the request body and call onBody once it is complete.
     * Oversized bodies get a 413 and onBody is never called. The caller
     * must still register onAborted on the response.
     */
    void readBody(uWS::HttpResponse<false>* res, std::function<void(std::string)> onBody);
};

// One shared instance per controller class, created on first request
template<typename ControllerClass>
ControllerClass& controllerInstance() {
    static ControllerClass instance;
    return instance;
}

} // namespace routing

// Declares a static registrar whose body calls REGISTER_ROUTE
#define ROUTE_CONTROLLER(ControllerClass) \
    static void registerRoutesOf##ControllerClass(); \
    namespace { \
        const bool ControllerClass##RoutesRegistered = (registerRoutesOf##ControllerClass(), true); \
    } \
    static void registerRoutesOf##ControllerClass()

#define REGISTER_ROUTE(httpMethod, routePath, action, ControllerClass) \
    routing::RouteRegistry::getInstance().registerRoute(routing::Route{ \
        httpMethod, routePath, \
        [](uWS::HttpResponse<false>* res, uWS::HttpRequest* req) { \
            routing::controllerInstance<ControllerClass>().action(res, req); \
        }, \
        #ControllerClass, #action})
