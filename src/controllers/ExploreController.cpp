#include "ExploreController.h"
#include "../../include/Logger.h"
#include <system_error>
#include <thread>

using docs_fetch::api::ExploreRequest;
using docs_fetch::api::ExploreRequestParse;

ROUTE_CONTROLLER(ExploreController) {
    using routing::HttpMethod;
    REGISTER_ROUTE(HttpMethod::GET, "/api/explore", exploreGet, ExploreController);
    REGISTER_ROUTE(HttpMethod::POST, "/api/explore", explorePost, ExploreController);
    REGISTER_ROUTE(HttpMethod::OPTIONS, "/api/explore", explorePreflight, ExploreController);
    REGISTER_ROUTE(HttpMethod::GET, "/api/health", health, ExploreController);
}

namespace {

std::shared_ptr<std::atomic<bool>> watchForAbort(uWS::HttpResponse<false>* res) {
    auto aborted = std::make_shared<std::atomic<bool>>(false);
    // CRITICAL: uWS requires onAborted before returning without a response
    res->onAborted([aborted]() {
        aborted->store(true);
        LOG_WARNING("Client disconnected during explore request processing");
    });
    return aborted;
}

} // namespace

ExploreController::ExploreController()
    : explorer(std::make_shared<docs_fetch::crawler::DocsExplorer>(
          docs_fetch::crawler::loadExploreConfigFromEnv())) {
}

void ExploreController::exploreGet(uWS::HttpResponse<false>* res, uWS::HttpRequest* req) {
    ExploreRequestParse parse = docs_fetch::api::parseExploreQuery(parseQuery(req));
    if (!parse.success) {
        LOG_INFO("Rejected explore request: " + parse.errorMessage);
        badRequest(res, parse.errorMessage);
        return;
    }
    dispatch(res, parse.request, watchForAbort(res));
}

void ExploreController::explorePost(uWS::HttpResponse<false>* res, uWS::HttpRequest* req) {
    (void)req;
    auto aborted = watchForAbort(res);
    readBody(res, [this, res, aborted](std::string body) {
        ExploreRequestParse parse = docs_fetch::api::parseExploreBody(body);
        if (!parse.success) {
            LOG_INFO("Rejected explore request: " + parse.errorMessage);
            badRequest(res, parse.errorMessage);
            return;
        }
        dispatch(res, parse.request, aborted);
    });
}

void ExploreController::explorePreflight(uWS::HttpResponse<false>* res, uWS::HttpRequest* req) {
    (void)req;
    preflight(res, "GET, POST, OPTIONS");
}

void ExploreController::health(uWS::HttpResponse<false>* res, uWS::HttpRequest* req) {
    (void)req;
    json(res, {{"status", "ok"}});
}

void ExploreController::dispatch(uWS::HttpResponse<false>* res,
                                 const ExploreRequest& request,
                                 std::shared_ptr<std::atomic<bool>> aborted) {
    LOG_INFO("Explore request: url=" + request.url + ", depth=" + std::to_string(request.depth));

    // Responses must be written from the loop thread
    uWS::Loop* loop = uWS::Loop::get();
    auto explorerRef = explorer;

    try {
        // Bounded by the exploration deadline
        std::thread([this, loop, res, request, aborted, explorerRef]() {
            docs_fetch::crawler::ExplorationResult result = explorerRef->explore(request.url, request.depth);
            auto response = std::make_shared<docs_fetch::api::ExploreResponse>(
                docs_fetch::api::buildExploreResponse(result));

            loop->defer([this, res, aborted, response]() {
                if (aborted->load()) {
                    LOG_DEBUG("Dropping explore response for aborted request");
                    return;
                }
                json(res, response->body, response->status);
            });
        }).detach();
    } catch (const std::system_error& e) {
        serverError(res, std::string("Could not start exploration: ") + e.what());
    }
}
