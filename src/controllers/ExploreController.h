#pragma once

#include <memory>
#include <atomic>
#include "../../include/routing/Controller.h"
#include "../../include/docs_fetch/crawler/DocsExplorer.h"
#include "ExploreRequest.h"

class ExploreController : public routing::Controller {
public:
    ExploreController();

    // GET /api/explore?url=<url>&depth=<n>
    void exploreGet(uWS::HttpResponse<false>* res, uWS::HttpRequest* req);

    // POST /api/explore {"url": "...", "depth": n}
    void explorePost(uWS::HttpResponse<false>* res, uWS::HttpRequest* req);

    // OPTIONS /api/explore
    void explorePreflight(uWS::HttpResponse<false>* res, uWS::HttpRequest* req);

    // GET /api/health
    void health(uWS::HttpResponse<false>* res, uWS::HttpRequest* req);

private:
    // Run the exploration off the event loop and write the response back on it
    void dispatch(uWS::HttpResponse<false>* res,
                  const docs_fetch::api::ExploreRequest& request,
                  std::shared_ptr<std::atomic<bool>> aborted);

    std::shared_ptr<docs_fetch::crawler::DocsExplorer> explorer;
};
