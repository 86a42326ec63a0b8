#pragma once

#include <string>
#include <memory>
#include <vector>
#include "RenderService.h"

namespace docs_fetch::crawler {

/**
 * Client for a Browserless (headless Chrome) service.
 * POST /content navigates, waits for networkidle2 and returns the rendered DOM;
 * the page status comes back in the X-Response-Code header.
 */
class BrowserlessClient : public RenderService {
public:
    BrowserlessClient(const std::string& browserlessUrl,
                      const std::string& userAgent,
                      const std::vector<std::string>& blockedResourceTypes);
    ~BrowserlessClient() override;

    bool probe(const CancellationToken& token) override;

    RenderResponse render(const std::string& url,
                          std::chrono::milliseconds navigationTimeout,
                          const CancellationToken& token) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace docs_fetch::crawler
