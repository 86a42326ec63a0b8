#include "../../include/routing/Controller.h"
#include "../../include/docs_fetch/common/Url.h"
#include "../../include/Logger.h"

namespace routing {

namespace {

void writeHeaders(uWS::HttpResponse<false>* res, const std::string& status) {
    res->writeStatus(status);
    res->writeHeader("Content-Type", "application/json");
    res->writeHeader("Access-Control-Allow-Origin", "*");
}

} // namespace

void writeJsonError(uWS::HttpResponse<false>* res,
                    const std::string& status,
                    const std::string& code,
                    const std::string& message) {
    nlohmann::json body = {{"error", {{"code", code}, {"message", message}}}};
    writeHeaders(res, status);
    res->end(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void Controller::json(uWS::HttpResponse<false>* res, const nlohmann::json& data, const std::string& status) {
    // Page text may contain invalid UTF-8
    std::string payload = data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    writeHeaders(res, status);
    res->end(payload);
}

void Controller::badRequest(uWS::HttpResponse<false>* res, const std::string& message) {
    writeJsonError(res, "400 Bad Request", "BAD_REQUEST", message);
}

void Controller::serverError(uWS::HttpResponse<false>* res, const std::string& message) {
    LOG_ERROR("Server error: " + message);
    writeJsonError(res, "500 Internal Server Error", "INTERNAL_ERROR", message);
}

void Controller::preflight(uWS::HttpResponse<false>* res, const std::string& allowMethods) {
    res->writeStatus("204 No Content");
    res->writeHeader("Access-Control-Allow-Origin", "*");
    res->writeHeader("Access-Control-Allow-Methods", allowMethods);
    res->writeHeader("Access-Control-Allow-Headers", "Content-Type");
    res->end();
}

std::map<std::string, std::string> Controller::parseQuery(uWS::HttpRequest* req) {
    return docs_fetch::common::parseQueryString(std::string(req->getQuery()));
}

void Controller::readBody(uWS::HttpResponse<false>* res, std::function<void(std::string)> onBody) {
    auto buffer = std::make_shared<std::string>();
    auto rejected = std::make_shared<bool>(false);
    res->onData([res, buffer, rejected, onBody = std::move(onBody)](std::string_view chunk, bool last) {
        if (*rejected) {
            return;
        }
        if (buffer->size() + chunk.size() > kMaxBodyBytes) {
            *rejected = true;
            LOG_WARNING("Request body exceeds " + std::to_string(kMaxBodyBytes) + " bytes");
            writeJsonError(res, "413 Payload Too Large", "PAYLOAD_TOO_LARGE",
                           "Request body exceeds " + std::to_string(kMaxBodyBytes) + " bytes");
            return;
        }
        buffer->append(chunk.data(), chunk.size());
        if (last) {
            onBody(std::move(*buffer));
        }
    });
}

} // namespace routing
