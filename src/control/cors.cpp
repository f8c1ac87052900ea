#include "cors.hpp"
#include <drogon/HttpResponse.h>
#include <spdlog/spdlog.h>

namespace income_api {

drogon::HttpResponsePtr cors_preflight(const drogon::HttpRequestPtr& req) {
    if (req->method() != drogon::Options) return nullptr;

    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(drogon::k200OK);
    add_cors_headers(resp);
    resp->addHeader("Access-Control-Allow-Methods", "GET, OPTIONS");
    const auto& requested = req->getHeader("Access-Control-Request-Headers");
    resp->addHeader("Access-Control-Allow-Headers",
                    requested.empty() ? std::string("Content-Type") : requested);
    return resp;
}

void add_cors_headers(const drogon::HttpResponsePtr& resp) {
    resp->addHeader("Access-Control-Allow-Origin", "*");
}

void install_cors(drogon::HttpAppFramework& app) {
    app.registerSyncAdvice([](const drogon::HttpRequestPtr& req) {
        return cors_preflight(req);
    });
    app.registerPostHandlingAdvice([](const drogon::HttpRequestPtr&,
                                      const drogon::HttpResponsePtr& resp) {
        add_cors_headers(resp);
    });
    spdlog::info("CORS enabled for all origins");
}

} // namespace income_api
