#pragma once

#include <drogon/HttpAppFramework.h>

namespace income_api {

/**
 * Open CORS policy: any origin, every route.
 *
 * install_cors() registers a sync advice answering OPTIONS preflights and a
 * post-handling advice stamping Access-Control-Allow-Origin on every
 * response. The two helpers are what those advices run.
 */
void install_cors(drogon::HttpAppFramework& app);

// nullptr for anything that is not an OPTIONS request.
drogon::HttpResponsePtr cors_preflight(const drogon::HttpRequestPtr& req);

void add_cors_headers(const drogon::HttpResponsePtr& resp);

} // namespace income_api
