#pragma once

#include <memory>
#include <drogon/HttpController.h>
#include <nlohmann/json.hpp>
#include "../core/upstream_client.hpp"

namespace income_api {

/**
 * GET /fetch_data
 *
 * Fetches the income statements from the upstream client, filters them by
 * the optional bounds in the query string, sorts them (descending by date
 * unless sortBy says otherwise) and returns the provider's objects as a JSON
 * array.
 *
 *   400  malformed numeric query parameter
 *   500  upstream fetch failed
 *   502  an upstream record lacks date/revenue/netIncome
 */
class FetchController : public drogon::HttpController<FetchController> {
public:
    static const bool isAutoCreation = false;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(FetchController::fetchData, "/fetch_data", drogon::Get);
    METHOD_LIST_END

    explicit FetchController(std::shared_ptr<UpstreamClient> upstream);

    void fetchData(const drogon::HttpRequestPtr& req,
                   std::function<void(const drogon::HttpResponsePtr&)>&& cb);

private:
    drogon::HttpResponsePtr json_resp(nlohmann::json body, int code = 200);
    drogon::HttpResponsePtr error_resp(const std::string& message, int code);

    std::shared_ptr<UpstreamClient> upstream_;
};

} // namespace income_api
