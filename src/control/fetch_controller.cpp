#include "fetch_controller.hpp"
#include "query_params.hpp"
#include "../core/errors.hpp"
#include "../core/financial_record.hpp"
#include "../core/record_filter.hpp"
#include <spdlog/spdlog.h>
#include <drogon/drogon.h>

using json = nlohmann::json;

namespace income_api {

FetchController::FetchController(std::shared_ptr<UpstreamClient> upstream)
    : upstream_(std::move(upstream)) {}

drogon::HttpResponsePtr FetchController::json_resp(json body, int code) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(code));
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(body.dump());
    return resp;
}

drogon::HttpResponsePtr FetchController::error_resp(const std::string& message, int code) {
    return json_resp(json{{"error", message}}, code);
}

void FetchController::fetchData(const drogon::HttpRequestPtr& req,
                                std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
    const auto& raw_params = req->getParameters();
    QueryParams params(raw_params.begin(), raw_params.end());

    FetchQuery query;
    try {
        query = parse_fetch_query(params);
    } catch (const MalformedQueryError& e) {
        spdlog::warn("fetch_data rejected: {}", e.what());
        cb(error_resp(e.what(), 400));
        return;
    }

    std::vector<json> raw;
    try {
        raw = upstream_->fetch();
    } catch (const UpstreamError& e) {
        spdlog::error("fetch_data upstream failure: {}", e.what());
        cb(error_resp(e.what(), 500));
        return;
    }

    try {
        auto records = records_from_json(raw);
        auto result = apply_transform(records, query.criteria, query.sort_key);
        spdlog::debug("fetch_data: {} of {} records, sortBy={}",
                      result.size(), records.size(), sort_key_to_string(query.sort_key));
        cb(json_resp(records_to_json(result)));
    } catch (const MissingFieldError& e) {
        spdlog::error("fetch_data bad upstream data: {}", e.what());
        cb(error_resp(e.what(), 502));
    }
}

} // namespace income_api
