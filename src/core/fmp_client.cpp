#include "fmp_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace income_api {

namespace {

std::string describe(drogon::ReqResult result) {
    switch (result) {
        case drogon::ReqResult::Ok: return "ok";
        case drogon::ReqResult::BadResponse: return "bad response from server";
        case drogon::ReqResult::NetworkFailure: return "network failure";
        case drogon::ReqResult::BadServerAddress: return "bad server address";
        case drogon::ReqResult::Timeout: return "timeout";
        case drogon::ReqResult::HandshakeError: return "TLS handshake error";
        case drogon::ReqResult::InvalidCertificate: return "invalid TLS certificate";
        default: return "request failed";
    }
}

std::string body_prefix(const std::string& body) {
    return body.substr(0, std::min<size_t>(body.size(), 256));
}

} // namespace

FmpClient::FmpClient(const UpstreamConfig& cfg)
    : cfg_(cfg), loop_thread_("FmpClientLoop") {
    while (!cfg_.base_url.empty() && cfg_.base_url.back() == '/') {
        cfg_.base_url.pop_back();
    }
    loop_thread_.run();
    client_ = drogon::HttpClient::newHttpClient(cfg_.base_url, loop_thread_.getLoop());
    spdlog::info("FmpClient ready: {}", redacted_url());
}

std::string FmpClient::statement_path() {
    return std::string("/api/v3/income-statement/") + UpstreamConfig::kSymbol;
}

std::string FmpClient::redacted_url() const {
    return cfg_.base_url + statement_path() + "?period=" + UpstreamConfig::kPeriod + "&apikey=***";
}

std::vector<json> FmpClient::fetch() {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPath(statement_path());
    req->setParameter("period", UpstreamConfig::kPeriod);
    // Drogon percent-encodes parameters when it writes the request line.
    req->setParameter("apikey", cfg_.api_key);
    req->addHeader("Accept", "application/json");

    spdlog::debug("GET {}", redacted_url());
    auto [result, resp] = client_->sendRequest(req);
    if (result != drogon::ReqResult::Ok || !resp) {
        spdlog::error("Upstream request to {} failed: {}", cfg_.base_url, describe(result));
        throw UpstreamError("Upstream request to " + cfg_.base_url + " failed: " + describe(result));
    }

    const auto status = static_cast<int>(resp->getStatusCode());
    std::string body(resp->getBody());
    if (status < 200 || status >= 300) {
        spdlog::error("Upstream returned HTTP {} body_prefix={}", status, body_prefix(body));
        throw UpstreamError("Upstream returned HTTP " + std::to_string(status) + ": " +
                            body_prefix(body));
    }

    auto statements = parse_statements(body);
    spdlog::debug("Upstream returned {} statements", statements.size());
    return statements;
}

std::vector<json> FmpClient::parse_statements(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw UpstreamError(std::string("Failed to parse upstream response: ") + e.what());
    }

    // FMP reports key and quota problems as {"Error Message": "..."}.
    if (j.is_object() && j.contains("Error Message") && j["Error Message"].is_string()) {
        throw UpstreamError("Upstream error: " + j["Error Message"].get<std::string>());
    }
    if (!j.is_array()) {
        throw UpstreamError(std::string("Unexpected upstream response: expected a JSON array, got ") +
                            j.type_name());
    }

    std::vector<json> out;
    out.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        if (!j[i].is_object()) {
            throw UpstreamError("Unexpected upstream response: element " + std::to_string(i) +
                                " is " + j[i].type_name() + ", expected an object");
        }
        out.push_back(std::move(j[i]));
    }
    return out;
}

} // namespace income_api
