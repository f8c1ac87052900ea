#pragma once

#include <string>
#include <vector>
#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "upstream_client.hpp"

namespace income_api {

/**
 * Financial Modeling Prep income-statement client.
 *
 * Issues GET {base_url}/api/v3/income-statement/AAPL?period=annual&apikey=KEY
 * through a Drogon HttpClient bound to a private event loop thread, so the
 * blocking fetch() can be called from Drogon worker threads without stalling
 * the loop that services the outbound connection.
 */
class FmpClient : public UpstreamClient {
public:
    explicit FmpClient(const UpstreamConfig& cfg);

    std::vector<nlohmann::json> fetch() override;

    static std::string statement_path();

    // Request URL for logs, with the key replaced by "***".
    std::string redacted_url() const;

    /**
     * Parse a response body into the statement objects.
     * Throws UpstreamError for invalid JSON, a provider error object, a
     * non-array top level, or non-object elements.
     */
    static std::vector<nlohmann::json> parse_statements(const std::string& body);

private:
    UpstreamConfig cfg_;
    trantor::EventLoopThread loop_thread_;
    drogon::HttpClientPtr client_;  // declared after loop_thread_: destroyed first
};

} // namespace income_api
