#pragma once

#include <vector>
#include <nlohmann/json.hpp>

namespace income_api {

/**
 * Source of raw income-statement objects.
 *
 * fetch() performs exactly one retrieval per call and returns the provider's
 * objects in the order received. Implementations throw UpstreamError on any
 * failure and must be safe to call from several request threads at once.
 */
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    virtual std::vector<nlohmann::json> fetch() = 0;
};

} // namespace income_api
