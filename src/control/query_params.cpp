#include "query_params.hpp"
#include "../core/errors.hpp"
#include "../core/utils.hpp"

namespace income_api {

namespace {

const std::string* find_value(const QueryParams& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end()) return nullptr;
    if (utils::trim_copy(it->second).empty()) return nullptr;
    return &it->second;
}

std::optional<int64_t> int_param(const QueryParams& params, const char* key) {
    const auto* raw = find_value(params, key);
    if (!raw) return std::nullopt;
    auto v = utils::parse_int64(*raw);
    if (!v) throw MalformedQueryError(key, *raw, "an integer");
    return v;
}

std::optional<double> float_param(const QueryParams& params, const char* key) {
    const auto* raw = find_value(params, key);
    if (!raw) return std::nullopt;
    auto v = utils::parse_double(*raw);
    if (!v) throw MalformedQueryError(key, *raw, "a number");
    return v;
}

} // namespace

FetchQuery parse_fetch_query(const QueryParams& params) {
    FetchQuery q;
    q.criteria.start_date = int_param(params, "startDate");
    q.criteria.end_date = int_param(params, "endDate");
    q.criteria.min_revenue = float_param(params, "minRevenue");
    q.criteria.max_revenue = float_param(params, "maxRevenue");
    q.criteria.min_net_income = float_param(params, "minNetIncome");
    q.criteria.max_net_income = float_param(params, "maxNetIncome");

    auto it = params.find("sortBy");
    q.sort_key = (it == params.end()) ? SortKey::DATE : sort_key_from_string(it->second);
    return q;
}

} // namespace income_api
