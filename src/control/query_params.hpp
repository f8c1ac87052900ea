#pragma once

#include <string>
#include <unordered_map>
#include "../core/record_filter.hpp"

namespace income_api {

using QueryParams = std::unordered_map<std::string, std::string>;

struct FetchQuery {
    FilterCriteria criteria;
    SortKey sort_key{SortKey::DATE};
};

/**
 * Read the /fetch_data parameters.
 *
 *   startDate, endDate                      integer
 *   minRevenue, maxRevenue,
 *   minNetIncome, maxNetIncome              float
 *   sortBy                                  default "date"
 *
 * Empty values count as absent. An absent sortBy means DATE, while a present
 * but unrecognized (or empty) one means NONE.
 * Throws MalformedQueryError when a number does not parse.
 */
FetchQuery parse_fetch_query(const QueryParams& params);

} // namespace income_api
