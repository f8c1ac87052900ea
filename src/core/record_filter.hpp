#pragma once

#include <optional>
#include <string>
#include <vector>
#include "financial_record.hpp"

namespace income_api {

/**
 * Optional inclusive bounds on the three filterable fields.
 *
 * A bound that is present but zero is still not enforced; see enforced().
 */
struct FilterCriteria {
    std::optional<int64_t> start_date;
    std::optional<int64_t> end_date;
    std::optional<double> min_revenue;
    std::optional<double> max_revenue;
    std::optional<double> min_net_income;
    std::optional<double> max_net_income;
};

enum class SortKey {
    DATE,
    REVENUE,
    NET_INCOME,
    NONE
};

/**
 * Map a `sortBy` value to a key. Anything other than the three field names
 * (case-sensitive) yields NONE.
 */
SortKey sort_key_from_string(const std::string& s);
std::string sort_key_to_string(SortKey key);

/**
 * A bound takes part in filtering only when it is present and non-zero.
 * Callers that pass 0 get the same result as passing nothing.
 */
template <typename T>
bool enforced(const std::optional<T>& bound) {
    return bound.has_value() && *bound != T{0};
}

bool matches(const FinancialRecord& rec, const FilterCriteria& criteria);

std::vector<FinancialRecord> filter_records(const std::vector<FinancialRecord>& records,
                                            const FilterCriteria& criteria);

/**
 * Stable descending sort on the selected field; NONE leaves order alone.
 */
void sort_records(std::vector<FinancialRecord>& records, SortKey key);

/**
 * Filter, then sort. Input is not modified.
 */
std::vector<FinancialRecord> apply_transform(const std::vector<FinancialRecord>& records,
                                             const FilterCriteria& criteria,
                                             SortKey key);

} // namespace income_api
