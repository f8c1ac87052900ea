#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace income_api {

/**
 * One reporting period of the tracked company's income statement.
 *
 * The three typed fields are what filtering and sorting look at. `raw` is the
 * provider's object exactly as received and is what gets serialized back, so
 * fields this service does not know about pass through untouched.
 */
struct FinancialRecord {
    int64_t date{0};        // fiscal year; compared as an opaque integer
    double revenue{0.0};
    double net_income{0.0};
    nlohmann::json raw;
};

/**
 * Build a record from one upstream object.
 *
 * `date` may be a JSON integer, an integral string ("2023") or an ISO date
 * string ("2023-09-30", reduced to its year). `revenue` and `netIncome` must
 * be JSON numbers.
 *
 * Throws MissingFieldError naming the field and `index` when a field is
 * absent, null or of an unusable type.
 */
FinancialRecord record_from_json(const nlohmann::json& obj, size_t index);

std::vector<FinancialRecord> records_from_json(const std::vector<nlohmann::json>& objs);

nlohmann::json records_to_json(const std::vector<FinancialRecord>& records);

} // namespace income_api
