#include "financial_record.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <cmath>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace income_api {

namespace {

const json& require_field(const json& obj, const char* field, size_t index) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) {
        throw MissingFieldError(field, index, "is missing");
    }
    return *it;
}

int64_t parse_date_field(const json& v, size_t index) {
    if (v.is_number_unsigned()) {
        if (v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(v.get<uint64_t>());
        }
    } else if (v.is_number_integer()) {
        return v.get<int64_t>();
    } else if (v.is_number_float()) {
        // [-2^63, 2^63) is the range a double converts to int64_t without overflow.
        double d = v.get<double>();
        if (std::isfinite(d) && d == std::floor(d) &&
            d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
            return static_cast<int64_t>(d);
        }
    } else if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (auto n = utils::parse_int64(s)) return *n;
        if (auto year = utils::leading_year(s)) return *year;
    }
    throw MissingFieldError("date", index, "has an unusable value in");
}

double parse_number_field(const json& v, const char* field, size_t index) {
    if (!v.is_number()) {
        throw MissingFieldError(field, index, "has a non-numeric value in");
    }
    return v.get<double>();
}

} // namespace

FinancialRecord record_from_json(const json& obj, size_t index) {
    if (!obj.is_object()) {
        throw MissingFieldError("date", index, "is not an object; cannot read");
    }
    FinancialRecord rec;
    rec.date = parse_date_field(require_field(obj, "date", index), index);
    rec.revenue = parse_number_field(require_field(obj, "revenue", index), "revenue", index);
    rec.net_income = parse_number_field(require_field(obj, "netIncome", index), "netIncome", index);
    rec.raw = obj;
    return rec;
}

std::vector<FinancialRecord> records_from_json(const std::vector<json>& objs) {
    std::vector<FinancialRecord> out;
    out.reserve(objs.size());
    for (size_t i = 0; i < objs.size(); ++i) {
        out.push_back(record_from_json(objs[i], i));
    }
    return out;
}

json records_to_json(const std::vector<FinancialRecord>& records) {
    json arr = json::array();
    for (const auto& rec : records) {
        arr.push_back(rec.raw);
    }
    return arr;
}

} // namespace income_api
