#include "record_filter.hpp"
#include <algorithm>
#include <iterator>

namespace income_api {

SortKey sort_key_from_string(const std::string& s) {
    if (s == "date") return SortKey::DATE;
    if (s == "revenue") return SortKey::REVENUE;
    if (s == "netIncome") return SortKey::NET_INCOME;
    return SortKey::NONE;
}

std::string sort_key_to_string(SortKey key) {
    switch (key) {
        case SortKey::DATE: return "date";
        case SortKey::REVENUE: return "revenue";
        case SortKey::NET_INCOME: return "netIncome";
        case SortKey::NONE: return "none";
    }
    return "none";
}

bool matches(const FinancialRecord& rec, const FilterCriteria& c) {
    if (enforced(c.start_date) && rec.date < *c.start_date) return false;
    if (enforced(c.end_date) && rec.date > *c.end_date) return false;
    if (enforced(c.min_revenue) && rec.revenue < *c.min_revenue) return false;
    if (enforced(c.max_revenue) && rec.revenue > *c.max_revenue) return false;
    if (enforced(c.min_net_income) && rec.net_income < *c.min_net_income) return false;
    if (enforced(c.max_net_income) && rec.net_income > *c.max_net_income) return false;
    return true;
}

std::vector<FinancialRecord> filter_records(const std::vector<FinancialRecord>& records,
                                            const FilterCriteria& criteria) {
    std::vector<FinancialRecord> out;
    out.reserve(records.size());
    std::copy_if(records.begin(), records.end(), std::back_inserter(out),
                 [&criteria](const FinancialRecord& rec) { return matches(rec, criteria); });
    return out;
}

void sort_records(std::vector<FinancialRecord>& records, SortKey key) {
    switch (key) {
        case SortKey::DATE:
            std::stable_sort(records.begin(), records.end(),
                             [](const FinancialRecord& a, const FinancialRecord& b) {
                                 return a.date > b.date;
                             });
            break;
        case SortKey::REVENUE:
            std::stable_sort(records.begin(), records.end(),
                             [](const FinancialRecord& a, const FinancialRecord& b) {
                                 return a.revenue > b.revenue;
                             });
            break;
        case SortKey::NET_INCOME:
            std::stable_sort(records.begin(), records.end(),
                             [](const FinancialRecord& a, const FinancialRecord& b) {
                                 return a.net_income > b.net_income;
                             });
            break;
        case SortKey::NONE:
            break;
    }
}

std::vector<FinancialRecord> apply_transform(const std::vector<FinancialRecord>& records,
                                             const FilterCriteria& criteria,
                                             SortKey key) {
    auto out = filter_records(records, criteria);
    sort_records(out, key);
    return out;
}

} // namespace income_api
