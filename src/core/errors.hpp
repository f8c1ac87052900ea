#pragma once

#include <stdexcept>
#include <string>

namespace income_api {

// Outbound call to the provider failed: network, HTTP status or body shape.
class UpstreamError : public std::runtime_error {
public:
    explicit UpstreamError(const std::string& what) : std::runtime_error(what) {}
};

// A query parameter could not be converted to its declared type.
class MalformedQueryError : public std::runtime_error {
public:
    MalformedQueryError(const std::string& param, const std::string& value,
                        const std::string& expected)
        : std::runtime_error("Invalid value '" + value + "' for query parameter '" +
                             param + "': expected " + expected),
          param_(param) {}

    const std::string& param() const { return param_; }

private:
    std::string param_;
};

// An upstream record lacks date/revenue/netIncome or holds an unusable value.
class MissingFieldError : public std::runtime_error {
public:
    MissingFieldError(const std::string& field, size_t index, const std::string& detail)
        : std::runtime_error("Upstream record " + std::to_string(index) + " " + detail +
                             " field '" + field + "'"),
          field_(field), index_(index) {}

    const std::string& field() const { return field_; }
    size_t index() const { return index_; }

private:
    std::string field_;
    size_t index_;
};

} // namespace income_api
