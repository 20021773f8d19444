#pragma once

#include <stdexcept>
#include <string>

namespace gl_anomaly {

// Filter omitted or fiscal year missing. Raised before any fetch.
class InvalidFilterError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// A fetched line item lacks a field the detectors rely on.
class MalformedLineItemError : public std::runtime_error {
public:
    MalformedLineItemError(const std::string& document_number, const std::string& reason)
        : std::runtime_error("Malformed line item '" + document_number + "': " + reason),
          document_number_(document_number) {}

    const std::string& DocumentNumber() const { return document_number_; }

private:
    std::string document_number_;
};

}  // namespace gl_anomaly
