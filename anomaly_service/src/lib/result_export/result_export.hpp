#pragma once

#include <stdexcept>
#include <string>

#include <google/protobuf/message.h>

namespace gl_anomaly {

class JsonConversionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Proto field names are kept (snake_case) and enums are written by name.
std::string ToJson(const google::protobuf::Message& message);

// Unknown fields are rejected.
void FromJson(const std::string& json, google::protobuf::Message& message);

}  // namespace gl_anomaly
