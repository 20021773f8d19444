#include "result_export.hpp"

#include <google/protobuf/util/json_util.h>

#include <userver/logging/log.hpp>

namespace gl_anomaly {

std::string ToJson(const google::protobuf::Message& message) {
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    options.always_print_primitive_fields = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
        LOG_ERROR() << "Failed to serialize " << message.GetTypeName() << " to JSON: " << status.ToString();
        throw JsonConversionError("Failed to serialize " + message.GetTypeName() + " to JSON: " + status.ToString());
    }
    return json;
}

void FromJson(const std::string& json, google::protobuf::Message& message) {
    auto status = google::protobuf::util::JsonStringToMessage(json, &message);
    if (!status.ok()) {
        LOG_ERROR() << "Failed to parse " << message.GetTypeName() << " from JSON: " << status.ToString();
        throw JsonConversionError("Failed to parse " + message.GetTypeName() + " from JSON: " + status.ToString());
    }
}

}  // namespace gl_anomaly
