#include "id_generator.hpp"

#include <fmt/format.h>

#include <userver/utils/uuid4.hpp>

namespace gl_anomaly {

std::string UuidIdGenerator::Generate() {
    return userver::utils::generators::GenerateUuid();
}

std::string SequenceIdGenerator::Generate() {
    return fmt::format("{:06}", next_++);
}

}  // namespace gl_anomaly
