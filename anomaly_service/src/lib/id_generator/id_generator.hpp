#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace gl_anomaly {

// Source of unique suffixes for run and anomaly ids
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    virtual std::string Generate() = 0;
};

using IdGeneratorPtr = std::shared_ptr<IdGenerator>;

class UuidIdGenerator : public IdGenerator {
public:
    std::string Generate() override;
};

// Deterministic "000001", "000002", ... for reproducible runs
class SequenceIdGenerator : public IdGenerator {
public:
    explicit SequenceIdGenerator(std::uint64_t start = 1) : next_(start) {}

    std::string Generate() override;

    void Reset(std::uint64_t start = 1) { next_ = start; }

private:
    std::uint64_t next_;
};

}  // namespace gl_anomaly
