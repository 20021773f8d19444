#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gl/detection_result.pb.h>

#include "anomaly_builder/anomaly_builder.hpp"
#include "detection_config/detection_config.hpp"
#include "detection_engine/gl_data_source.hpp"
#include "id_generator/id_generator.hpp"
#include "posting_calendar/posting_calendar.hpp"

namespace gl_anomaly {

class DetectionEngine {
public:
    // Throws ConfigError when the configuration is invalid.
    DetectionEngine(const GLDataSource& data_source, DetectionConfig config, IdGeneratorPtr ids);

    // Fetches the line items selected by the filter once and runs every enabled
    // detector over them. Throws InvalidFilterError before fetching when the
    // filter or its fiscal year is missing, MalformedLineItemError when a fetched
    // item lacks a required field. Data source exceptions propagate unchanged.
    gl::DetectionResult DetectAnomalies(
        const std::string& tenant_id,
        const std::optional<gl::LineItemFilter>& filter) const;

    const DetectionConfig& GetConfig() const { return config_; }

private:
    struct RunContext;

    void RunBenford(RunContext& run) const;
    void RunOutliers(RunContext& run) const;
    void RunBehavioral(RunContext& run) const;
    void RunRoundNumbers(RunContext& run) const;
    void RunDuplicates(RunContext& run) const;
    void RunVelocity(RunContext& run) const;

    const GLDataSource& data_source_;
    DetectionConfig config_;
    IdGeneratorPtr ids_;
    PostingCalendar calendar_;
};

// Engine with UUID based ids, the way the service component builds it.
// Throws ConfigError when the configuration is invalid.
std::unique_ptr<DetectionEngine> MakeDetectionEngine(const DetectionConfig& config, const GLDataSource& data_source);

using RuleBody = std::function<void(std::vector<DetectorFinding>&)>;

// Runs one rule. Its findings are appended only when it completes; a
// std::exception is logged and recorded in diagnostics as "<rule>: <what>".
// Returns whether the rule completed.
bool RunRuleIsolated(
    const std::string& rule,
    const RuleBody& body,
    std::vector<DetectorFinding>& findings,
    google::protobuf::RepeatedPtrField<std::string>& diagnostics);

void ValidateLineItem(const gl::LineItem& item);

// 15 per critical, 8 per high, +20 above a 10% anomaly rate or +10 above 5%; capped at 100.
double EstimateFraudRisk(const std::vector<gl::Anomaly>& anomalies, std::size_t total_line_items);

gl::DetectionSummary Summarize(const std::vector<gl::Anomaly>& anomalies);

}  // namespace gl_anomaly
