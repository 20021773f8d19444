#pragma once

#include <string>
#include <variant>

#include <gl/anomaly.pb.h>
#include <gl/detection_result.pb.h>

#include "account_index/account_index.hpp"
#include "behavioral_detector/behavioral_detector.hpp"
#include "id_generator/id_generator.hpp"
#include "outlier_detector/outlier_detector.hpp"
#include "velocity_analyzer/velocity_analyzer.hpp"

namespace gl_anomaly {

struct BenfordFinding {
    gl::BenfordResult result;
    // Every counted item of the account.
    LineItemRefs items;
};

using DetectorFinding = std::variant<OutlierObservation, BenfordFinding, BehavioralMatch, VelocityMatch>;

inline constexpr double kOutlierConfidence = 85.0;
inline constexpr double kAfterHoursConfidence = 95.0;
inline constexpr double kWeekendConfidence = 90.0;
inline constexpr double kReversalConfidence = 100.0;
inline constexpr double kRoundNumberConfidence = 75.0;
inline constexpr double kDuplicateConfidence = 90.0;
inline constexpr double kVelocityConfidence = 80.0;

gl::Severity OutlierSeverity(double score);

// Builds the unified anomaly record for one finding. The anomaly is emitted
// with status OPEN, a "<KIND>-<id>" identifier and score/confidence clamped
// to [0, 100]. Throws std::invalid_argument when the finding has no line items.
gl::Anomaly ToAnomaly(const DetectorFinding& finding, IdGenerator& ids, const std::string& detected_at);

}  // namespace gl_anomaly
