#pragma once

#include <optional>
#include <string>
#include <vector>

#include <gl/detection_result.pb.h>

#include "detection_engine/detection_engine.hpp"

namespace gl_anomaly {

inline constexpr std::size_t kMaxRiskFactors = 5;

class RiskProfiler {
public:
    explicit RiskProfiler(const DetectionEngine& engine) : engine_(engine) {}

    // Runs a detection scoped to one account and folds its anomalies into a
    // risk profile. Errors of the underlying run propagate.
    gl::AccountRiskProfile AnalyzeGLAccount(
        const std::string& tenant_id,
        const std::string& gl_account,
        const std::string& fiscal_year,
        const std::optional<std::string>& fiscal_period = std::nullopt) const;

private:
    const DetectionEngine& engine_;
};

// 25 per critical, 15 per high, 5 per medium; capped at 100.
double CalculateRiskScore(const std::vector<const gl::Anomaly*>& anomalies);

gl::Severity RiskLevel(double risk_score);

int RiskFactorImpact(gl::Severity severity);

std::vector<std::string> IdentifyControlWeaknesses(const std::vector<const gl::Anomaly*>& anomalies);

std::vector<std::string> GenerateRecommendations(const std::vector<const gl::Anomaly*>& anomalies);

}  // namespace gl_anomaly
