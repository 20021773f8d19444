#include "risk_profiler.hpp"

#include <algorithm>

#include <fmt/format.h>

#include <userver/logging/log.hpp>
#include <userver/utils/datetime.hpp>

namespace gl_anomaly {

namespace {

std::size_t CountSeverity(const std::vector<const gl::Anomaly*>& anomalies, gl::Severity severity) {
    return std::count_if(anomalies.begin(), anomalies.end(), [severity](const gl::Anomaly* anomaly) {
        return anomaly->severity() == severity;
    });
}

bool HasType(const std::vector<const gl::Anomaly*>& anomalies, gl::AnomalyType type) {
    return std::any_of(anomalies.begin(), anomalies.end(), [type](const gl::Anomaly* anomaly) {
        return anomaly->anomaly_type() == type;
    });
}

}  // anonymous namespace

double CalculateRiskScore(const std::vector<const gl::Anomaly*>& anomalies) {
    const double score = 25.0 * CountSeverity(anomalies, gl::CRITICAL) +
                         15.0 * CountSeverity(anomalies, gl::HIGH) +
                         5.0 * CountSeverity(anomalies, gl::MEDIUM);
    return std::min(100.0, score);
}

gl::Severity RiskLevel(double risk_score) {
    if (risk_score >= 75) return gl::CRITICAL;
    if (risk_score >= 50) return gl::HIGH;
    if (risk_score >= 25) return gl::MEDIUM;
    return gl::LOW;
}

int RiskFactorImpact(gl::Severity severity) {
    switch (severity) {
        case gl::CRITICAL:
            return 10;
        case gl::HIGH:
            return 7;
        case gl::MEDIUM:
            return 4;
        default:
            return 2;
    }
}

std::vector<std::string> IdentifyControlWeaknesses(const std::vector<const gl::Anomaly*>& anomalies) {
    std::vector<std::string> weaknesses;
    if (HasType(anomalies, gl::AFTER_HOURS_POSTING)) {
        weaknesses.emplace_back("Inadequate access controls for after-hours postings");
    }
    if (HasType(anomalies, gl::DUPLICATE_ENTRY)) {
        weaknesses.emplace_back("Weak duplicate detection controls");
    }
    if (HasType(anomalies, gl::BENFORD_LAW_VIOLATION)) {
        weaknesses.emplace_back("Potential data manipulation or estimation practices");
    }
    return weaknesses;
}

std::vector<std::string> GenerateRecommendations(const std::vector<const gl::Anomaly*>& anomalies) {
    std::vector<std::string> recommendations;

    const auto critical = CountSeverity(anomalies, gl::CRITICAL);
    if (critical > 0) {
        recommendations.push_back(fmt::format("URGENT: Investigate {} critical anomalies immediately", critical));
    }
    if (HasType(anomalies, gl::BENFORD_LAW_VIOLATION)) {
        recommendations.emplace_back("Review data entry processes and potential estimation biases");
    }
    if (HasType(anomalies, gl::AFTER_HOURS_POSTING)) {
        recommendations.emplace_back("Strengthen access controls for after-hours postings");
    }
    if (HasType(anomalies, gl::DUPLICATE_ENTRY)) {
        recommendations.emplace_back("Implement automated duplicate detection in source systems");
    }
    if (recommendations.empty()) {
        recommendations.emplace_back("Continue regular monitoring - no critical issues detected");
    }
    return recommendations;
}

gl::AccountRiskProfile RiskProfiler::AnalyzeGLAccount(
    const std::string& tenant_id,
    const std::string& gl_account,
    const std::string& fiscal_year,
    const std::optional<std::string>& fiscal_period) const {
    gl::LineItemFilter filter;
    filter.add_gl_accounts(gl_account);
    filter.set_fiscal_year(fiscal_year);
    if (fiscal_period) {
        filter.set_fiscal_period(*fiscal_period);
    }

    const auto result = engine_.DetectAnomalies(tenant_id, filter);

    // The data source may return more than was asked for
    std::vector<const gl::Anomaly*> anomalies;
    for (const auto& anomaly : result.anomalies()) {
        if (anomaly.gl_account() == gl_account) {
            anomalies.push_back(&anomaly);
        }
    }

    gl::AccountRiskProfile profile;
    profile.set_gl_account(gl_account);
    for (const auto& stats : result.account_stats()) {
        if (stats.gl_account() == gl_account) {
            profile.set_gl_account_name(stats.gl_account_name());
            break;
        }
    }

    const double risk_score = CalculateRiskScore(anomalies);
    profile.set_risk_score(risk_score);
    profile.set_risk_level(RiskLevel(risk_score));

    for (std::size_t i = 0; i < anomalies.size() && i < kMaxRiskFactors; ++i) {
        const auto& anomaly = *anomalies[i];
        auto* factor = profile.add_risk_factors();
        factor->set_factor(anomaly.anomaly_type());
        factor->set_severity(anomaly.severity());
        factor->set_description(anomaly.description());
        factor->set_impact(RiskFactorImpact(anomaly.severity()));
    }

    profile.set_anomaly_count(static_cast<int>(anomalies.size()));
    profile.set_critical_anomaly_count(static_cast<int>(CountSeverity(anomalies, gl::CRITICAL)));

    for (const auto& benford : result.benford_analysis()) {
        if (benford.gl_account() == gl_account) {
            profile.set_benford_score(benford.p_value() * 100.0);
            break;
        }
    }

    for (auto& weakness : IdentifyControlWeaknesses(anomalies)) {
        profile.add_control_weaknesses(std::move(weakness));
    }
    for (auto& recommendation : GenerateRecommendations(anomalies)) {
        profile.add_recommendations(std::move(recommendation));
    }
    profile.set_last_assessed_at(userver::utils::datetime::Timestring(userver::utils::datetime::Now()));

    LOG_INFO() << "Risk profile for GL account " << gl_account << ": score " << risk_score << ", "
               << profile.anomaly_count() << " anomalies";
    return profile;
}

}  // namespace gl_anomaly
