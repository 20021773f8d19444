#include "detection_engine.hpp"

#include <algorithm>

#include <fmt/format.h>

#include <userver/logging/log.hpp>
#include <userver/utils/datetime.hpp>

#include "account_index/account_index.hpp"
#include "account_stats/account_stats.hpp"
#include "behavioral_detector/behavioral_detector.hpp"
#include "benford_analyzer/benford_analyzer.hpp"
#include "errors/errors.hpp"
#include "outlier_detector/outlier_detector.hpp"
#include "velocity_analyzer/velocity_analyzer.hpp"

namespace gl_anomaly {

namespace {

constexpr const char* kAnalysisIdPrefix = "GLAD";

int SeverityRank(gl::Severity severity) {
    switch (severity) {
        case gl::CRITICAL:
            return 4;
        case gl::HIGH:
            return 3;
        case gl::MEDIUM:
            return 2;
        default:
            return 1;
    }
}

void ValidateFilter(const std::optional<gl::LineItemFilter>& filter) {
    if (!filter) {
        throw InvalidFilterError("Filter is required");
    }
    if (filter->fiscal_year().empty()) {
        throw InvalidFilterError("Filter fiscal year is required");
    }
}

DetectionConfig Validated(DetectionConfig config) {
    Validate(config);
    return config;
}

std::string CurrentTimestring() {
    return userver::utils::datetime::Timestring(userver::utils::datetime::Now());
}

}  // anonymous namespace

struct DetectionEngine::RunContext {
    const AccountIndex& index;
    const PostingMoments& moments;
    gl::DetectionResult& result;
    std::vector<DetectorFinding> findings;
};

std::unique_ptr<DetectionEngine> MakeDetectionEngine(const DetectionConfig& config, const GLDataSource& data_source) {
    return std::make_unique<DetectionEngine>(data_source, config, std::make_shared<UuidIdGenerator>());
}

bool RunRuleIsolated(
    const std::string& rule,
    const RuleBody& body,
    std::vector<DetectorFinding>& findings,
    google::protobuf::RepeatedPtrField<std::string>& diagnostics) {
    std::vector<DetectorFinding> produced;
    try {
        body(produced);
    } catch (const std::exception& e) {
        LOG_ERROR() << "Rule " << rule << " failed, skipping it: " << e.what();
        *diagnostics.Add() = fmt::format("{}: {}", rule, e.what());
        return false;
    }

    LOG_DEBUG() << "Rule " << rule << " produced " << produced.size() << " findings";
    for (auto& finding : produced) {
        findings.push_back(std::move(finding));
    }
    return true;
}

void ValidateLineItem(const gl::LineItem& item) {
    if (item.document_number().empty()) {
        throw MalformedLineItemError(item.document_number(), "document number is missing");
    }
    if (item.gl_account().empty()) {
        throw MalformedLineItemError(item.document_number(), "GL account is missing");
    }
    if (item.gl_account_name().empty()) {
        throw MalformedLineItemError(item.document_number(), "GL account name is missing");
    }
    if (item.posting_date().empty()) {
        throw MalformedLineItemError(item.document_number(), "posting date is missing");
    }
}

double EstimateFraudRisk(const std::vector<gl::Anomaly>& anomalies, std::size_t total_line_items) {
    if (total_line_items == 0) return 0.0;

    double risk = 0.0;
    for (const auto& anomaly : anomalies) {
        if (anomaly.severity() == gl::CRITICAL) risk += 15.0;
        if (anomaly.severity() == gl::HIGH) risk += 8.0;
    }

    const double anomaly_rate = static_cast<double>(anomalies.size()) / total_line_items * 100.0;
    if (anomaly_rate > 10.0) {
        risk += 20.0;
    } else if (anomaly_rate > 5.0) {
        risk += 10.0;
    }
    return std::min(100.0, risk);
}

gl::DetectionSummary Summarize(const std::vector<gl::Anomaly>& anomalies) {
    gl::DetectionSummary summary;
    auto& by_type = *summary.mutable_by_type();
    for (const auto& anomaly : anomalies) {
        switch (anomaly.severity()) {
            case gl::CRITICAL:
                summary.set_critical_anomalies(summary.critical_anomalies() + 1);
                break;
            case gl::HIGH:
                summary.set_high_anomalies(summary.high_anomalies() + 1);
                break;
            case gl::MEDIUM:
                summary.set_medium_anomalies(summary.medium_anomalies() + 1);
                break;
            default:
                summary.set_low_anomalies(summary.low_anomalies() + 1);
                break;
        }
        ++by_type[gl::AnomalyType_Name(anomaly.anomaly_type())];
    }
    return summary;
}

DetectionEngine::DetectionEngine(const GLDataSource& data_source, DetectionConfig config, IdGeneratorPtr ids)
    : data_source_(data_source),
      config_(Validated(std::move(config))),
      ids_(std::move(ids)),
      calendar_(config_.timezone) {
    if (!ids_) {
        throw ConfigError("Id generator is required");
    }
}

gl::DetectionResult DetectionEngine::DetectAnomalies(
    const std::string& tenant_id,
    const std::optional<gl::LineItemFilter>& filter) const {
    ValidateFilter(filter);

    gl::DetectionResult result;
    result.set_analysis_id(fmt::format("{}-{}", kAnalysisIdPrefix, ids_->Generate()));
    result.set_tenant_id(tenant_id);
    if (filter->gl_accounts_size() > 0) {
        result.set_gl_account(filter->gl_accounts(0));
    }
    result.set_fiscal_year(filter->fiscal_year());
    if (filter->has_fiscal_period()) {
        result.set_fiscal_period(filter->fiscal_period());
    }

    LOG_INFO() << "Starting anomaly detection " << result.analysis_id() << " for tenant " << tenant_id
               << ", fiscal year " << filter->fiscal_year();

    const auto line_items = data_source_.GetGLLineItems(*filter);
    result.set_total_line_items(static_cast<int>(line_items.size()));

    if (line_items.empty()) {
        LOG_INFO() << "No line items fetched for " << result.analysis_id();
        result.mutable_summary();
        result.set_completed_at(CurrentTimestring());
        return result;
    }

    for (const auto& item : line_items) {
        ValidateLineItem(item);
    }
    const auto moments = calendar_.ResolveAll(ToRefs(line_items));
    const auto index = AccountIndex::Build(line_items);

    LOG_DEBUG() << "Fetched " << line_items.size() << " line items across " << index.Groups().size()
                << " GL accounts";

    RunContext run{index, moments, result, {}};
    if (config_.benford.enabled) RunBenford(run);
    if (config_.outliers.enabled) RunOutliers(run);
    if (config_.behavioral.enabled) RunBehavioral(run);
    if (config_.round_numbers.enabled) RunRoundNumbers(run);
    if (config_.duplicates.enabled) RunDuplicates(run);
    if (config_.velocity.enabled) RunVelocity(run);

    const auto detected_at = CurrentTimestring();
    std::vector<gl::Anomaly> anomalies;
    anomalies.reserve(run.findings.size());
    for (const auto& finding : run.findings) {
        anomalies.push_back(ToAnomaly(finding, *ids_, detected_at));
    }
    std::stable_sort(anomalies.begin(), anomalies.end(), [](const gl::Anomaly& lhs, const gl::Anomaly& rhs) {
        return SeverityRank(lhs.severity()) > SeverityRank(rhs.severity());
    });

    for (const auto& group : index.Groups()) {
        *result.add_account_stats() = CalculateAccountStats(group.items, group.gl_account, moments);
    }

    auto summary = Summarize(anomalies);
    summary.set_estimated_fraud_risk(EstimateFraudRisk(anomalies, line_items.size()));
    *result.mutable_summary() = std::move(summary);

    result.set_anomalies_detected(static_cast<int>(anomalies.size()));
    for (auto& anomaly : anomalies) {
        *result.add_anomalies() = std::move(anomaly);
    }
    result.set_completed_at(CurrentTimestring());

    LOG_INFO() << "Anomaly detection " << result.analysis_id() << " finished: "
               << result.anomalies_detected() << " anomalies in " << line_items.size()
               << " line items, estimated fraud risk " << result.summary().estimated_fraud_risk();
    return result;
}

void DetectionEngine::RunBenford(RunContext& run) const {
    const auto& benford = config_.benford;
    auto results = AnalyzeBenfordBatch(run.index, benford.min_transactions, benford.significance_level);

    for (auto& benford_result : results) {
        if (benford_result.is_anomalous()) {
            const auto* group = run.index.Find(benford_result.gl_account());
            run.findings.emplace_back(BenfordFinding{benford_result, group->items});
        }
        *run.result.add_benford_analysis() = std::move(benford_result);
    }
}

void DetectionEngine::RunOutliers(RunContext& run) const {
    const auto& outliers = config_.outliers;
    const OutlierThresholds thresholds{outliers.z_score_threshold, outliers.iqr_multiplier, outliers.mad_threshold};

    for (const auto& group : run.index.Groups()) {
        if (static_cast<int>(group.items.size()) < outliers.min_account_transactions) {
            LOG_DEBUG() << "Skipping outlier detection for GL account " << group.gl_account << ": "
                        << group.items.size() << " line items";
            continue;
        }

        auto observations = DetectOutliers(group.items, outliers.method, thresholds);
        if (static_cast<int>(observations.size()) > outliers.max_per_account) {
            observations.resize(outliers.max_per_account);
        }
        for (auto& observation : observations) {
            run.findings.emplace_back(std::move(observation));
        }
    }
}

void DetectionEngine::RunBehavioral(RunContext& run) const {
    const auto& behavioral = config_.behavioral;
    const BehavioralDetector detector(run.moments);

    if (behavioral.check_after_hours) {
        RunRuleIsolated("after-hours", [&](std::vector<DetectorFinding>& findings) {
            for (const auto& group : run.index.Groups()) {
                for (auto& match : detector.DetectAfterHoursPostings(
                         group.items, behavioral.after_hours_start, behavioral.after_hours_end)) {
                    findings.emplace_back(BehavioralMatch{std::move(match)});
                }
            }
        }, run.findings, *run.result.mutable_diagnostics());
    }

    if (behavioral.check_weekends) {
        RunRuleIsolated("weekend", [&](std::vector<DetectorFinding>& findings) {
            for (const auto& group : run.index.Groups()) {
                for (auto& match : detector.DetectWeekendPostings(group.items)) {
                    findings.emplace_back(BehavioralMatch{std::move(match)});
                }
            }
        }, run.findings, *run.result.mutable_diagnostics());
    }

    if (behavioral.check_reversals) {
        RunRuleIsolated("same-day-reversal", [&](std::vector<DetectorFinding>& findings) {
            for (const auto& group : run.index.Groups()) {
                for (auto& match : detector.DetectSameDayReversals(
                         group.items, behavioral.same_day_reversal_window_hours)) {
                    findings.emplace_back(BehavioralMatch{std::move(match)});
                }
            }
        }, run.findings, *run.result.mutable_diagnostics());
    }
}

void DetectionEngine::RunRoundNumbers(RunContext& run) const {
    const auto& round_numbers = config_.round_numbers;
    RunRuleIsolated("round-numbers", [&](std::vector<DetectorFinding>& findings) {
        for (const auto& group : run.index.Groups()) {
            auto match = DetectRoundNumberPattern(group.items, round_numbers.thresholds, round_numbers.min_occurrences);
            if (match) {
                findings.emplace_back(BehavioralMatch{std::move(*match)});
            }
        }
    }, run.findings, *run.result.mutable_diagnostics());
}

void DetectionEngine::RunDuplicates(RunContext& run) const {
    const auto& duplicates = config_.duplicates;
    const BehavioralDetector detector(run.moments);
    RunRuleIsolated("duplicate-detection", [&](std::vector<DetectorFinding>& findings) {
        for (const auto& group : run.index.Groups()) {
            for (auto& match : detector.DetectDuplicateEntries(
                     group.items,
                     duplicates.time_window_hours,
                     duplicates.amount_tolerance,
                     duplicates.require_matching_description)) {
                findings.emplace_back(BehavioralMatch{std::move(match)});
            }
        }
    }, run.findings, *run.result.mutable_diagnostics());
}

void DetectionEngine::RunVelocity(RunContext& run) const {
    const auto& velocity = config_.velocity;
    for (const auto& group : run.index.Groups()) {
        auto matches = AnalyzeVelocity(
            group.items, group.gl_account, velocity.deviation_threshold, velocity.lookback_periods);
        for (auto& match : matches) {
            *run.result.add_velocity_observations() = match.observation;
            run.findings.emplace_back(std::move(match));
        }
    }
}

}  // namespace gl_anomaly
