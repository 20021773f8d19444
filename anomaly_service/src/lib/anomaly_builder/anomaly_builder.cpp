#include "anomaly_builder.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "benford_analyzer/benford_analyzer.hpp"

namespace gl_anomaly {

namespace {

constexpr std::size_t kExampleDocumentsLimit = 10;

double Clamp100(double value) {
    return std::clamp(value, 0.0, 100.0);
}

bool IsHighOrCritical(gl::Severity severity) {
    return severity == gl::HIGH || severity == gl::CRITICAL;
}

std::string FormatAmount(double amount, const std::string& currency) {
    return fmt::format("{:.2f} {}", amount, currency);
}

class AnomalyBuilder {
public:
    AnomalyBuilder(IdGenerator& ids, const std::string& detected_at)
        : ids_(ids), detected_at_(detected_at) {}

    gl::Anomaly operator()(const OutlierObservation& outlier) const {
        const auto& item = *outlier.line_item;
        const auto severity = OutlierSeverity(outlier.score);

        auto anomaly = Start("OUTLIER", gl::STATISTICAL_OUTLIER, severity, {&item});
        anomaly.set_score(outlier.score * 20.0);
        anomaly.set_description(fmt::format(
            "Unusual amount detected: {} ({} score: {:.2f})",
            FormatAmount(std::abs(item.amount()), item.currency()),
            gl::OutlierMethod_Name(outlier.method),
            outlier.score));

        auto* details = anomaly.mutable_details();
        details->set_confidence(kOutlierConfidence);
        auto* evidence = details->mutable_outlier();
        evidence->set_method(outlier.method);
        evidence->set_score(outlier.score);
        evidence->set_threshold(outlier.threshold);
        evidence->set_deviation(outlier.deviation);
        if (outlier.population_mean) evidence->set_population_mean(*outlier.population_mean);
        if (outlier.population_std) evidence->set_population_std(*outlier.population_std);

        anomaly.set_recommendation(severity == gl::CRITICAL
            ? "URGENT: Investigate unusual transaction amount"
            : "Review transaction for legitimacy");
        return Finish(std::move(anomaly));
    }

    gl::Anomaly operator()(const BenfordFinding& finding) const {
        const auto& result = finding.result;
        const auto largest = LargestDigitDeviation(result);
        const double confidence = (1.0 - result.p_value()) * 100.0;

        auto anomaly = Start("BENFORD", gl::BENFORD_LAW_VIOLATION, result.severity(), finding.items);
        anomaly.set_score(confidence);
        anomaly.set_description(fmt::format(
            "GL account {} shows significant deviation from Benford's Law. "
            "Digit {} appears {:.1f}% of the time (expected: {}%). "
            "Chi-Square: {:.2f}, p-value: {:.4f}",
            result.gl_account(), largest.digit, largest.actual, largest.expected,
            result.chi_square_statistic(), result.p_value()));

        auto* details = anomaly.mutable_details();
        details->set_confidence(confidence);
        auto* evidence = details->mutable_benford();
        evidence->set_chi_square_statistic(result.chi_square_statistic());
        evidence->set_p_value(result.p_value());
        evidence->set_total_transactions(result.total_transactions());
        auto* deviation = evidence->mutable_largest_deviation();
        deviation->set_digit(largest.digit);
        deviation->set_expected(largest.expected);
        deviation->set_actual(largest.actual);
        deviation->set_deviation(largest.deviation);
        *evidence->mutable_actual_distribution() = result.actual_distribution();

        anomaly.set_recommendation(IsHighOrCritical(result.severity())
            ? "URGENT: Investigate for potential fraud or systematic data manipulation"
            : "Review transaction patterns for data quality issues or unusual behavior");
        return Finish(std::move(anomaly));
    }

    gl::Anomaly operator()(const BehavioralMatch& match) const {
        return std::visit(*this, match);
    }

    gl::Anomaly operator()(const PostingPatternMatch& match) const {
        const bool after_hours = match.type == gl::AFTER_HOURS_POSTING;
        const auto count = static_cast<int>(match.items.size());

        auto anomaly = Start(after_hours ? "AFTER_HOURS" : "WEEKEND", match.type, match.severity, match.items);
        const auto* first = match.items.front();
        anomaly.set_score((after_hours ? 5.0 : 4.0) * count);
        anomaly.set_description(fmt::format(
            "User {} made {} posting(s) {} (total: {})",
            first->user_name(), count, after_hours ? "after hours" : "on weekends",
            FormatAmount(match.total_amount, first->currency())));

        auto* details = anomaly.mutable_details();
        details->set_confidence(after_hours ? kAfterHoursConfidence : kWeekendConfidence);
        auto* evidence = details->mutable_posting_pattern();
        evidence->set_user_id(match.user_id);
        evidence->set_user_name(first->user_name());
        evidence->set_posting_count(count);
        evidence->set_total_amount(match.total_amount);
        for (const auto* item : match.items) {
            if (after_hours && item->has_posting_time()) {
                evidence->add_posting_times(item->posting_time());
            }
            if (!after_hours) {
                evidence->add_posting_dates(item->posting_date());
            }
        }

        if (after_hours) {
            anomaly.set_recommendation(IsHighOrCritical(match.severity)
                ? "Investigate urgently - high volume of after-hours activity may indicate unauthorized access"
                : "Review with user to ensure legitimate business reason");
        } else {
            anomaly.set_recommendation("Review weekend activity for business justification");
        }
        return Finish(std::move(anomaly));
    }

    gl::Anomaly operator()(const ReversalMatch& match) const {
        const auto& original = *match.original;
        const auto& reversal = *match.reversal;

        auto anomaly = Start("REVERSAL", gl::SAME_DAY_REVERSAL, match.severity, {&original, &reversal});
        anomaly.set_score(70.0 + 2.0 * (match.window_hours - match.hours_between));
        anomaly.set_description(fmt::format(
            "Document {} reversed within {:.1f} hours (amount: {})",
            original.document_number(), match.hours_between,
            FormatAmount(std::abs(original.amount()), original.currency())));

        auto* details = anomaly.mutable_details();
        details->set_confidence(kReversalConfidence);
        auto* evidence = details->mutable_reversal();
        evidence->set_original_document(original.document_number());
        evidence->set_reversal_document(reversal.document_number());
        evidence->set_amount(std::abs(original.amount()));
        evidence->set_hours_between_postings(match.hours_between);
        evidence->set_user_id(original.user_id());
        evidence->set_user_name(original.user_name());

        anomaly.set_recommendation(match.hours_between < 1.0
            ? "URGENT: Investigate immediate reversal - possible error or manipulation"
            : "Review business reason for same-day reversal");
        return Finish(std::move(anomaly));
    }

    gl::Anomaly operator()(const RoundNumberMatch& match) const {
        const auto count = static_cast<int>(match.items.size());

        auto anomaly = Start("ROUND_NUMBER", gl::ROUND_NUMBER_PATTERN, match.severity, match.items);
        anomaly.set_score(2.0 * match.percentage);
        anomaly.set_description(fmt::format(
            "{} transactions ({:.1f}%) have suspiciously round amounts (total: {})",
            count, match.percentage,
            FormatAmount(match.total_amount, match.items.front()->currency())));

        auto* details = anomaly.mutable_details();
        details->set_confidence(kRoundNumberConfidence);
        auto* evidence = details->mutable_round_number();
        evidence->set_round_number_count(count);
        evidence->set_total_transactions(match.total_transactions);
        evidence->set_percentage(match.percentage);
        evidence->set_total_amount(match.total_amount);
        for (double threshold : match.thresholds) {
            evidence->add_thresholds(threshold);
        }
        for (std::size_t i = 0; i < match.items.size() && i < kExampleDocumentsLimit; ++i) {
            evidence->add_example_documents(match.items[i]->document_number());
        }

        anomaly.set_recommendation(IsHighOrCritical(match.severity)
            ? "URGENT: Investigate for potential estimation fraud or manipulation"
            : "Review for legitimate business reasons (e.g., budget allocations)");
        return Finish(std::move(anomaly));
    }

    gl::Anomaly operator()(const DuplicateMatch& match) const {
        const auto count = static_cast<int>(match.items.size());

        auto anomaly = Start("DUPLICATE", gl::DUPLICATE_ENTRY, match.severity, match.items);
        const auto& first = *match.items.front();
        anomaly.set_score(25.0 * count);
        anomaly.set_description(fmt::format(
            "{} duplicate entries detected (total: {})",
            count, FormatAmount(match.total_amount, first.currency())));

        auto* details = anomaly.mutable_details();
        details->set_confidence(kDuplicateConfidence);
        auto* evidence = details->mutable_duplicate();
        evidence->set_duplicate_count(count);
        evidence->set_amount(first.amount());
        evidence->set_total_amount(match.total_amount);
        evidence->set_description(first.description());
        for (const auto* item : match.items) {
            evidence->add_document_numbers(item->document_number());
        }

        anomaly.set_recommendation(match.severity == gl::CRITICAL
            ? "URGENT: Investigate for duplicate payment or data entry error"
            : "Review and remove duplicate entries");
        return Finish(std::move(anomaly));
    }

    gl::Anomaly operator()(const VelocityMatch& match) const {
        const auto& observation = match.observation;
        const double max_deviation = std::max(
            std::abs(observation.count_deviation()), std::abs(observation.amount_deviation()));

        auto anomaly = Start("VELOCITY", gl::VELOCITY_ANOMALY, observation.severity(), match.items);
        anomaly.set_score(max_deviation / 5.0);
        anomaly.set_description(fmt::format(
            "Unusual transaction velocity in period {}: {} transactions ({}{:.0f}% vs avg)",
            observation.period(), observation.transaction_count(),
            observation.count_deviation() > 0 ? "+" : "", observation.count_deviation()));

        auto* details = anomaly.mutable_details();
        details->set_confidence(kVelocityConfidence);
        auto* evidence = details->mutable_velocity();
        evidence->set_period(observation.period());
        evidence->set_transaction_count(observation.transaction_count());
        evidence->set_average_count(observation.average_transaction_count());
        evidence->set_total_amount(observation.total_amount());
        evidence->set_average_amount(observation.average_amount());
        evidence->set_count_deviation(observation.count_deviation());
        evidence->set_amount_deviation(observation.amount_deviation());

        anomaly.set_recommendation("Investigate sudden change in transaction patterns");
        return Finish(std::move(anomaly));
    }

private:
    gl::Anomaly Start(
        const char* kind,
        gl::AnomalyType type,
        gl::Severity severity,
        const LineItemRefs& items) const {
        if (items.empty()) {
            throw std::invalid_argument(fmt::format("{} finding without line items", kind));
        }

        gl::Anomaly anomaly;
        anomaly.set_anomaly_id(fmt::format("{}-{}", kind, ids_.Generate()));
        anomaly.set_gl_account(items.front()->gl_account());
        anomaly.set_gl_account_name(items.front()->gl_account_name());
        for (const auto* item : items) {
            *anomaly.add_line_items() = *item;
        }
        anomaly.set_anomaly_type(type);
        anomaly.set_severity(severity);
        anomaly.set_detected_at(detected_at_);
        anomaly.set_status(gl::Anomaly::OPEN);
        return anomaly;
    }

    static gl::Anomaly Finish(gl::Anomaly anomaly) {
        anomaly.set_score(Clamp100(anomaly.score()));
        anomaly.mutable_details()->set_confidence(Clamp100(anomaly.details().confidence()));
        return anomaly;
    }

    IdGenerator& ids_;
    const std::string& detected_at_;
};

}  // anonymous namespace

gl::Severity OutlierSeverity(double score) {
    if (score > 5) return gl::CRITICAL;
    if (score > 3) return gl::HIGH;
    return gl::MEDIUM;
}

gl::Anomaly ToAnomaly(const DetectorFinding& finding, IdGenerator& ids, const std::string& detected_at) {
    return std::visit(AnomalyBuilder(ids, detected_at), finding);
}

}  // namespace gl_anomaly
