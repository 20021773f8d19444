#pragma once

#include <string>
#include <vector>

#include <userver/formats/parse/common_containers.hpp>
#include <userver/formats/parse/to.hpp>

#include <gl/anomaly.pb.h>

#include "errors/errors.hpp"

namespace gl_anomaly {

struct BenfordConfig {
    bool enabled = true;
    int min_transactions = 100;
    double significance_level = 0.05;
};

struct OutlierConfig {
    bool enabled = true;
    gl::OutlierMethod method = gl::IQR;
    double z_score_threshold = 3.0;
    double iqr_multiplier = 1.5;
    double mad_threshold = 3.5;
    int min_account_transactions = 10;
    int max_per_account = 10;
};

struct BehavioralConfig {
    bool enabled = true;
    bool check_after_hours = true;
    int after_hours_start = 19;
    int after_hours_end = 7;
    bool check_weekends = true;
    bool check_reversals = true;
    double same_day_reversal_window_hours = 24.0;
};

struct VelocityConfig {
    bool enabled = true;
    double deviation_threshold = 200.0;
    int lookback_periods = 12;
};

struct RoundNumberConfig {
    bool enabled = true;
    std::vector<double> thresholds{1000.0, 5000.0, 10000.0};
    int min_occurrences = 5;
};

struct DuplicateConfig {
    bool enabled = true;
    double time_window_hours = 24.0;
    double amount_tolerance = 0.01;
    bool require_matching_description = false;
};

struct DetectionConfig {
    // IANA name of the ledger's time zone, posting date/time are wall-clock values in it.
    std::string timezone;
    BenfordConfig benford;
    OutlierConfig outliers;
    BehavioralConfig behavioral;
    VelocityConfig velocity;
    RoundNumberConfig round_numbers;
    DuplicateConfig duplicates;
};

// "z-score", "iqr" or "mad"
gl::OutlierMethod ParseOutlierMethod(const std::string& name);
std::string ToString(gl::OutlierMethod method);

// Throws ConfigError naming the first offending option.
void Validate(const DetectionConfig& config);

template <class Value>
BenfordConfig Parse(const Value& value, userver::formats::parse::To<BenfordConfig>) {
    BenfordConfig config;
    config.enabled = value["enabled"].template As<bool>(config.enabled);
    config.min_transactions = value["min-transactions"].template As<int>(config.min_transactions);
    config.significance_level = value["significance-level"].template As<double>(config.significance_level);
    return config;
}

template <class Value>
OutlierConfig Parse(const Value& value, userver::formats::parse::To<OutlierConfig>) {
    OutlierConfig config;
    config.enabled = value["enabled"].template As<bool>(config.enabled);
    config.method = ParseOutlierMethod(value["method"].template As<std::string>(ToString(config.method)));
    config.z_score_threshold = value["z-score-threshold"].template As<double>(config.z_score_threshold);
    config.iqr_multiplier = value["iqr-multiplier"].template As<double>(config.iqr_multiplier);
    config.mad_threshold = value["mad-threshold"].template As<double>(config.mad_threshold);
    config.min_account_transactions =
        value["min-account-transactions"].template As<int>(config.min_account_transactions);
    config.max_per_account = value["max-per-account"].template As<int>(config.max_per_account);
    return config;
}

template <class Value>
BehavioralConfig Parse(const Value& value, userver::formats::parse::To<BehavioralConfig>) {
    BehavioralConfig config;
    config.enabled = value["enabled"].template As<bool>(config.enabled);
    config.check_after_hours = value["check-after-hours"].template As<bool>(config.check_after_hours);
    config.after_hours_start = value["after-hours-start"].template As<int>(config.after_hours_start);
    config.after_hours_end = value["after-hours-end"].template As<int>(config.after_hours_end);
    config.check_weekends = value["check-weekends"].template As<bool>(config.check_weekends);
    config.check_reversals = value["check-reversals"].template As<bool>(config.check_reversals);
    config.same_day_reversal_window_hours =
        value["same-day-reversal-window-hours"].template As<double>(config.same_day_reversal_window_hours);
    return config;
}

template <class Value>
VelocityConfig Parse(const Value& value, userver::formats::parse::To<VelocityConfig>) {
    VelocityConfig config;
    config.enabled = value["enabled"].template As<bool>(config.enabled);
    config.deviation_threshold = value["deviation-threshold"].template As<double>(config.deviation_threshold);
    config.lookback_periods = value["lookback-periods"].template As<int>(config.lookback_periods);
    return config;
}

template <class Value>
RoundNumberConfig Parse(const Value& value, userver::formats::parse::To<RoundNumberConfig>) {
    RoundNumberConfig config;
    config.enabled = value["enabled"].template As<bool>(config.enabled);
    config.thresholds = value["thresholds"].template As<std::vector<double>>(config.thresholds);
    config.min_occurrences = value["min-occurrences"].template As<int>(config.min_occurrences);
    return config;
}

template <class Value>
DuplicateConfig Parse(const Value& value, userver::formats::parse::To<DuplicateConfig>) {
    DuplicateConfig config;
    config.enabled = value["enabled"].template As<bool>(config.enabled);
    config.time_window_hours = value["time-window-hours"].template As<double>(config.time_window_hours);
    config.amount_tolerance = value["amount-tolerance"].template As<double>(config.amount_tolerance);
    config.require_matching_description =
        value["require-matching-description"].template As<bool>(config.require_matching_description);
    return config;
}

// Works for both formats::yaml::Value and the static component config.
template <class Value>
DetectionConfig Parse(const Value& value, userver::formats::parse::To<DetectionConfig>) {
    DetectionConfig config;
    config.timezone = value["timezone"].template As<std::string>("");
    config.benford = value["benford-law"].template As<BenfordConfig>(BenfordConfig{});
    config.outliers = value["statistical-outliers"].template As<OutlierConfig>(OutlierConfig{});
    config.behavioral = value["behavioral-anomalies"].template As<BehavioralConfig>(BehavioralConfig{});
    config.velocity = value["velocity-analysis"].template As<VelocityConfig>(VelocityConfig{});
    config.round_numbers = value["round-numbers"].template As<RoundNumberConfig>(RoundNumberConfig{});
    config.duplicates = value["duplicate-detection"].template As<DuplicateConfig>(DuplicateConfig{});
    Validate(config);
    return config;
}

}  // namespace gl_anomaly
