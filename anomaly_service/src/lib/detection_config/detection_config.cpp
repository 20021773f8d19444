#include "detection_config.hpp"

#include <fmt/format.h>

namespace gl_anomaly {

namespace {

void RequirePositive(double value, const char* option) {
    if (!(value > 0.0)) {
        throw ConfigError(fmt::format("'{}' must be positive, got {}", option, value));
    }
}

void RequireHour(int value, const char* option) {
    if (value < 0 || value > 23) {
        throw ConfigError(fmt::format("'{}' must be an hour in 0..23, got {}", option, value));
    }
}

}  // anonymous namespace

gl::OutlierMethod ParseOutlierMethod(const std::string& name) {
    if (name == "z-score") return gl::Z_SCORE;
    if (name == "iqr") return gl::IQR;
    if (name == "mad") return gl::MAD;
    throw ConfigError(fmt::format("Unknown outlier method '{}', expected z-score, iqr or mad", name));
}

std::string ToString(gl::OutlierMethod method) {
    switch (method) {
        case gl::Z_SCORE:
            return "z-score";
        case gl::IQR:
            return "iqr";
        case gl::MAD:
            return "mad";
        default:
            throw ConfigError(fmt::format("Unknown outlier method {}", static_cast<int>(method)));
    }
}

void Validate(const DetectionConfig& config) {
    if (config.timezone.empty()) {
        throw ConfigError("'timezone' is required");
    }

    const auto& benford = config.benford;
    if (benford.min_transactions < 1) {
        throw ConfigError("'benford-law.min-transactions' must be at least 1");
    }
    if (!(benford.significance_level > 0.0 && benford.significance_level < 1.0)) {
        throw ConfigError(fmt::format(
            "'benford-law.significance-level' must be in (0, 1), got {}", benford.significance_level));
    }

    const auto& outliers = config.outliers;
    if (!gl::OutlierMethod_IsValid(outliers.method)) {
        throw ConfigError("'statistical-outliers.method' is not a known method");
    }
    RequirePositive(outliers.z_score_threshold, "statistical-outliers.z-score-threshold");
    RequirePositive(outliers.iqr_multiplier, "statistical-outliers.iqr-multiplier");
    RequirePositive(outliers.mad_threshold, "statistical-outliers.mad-threshold");
    if (outliers.min_account_transactions < 1 || outliers.max_per_account < 1) {
        throw ConfigError(
            "'statistical-outliers.min-account-transactions' and 'max-per-account' must be at least 1");
    }

    const auto& behavioral = config.behavioral;
    RequireHour(behavioral.after_hours_start, "behavioral-anomalies.after-hours-start");
    RequireHour(behavioral.after_hours_end, "behavioral-anomalies.after-hours-end");
    if (behavioral.same_day_reversal_window_hours < 0.0) {
        throw ConfigError("'behavioral-anomalies.same-day-reversal-window-hours' must not be negative");
    }

    RequirePositive(config.velocity.deviation_threshold, "velocity-analysis.deviation-threshold");
    if (config.velocity.lookback_periods < 1) {
        throw ConfigError("'velocity-analysis.lookback-periods' must be at least 1");
    }

    if (config.round_numbers.thresholds.empty()) {
        throw ConfigError("'round-numbers.thresholds' must not be empty");
    }
    for (double threshold : config.round_numbers.thresholds) {
        RequirePositive(threshold, "round-numbers.thresholds");
    }
    if (config.round_numbers.min_occurrences < 1) {
        throw ConfigError("'round-numbers.min-occurrences' must be at least 1");
    }

    RequirePositive(config.duplicates.time_window_hours, "duplicate-detection.time-window-hours");
    if (config.duplicates.amount_tolerance < 0.0) {
        throw ConfigError("'duplicate-detection.amount-tolerance' must not be negative");
    }
}

}  // namespace gl_anomaly
