#pragma once

#include <array>
#include <optional>
#include <vector>

#include <gl/detection_result.pb.h>

#include "account_index/account_index.hpp"

namespace gl_anomaly {

// P(d) = log10(1 + 1/d) in percent, rounded to one decimal; the severity
// thresholds below are calibrated against these exact values.
inline constexpr std::array<double, 9> kBenfordExpectedPercent = {
    30.1, 17.6, 12.5, 9.7, 7.9, 6.7, 5.8, 5.1, 4.6};

inline constexpr int kBenfordDegreesOfFreedom = 8;

// First significant digit (1..9) of |amount|; nullopt for zero.
std::optional<int> GetFirstDigit(double amount);

std::array<int, 9> CalculateFirstDigitCounts(const LineItemRefs& items);

// Sum of (observed - expected)^2 / expected over percentage distributions.
double CalculateChiSquare(const std::array<double, 9>& observed_percent);

// Linear interpolation over the df=8 critical value table. Below the first
// anchor the result is 1.0, at or above the last one it is 0.001.
double CalculatePValue(double chi_square);

gl::Severity DetermineBenfordSeverity(double p_value, double max_deviation);

gl::BenfordResult AnalyzeBenford(
    const LineItemRefs& items,
    const std::string& gl_account,
    double significance_level);

// Accounts with fewer than min_transactions items are skipped. Results are
// ordered by severity descending, then by p-value ascending.
std::vector<gl::BenfordResult> AnalyzeBenfordBatch(
    const AccountIndex& index,
    int min_transactions,
    double significance_level);

struct DigitDeviationInfo {
    int digit = 1;
    double expected = 0.0;
    double actual = 0.0;
    double deviation = 0.0;
};

DigitDeviationInfo LargestDigitDeviation(const gl::BenfordResult& result);

}  // namespace gl_anomaly
