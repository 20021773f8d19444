#include "benford_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

namespace gl_anomaly {

namespace {

struct CriticalValue {
    double p_value;
    double chi_square;
};

constexpr std::array<CriticalValue, 9> kChiSquareTableDf8 = {{
    {0.995, 1.344},
    {0.99, 1.646},
    {0.95, 2.733},
    {0.90, 3.490},
    {0.50, 7.344},
    {0.10, 13.362},
    {0.05, 15.507},
    {0.01, 20.090},
    {0.005, 21.955},
}};

constexpr double kPValueFloor = 0.001;

int SeverityRank(gl::Severity severity) {
    return static_cast<int>(severity);
}

}  // anonymous namespace

std::optional<int> GetFirstDigit(double amount) {
    const double abs_amount = std::abs(amount);
    if (abs_amount == 0.0 || !std::isfinite(abs_amount)) {
        return std::nullopt;
    }

    // shortest round-trip rendering
    const std::string rendered = fmt::format("{}", abs_amount);
    for (char c : rendered) {
        if (c == 'e' || c == 'E') break;
        if (c >= '1' && c <= '9') {
            return c - '0';
        }
    }
    return std::nullopt;
}

std::array<int, 9> CalculateFirstDigitCounts(const LineItemRefs& items) {
    std::array<int, 9> counts{};
    for (const auto* item : items) {
        if (auto digit = GetFirstDigit(item->amount())) {
            ++counts[*digit - 1];
        }
    }
    return counts;
}

double CalculateChiSquare(const std::array<double, 9>& observed_percent) {
    double chi_square = 0.0;
    for (std::size_t i = 0; i < observed_percent.size(); ++i) {
        const double expected = kBenfordExpectedPercent[i];
        const double diff = observed_percent[i] - expected;
        chi_square += diff * diff / expected;
    }
    return chi_square;
}

double CalculatePValue(double chi_square) {
    if (chi_square < kChiSquareTableDf8.front().chi_square) {
        return 1.0;
    }

    for (std::size_t i = 0; i + 1 < kChiSquareTableDf8.size(); ++i) {
        const auto& lo = kChiSquareTableDf8[i];
        const auto& hi = kChiSquareTableDf8[i + 1];
        if (chi_square >= lo.chi_square && chi_square < hi.chi_square) {
            return lo.p_value +
                   (chi_square - lo.chi_square) / (hi.chi_square - lo.chi_square) *
                       (hi.p_value - lo.p_value);
        }
    }
    return kPValueFloor;
}

gl::Severity DetermineBenfordSeverity(double p_value, double max_deviation) {
    if (p_value < 0.001 && max_deviation > 10.0) return gl::CRITICAL;
    if (p_value < 0.01 && max_deviation > 7.0) return gl::HIGH;
    if (p_value < 0.05 && max_deviation > 5.0) return gl::MEDIUM;
    return gl::LOW;
}

gl::BenfordResult AnalyzeBenford(
    const LineItemRefs& items,
    const std::string& gl_account,
    double significance_level) {
    const auto counts = CalculateFirstDigitCounts(items);
    int total = 0;
    for (int count : counts) total += count;

    std::array<double, 9> actual{};
    for (std::size_t i = 0; i < counts.size(); ++i) {
        actual[i] = total > 0 ? static_cast<double>(counts[i]) / total * 100.0 : 0.0;
    }

    gl::BenfordResult result;
    result.set_gl_account(gl_account);
    result.set_total_transactions(total);
    double max_deviation = 0.0;
    for (std::size_t i = 0; i < counts.size(); ++i) {
        result.add_first_digit_counts(counts[i]);
        result.add_expected_distribution(kBenfordExpectedPercent[i]);
        result.add_actual_distribution(actual[i]);
        max_deviation = std::max(max_deviation, std::abs(actual[i] - kBenfordExpectedPercent[i]));
    }

    const double chi_square = CalculateChiSquare(actual);
    const double p_value = CalculatePValue(chi_square);
    const bool is_anomalous = p_value < significance_level;

    result.set_chi_square_statistic(chi_square);
    result.set_p_value(p_value);
    result.set_is_anomalous(is_anomalous);
    result.set_severity(is_anomalous ? DetermineBenfordSeverity(p_value, max_deviation) : gl::LOW);
    return result;
}

std::vector<gl::BenfordResult> AnalyzeBenfordBatch(
    const AccountIndex& index,
    int min_transactions,
    double significance_level) {
    std::vector<gl::BenfordResult> results;
    for (const auto& group : index.Groups()) {
        if (static_cast<int>(group.items.size()) < min_transactions) {
            LOG_DEBUG() << "Benford analysis skipped for account " << group.gl_account
                        << ": " << group.items.size() << " < " << min_transactions << " transactions";
            continue;
        }
        results.push_back(AnalyzeBenford(group.items, group.gl_account, significance_level));
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const gl::BenfordResult& lhs, const gl::BenfordResult& rhs) {
                         if (lhs.severity() != rhs.severity()) {
                             return SeverityRank(lhs.severity()) > SeverityRank(rhs.severity());
                         }
                         return lhs.p_value() < rhs.p_value();
                     });
    return results;
}

DigitDeviationInfo LargestDigitDeviation(const gl::BenfordResult& result) {
    DigitDeviationInfo largest;
    for (int i = 0; i < result.actual_distribution_size(); ++i) {
        const double expected = result.expected_distribution(i);
        const double actual = result.actual_distribution(i);
        const double deviation = std::abs(actual - expected);
        if (i == 0 || deviation > largest.deviation) {
            largest = DigitDeviationInfo{i + 1, expected, actual, deviation};
        }
    }
    return largest;
}

}  // namespace gl_anomaly
