#include "velocity_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <tuple>

namespace gl_anomaly {

namespace {

// Fiscal year, then the numeric fiscal period, so "2" precedes "10" whether
// or not periods are zero-padded. Non-numeric periods sort after numeric ones.
struct PeriodOrder {
    std::string fiscal_year;
    long long period_number = 0;
    std::string fiscal_period;

    bool operator<(const PeriodOrder& other) const {
        return std::tie(fiscal_year, period_number, fiscal_period) <
               std::tie(other.fiscal_year, other.period_number, other.fiscal_period);
    }
};

PeriodOrder OrderOf(const gl::LineItem& item) {
    const auto& period = item.fiscal_period();
    const bool numeric = !period.empty() && period.size() < 18 &&
        std::all_of(period.begin(), period.end(), [](char c) { return c >= '0' && c <= '9'; });
    return PeriodOrder{
        item.fiscal_year(),
        numeric ? std::stoll(period) : std::numeric_limits<long long>::max(),
        period};
}

struct PeriodBucket {
    std::string period;
    LineItemRefs items;
    double total_amount = 0.0;
};

double PercentDeviation(double observed, double average) {
    if (average == 0.0) return 0.0;
    return (observed - average) / average * 100.0;
}

gl::Severity VelocitySeverity(double max_deviation) {
    if (max_deviation > 500) return gl::CRITICAL;
    if (max_deviation > 300) return gl::HIGH;
    if (max_deviation > 200) return gl::MEDIUM;
    return gl::LOW;
}

}  // anonymous namespace

std::string PeriodKey(const gl::LineItem& item) {
    return item.fiscal_year() + "-" + item.fiscal_period();
}

std::vector<VelocityMatch> AnalyzeVelocity(
    const LineItemRefs& items,
    const std::string& gl_account,
    double deviation_threshold,
    int lookback_periods) {
    std::map<PeriodOrder, PeriodBucket> by_period;
    for (const auto* item : items) {
        auto& bucket = by_period[OrderOf(*item)];
        if (bucket.items.empty()) {
            bucket.period = PeriodKey(*item);
        }
        bucket.items.push_back(item);
        bucket.total_amount += std::abs(item->amount());
    }

    std::vector<PeriodBucket> periods;
    periods.reserve(by_period.size());
    for (auto& entry : by_period) {
        periods.push_back(std::move(entry.second));
    }

    std::vector<VelocityMatch> out;
    for (std::size_t i = 1; i < periods.size(); ++i) {
        const std::size_t first = i > static_cast<std::size_t>(lookback_periods)
            ? i - static_cast<std::size_t>(lookback_periods)
            : 0;

        double count_sum = 0.0;
        double amount_sum = 0.0;
        for (std::size_t j = first; j < i; ++j) {
            count_sum += static_cast<double>(periods[j].items.size());
            amount_sum += periods[j].total_amount;
        }
        const double history = static_cast<double>(i - first);
        const double avg_count = count_sum / history;
        const double avg_amount = amount_sum / history;

        const auto& current = periods[i];
        const double count_deviation = PercentDeviation(static_cast<double>(current.items.size()), avg_count);
        const double amount_deviation = PercentDeviation(current.total_amount, avg_amount);
        const double max_deviation = std::max(std::abs(count_deviation), std::abs(amount_deviation));
        if (max_deviation <= deviation_threshold) continue;

        VelocityMatch match;
        auto& observation = match.observation;
        observation.set_gl_account(gl_account);
        observation.set_period(current.period);
        observation.set_transaction_count(static_cast<int>(current.items.size()));
        observation.set_total_amount(current.total_amount);
        observation.set_average_transaction_count(avg_count);
        observation.set_average_amount(avg_amount);
        observation.set_count_deviation(count_deviation);
        observation.set_amount_deviation(amount_deviation);
        observation.set_is_anomalous(true);
        observation.set_severity(VelocitySeverity(max_deviation));
        match.items = current.items;
        out.push_back(std::move(match));
    }
    return out;
}

}  // namespace gl_anomaly
