#include "outlier_detector.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "statistics/statistics.hpp"

namespace gl_anomaly {

namespace {

constexpr double kMadConsistencyFactor = 0.6745;

std::vector<double> AbsoluteAmounts(const LineItemRefs& items) {
    std::vector<double> amounts;
    amounts.reserve(items.size());
    for (const auto* item : items) {
        amounts.push_back(std::abs(item->amount()));
    }
    return amounts;
}

void SortByScore(std::vector<OutlierObservation>& observations) {
    std::stable_sort(observations.begin(), observations.end(),
                     [](const OutlierObservation& lhs, const OutlierObservation& rhs) {
                         return lhs.score > rhs.score;
                     });
}

}  // anonymous namespace

std::vector<OutlierObservation> DetectOutliersZScore(const LineItemRefs& items, double threshold) {
    const auto amounts = AbsoluteAmounts(items);
    const double mean = statistics::Mean(amounts);
    const double stddev = statistics::StandardDeviation(amounts, mean);

    std::vector<OutlierObservation> out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        const double z = stddev == 0.0 ? 0.0 : (amounts[i] - mean) / stddev;
        if (std::abs(z) <= threshold) continue;

        OutlierObservation observation;
        observation.line_item = items[i];
        observation.method = gl::Z_SCORE;
        observation.score = std::abs(z);
        observation.threshold = threshold;
        observation.deviation = std::abs(amounts[i] - mean);
        observation.population_mean = mean;
        observation.population_std = stddev;
        out.push_back(observation);
    }

    SortByScore(out);
    return out;
}

std::vector<OutlierObservation> DetectOutliersIqr(const LineItemRefs& items, double multiplier) {
    const auto amounts = AbsoluteAmounts(items);
    const auto quartiles = statistics::CalculateQuartiles(amounts);
    const double lower_bound = quartiles.q1 - multiplier * quartiles.iqr;
    const double upper_bound = quartiles.q3 + multiplier * quartiles.iqr;

    std::vector<OutlierObservation> out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        const double value = amounts[i];
        if (value >= lower_bound && value <= upper_bound) continue;

        const double deviation = value > upper_bound ? value - upper_bound : lower_bound - value;

        OutlierObservation observation;
        observation.line_item = items[i];
        observation.method = gl::IQR;
        observation.score = quartiles.iqr > 0.0 ? deviation / quartiles.iqr : 0.0;
        observation.threshold = multiplier;
        observation.deviation = deviation;
        out.push_back(observation);
    }

    SortByScore(out);
    return out;
}

std::vector<OutlierObservation> DetectOutliersMad(const LineItemRefs& items, double threshold) {
    const auto amounts = AbsoluteAmounts(items);
    const double mad = statistics::CalculateMad(amounts);
    if (mad == 0.0) {
        return {};
    }
    const double median = statistics::Median(amounts);

    std::vector<OutlierObservation> out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        const double deviation = std::abs(amounts[i] - median);
        const double mad_z = kMadConsistencyFactor * deviation / mad;
        if (mad_z <= threshold) continue;

        OutlierObservation observation;
        observation.line_item = items[i];
        observation.method = gl::MAD;
        observation.score = mad_z;
        observation.threshold = threshold;
        observation.deviation = deviation;
        out.push_back(observation);
    }

    SortByScore(out);
    return out;
}

std::vector<OutlierObservation> DetectOutliers(
    const LineItemRefs& items,
    gl::OutlierMethod method,
    const OutlierThresholds& thresholds) {
    switch (method) {
        case gl::Z_SCORE:
            return DetectOutliersZScore(items, thresholds.z_score_threshold);
        case gl::IQR:
            return DetectOutliersIqr(items, thresholds.iqr_multiplier);
        case gl::MAD:
            return DetectOutliersMad(items, thresholds.mad_threshold);
        default:
            throw std::invalid_argument("Unknown outlier method: " + std::to_string(method));
    }
}

}  // namespace gl_anomaly
