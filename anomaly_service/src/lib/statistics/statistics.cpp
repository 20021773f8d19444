#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace gl_anomaly::statistics {

namespace {

double SortedMedian(std::vector<double>::const_iterator begin,
                    std::vector<double>::const_iterator end) {
    const auto size = static_cast<std::size_t>(std::distance(begin, end));
    if (size == 0) return 0.0;

    const std::size_t mid = size / 2;
    if (size % 2 == 0) {
        return (*(begin + mid - 1) + *(begin + mid)) / 2.0;
    }
    return *(begin + mid);
}

}  // anonymous namespace

double Mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double StandardDeviation(const std::vector<double>& values) {
    return StandardDeviation(values, Mean(values));
}

double StandardDeviation(const std::vector<double>& values, double mean) {
    if (values.empty()) return 0.0;

    double squared = 0.0;
    for (double value : values) {
        squared += (value - mean) * (value - mean);
    }
    return std::sqrt(squared / static_cast<double>(values.size()));
}

double Median(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    return SortedMedian(values.cbegin(), values.cend());
}

Quartiles CalculateQuartiles(std::vector<double> values) {
    if (values.empty()) return {};

    std::sort(values.begin(), values.end());
    const std::size_t mid = values.size() / 2;
    const auto upper_begin = values.cbegin() + static_cast<std::ptrdiff_t>(
        values.size() % 2 == 0 ? mid : mid + 1);

    Quartiles out;
    out.q2 = SortedMedian(values.cbegin(), values.cend());
    out.q1 = SortedMedian(values.cbegin(), values.cbegin() + static_cast<std::ptrdiff_t>(mid));
    out.q3 = SortedMedian(upper_begin, values.cend());
    out.iqr = out.q3 - out.q1;
    return out;
}

double CalculateMad(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    const double median = Median(values);
    std::vector<double> deviations;
    deviations.reserve(values.size());
    for (double value : values) {
        deviations.push_back(std::abs(value - median));
    }
    return Median(std::move(deviations));
}

}  // namespace gl_anomaly::statistics
