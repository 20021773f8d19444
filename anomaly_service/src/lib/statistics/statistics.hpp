#pragma once

#include <vector>

namespace gl_anomaly::statistics {

// All functions return 0 for an empty input.

double Mean(const std::vector<double>& values);

// Population standard deviation.
double StandardDeviation(const std::vector<double>& values);
double StandardDeviation(const std::vector<double>& values, double mean);

double Median(std::vector<double> values);

struct Quartiles {
    double q1 = 0.0;
    double q2 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
};

// Median of halves; for odd sizes the median element belongs to neither half.
Quartiles CalculateQuartiles(std::vector<double> values);

// Median absolute deviation from the median.
double CalculateMad(const std::vector<double>& values);

}  // namespace gl_anomaly::statistics
