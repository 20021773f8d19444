#pragma once

#include <optional>
#include <vector>

#include <gl/anomaly.pb.h>
#include <gl/line_item.pb.h>

#include "account_index/account_index.hpp"

namespace gl_anomaly {

struct OutlierObservation {
    const gl::LineItem* line_item = nullptr;
    gl::OutlierMethod method = gl::IQR;
    double score = 0.0;
    double threshold = 0.0;
    double deviation = 0.0;
    // Z-Score only
    std::optional<double> population_mean;
    std::optional<double> population_std;
};

struct OutlierThresholds {
    double z_score_threshold = 3.0;
    double iqr_multiplier = 1.5;
    double mad_threshold = 3.5;
};

// Each detector works on |amount| and returns observations sorted by score descending.
std::vector<OutlierObservation> DetectOutliersZScore(const LineItemRefs& items, double threshold);
std::vector<OutlierObservation> DetectOutliersIqr(const LineItemRefs& items, double multiplier);
std::vector<OutlierObservation> DetectOutliersMad(const LineItemRefs& items, double threshold);

std::vector<OutlierObservation> DetectOutliers(
    const LineItemRefs& items,
    gl::OutlierMethod method,
    const OutlierThresholds& thresholds);

}  // namespace gl_anomaly
