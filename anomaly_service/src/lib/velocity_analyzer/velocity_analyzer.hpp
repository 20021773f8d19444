#pragma once

#include <string>
#include <vector>

#include <gl/detection_result.pb.h>

#include "account_index/account_index.hpp"

namespace gl_anomaly {

struct VelocityMatch {
    gl::VelocityObservation observation;
    // Line items of the flagged period.
    LineItemRefs items;
};

// Period key is "<fiscal_year>-<fiscal_period>".
std::string PeriodKey(const gl::LineItem& item);

// Periods are ordered by fiscal year, then numerically by fiscal period.
// Compares every period of one account against the trailing average of up to
// lookback_periods preceding periods and returns the periods whose count or
// amount deviation exceeds deviation_threshold percent.
std::vector<VelocityMatch> AnalyzeVelocity(
    const LineItemRefs& items,
    const std::string& gl_account,
    double deviation_threshold,
    int lookback_periods);

}  // namespace gl_anomaly
