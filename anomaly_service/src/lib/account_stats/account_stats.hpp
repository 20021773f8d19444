#pragma once

#include <string>

#include <gl/detection_result.pb.h>

#include "account_index/account_index.hpp"
#include "posting_calendar/posting_calendar.hpp"

namespace gl_anomaly {

inline constexpr std::size_t kTopEntriesLimit = 10;

// Baseline statistics of one account, computed whether or not anomalies were found.
gl::AccountStats CalculateAccountStats(
    const LineItemRefs& items,
    const std::string& gl_account,
    const PostingMoments& moments);

}  // namespace gl_anomaly
