#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <gl/anomaly.pb.h>
#include <gl/line_item.pb.h>

#include "account_index/account_index.hpp"
#include "posting_calendar/posting_calendar.hpp"

namespace gl_anomaly {

// After-hours or weekend postings of one user on one account.
struct PostingPatternMatch {
    gl::AnomalyType type = gl::AFTER_HOURS_POSTING;
    std::string gl_account;
    std::string user_id;
    LineItemRefs items;
    double total_amount = 0.0;
    gl::Severity severity = gl::LOW;
};

struct ReversalMatch {
    const gl::LineItem* original = nullptr;
    const gl::LineItem* reversal = nullptr;
    double hours_between = 0.0;
    double window_hours = 0.0;
    gl::Severity severity = gl::MEDIUM;
};

struct RoundNumberMatch {
    std::string gl_account;
    LineItemRefs items;
    int total_transactions = 0;
    double percentage = 0.0;
    double total_amount = 0.0;
    std::vector<double> thresholds;
    gl::Severity severity = gl::LOW;
};

struct DuplicateMatch {
    LineItemRefs items;
    double total_amount = 0.0;
    gl::Severity severity = gl::MEDIUM;
};

using BehavioralMatch = std::variant<PostingPatternMatch, ReversalMatch, RoundNumberMatch, DuplicateMatch>;

// Window [start, end) wraps past midnight when start > end. No hour -> false.
bool IsAfterHours(std::optional<int> hour, int after_hours_start, int after_hours_end);

bool IsWeekend(int weekday);

// Rule-based checks over already resolved posting moments. Every item passed
// in must have an entry in the moments map.
class BehavioralDetector {
public:
    explicit BehavioralDetector(const PostingMoments& moments);

    std::vector<PostingPatternMatch> DetectAfterHoursPostings(
        const LineItemRefs& items, int after_hours_start, int after_hours_end) const;

    std::vector<PostingPatternMatch> DetectWeekendPostings(const LineItemRefs& items) const;

    std::vector<ReversalMatch> DetectSameDayReversals(
        const LineItemRefs& items, double window_hours) const;

    std::vector<DuplicateMatch> DetectDuplicateEntries(
        const LineItemRefs& items,
        double time_window_hours,
        double amount_tolerance,
        bool require_matching_description) const;

private:
    const PostingMoment& MomentOf(const gl::LineItem* item) const;

    std::vector<PostingPatternMatch> GroupByUser(
        gl::AnomalyType type, const LineItemRefs& flagged) const;

    const PostingMoments& moments_;
};

// Amounts exactly equal to one of the thresholds; nullopt below min_occurrences.
std::optional<RoundNumberMatch> DetectRoundNumberPattern(
    const LineItemRefs& items,
    const std::vector<double>& thresholds,
    int min_occurrences);

}  // namespace gl_anomaly
