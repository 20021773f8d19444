#include "behavioral_detector.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace gl_anomaly {

namespace {

double TotalAbsAmount(const LineItemRefs& items) {
    double total = 0.0;
    for (const auto* item : items) {
        total += std::abs(item->amount());
    }
    return total;
}

gl::Severity AfterHoursSeverity(std::size_t count, double total_amount) {
    if (count > 20 || total_amount > 100000) return gl::CRITICAL;
    if (count > 10 || total_amount > 50000) return gl::HIGH;
    if (count > 5 || total_amount > 10000) return gl::MEDIUM;
    return gl::LOW;
}

gl::Severity WeekendSeverity(std::size_t count, double total_amount) {
    if (count > 15 || total_amount > 100000) return gl::HIGH;
    if (count > 8 || total_amount > 50000) return gl::MEDIUM;
    return gl::LOW;
}

gl::Severity RoundNumberSeverity(std::size_t count, double percentage) {
    if (percentage > 30 && count > 20) return gl::CRITICAL;
    if (percentage > 20 || count > 15) return gl::HIGH;
    if (percentage > 10 || count > 10) return gl::MEDIUM;
    return gl::LOW;
}

gl::Severity DuplicateSeverity(std::size_t count, double total_amount) {
    if (count > 3 || total_amount > 100000) return gl::CRITICAL;
    if (count > 2 || total_amount > 50000) return gl::HIGH;
    return gl::MEDIUM;
}

}  // anonymous namespace

bool IsAfterHours(std::optional<int> hour, int after_hours_start, int after_hours_end) {
    if (!hour) return false;

    if (after_hours_start > after_hours_end) {
        return *hour >= after_hours_start || *hour < after_hours_end;
    }
    return *hour >= after_hours_start && *hour < after_hours_end;
}

bool IsWeekend(int weekday) {
    return weekday == 0 || weekday == 6;
}

BehavioralDetector::BehavioralDetector(const PostingMoments& moments) : moments_(moments) {}

const PostingMoment& BehavioralDetector::MomentOf(const gl::LineItem* item) const {
    auto it = moments_.find(item);
    if (it == moments_.end()) {
        throw std::logic_error("No posting moment resolved for document " + item->document_number());
    }
    return it->second;
}

std::vector<PostingPatternMatch> BehavioralDetector::GroupByUser(
    gl::AnomalyType type, const LineItemRefs& flagged) const {
    std::vector<PostingPatternMatch> out;
    std::unordered_map<std::string, std::size_t> positions;

    for (const auto* item : flagged) {
        const std::string key = item->gl_account() + '\x1f' + item->user_id();
        auto [it, inserted] = positions.try_emplace(key, out.size());
        if (inserted) {
            PostingPatternMatch match;
            match.type = type;
            match.gl_account = item->gl_account();
            match.user_id = item->user_id();
            out.push_back(std::move(match));
        }
        out[it->second].items.push_back(item);
    }

    for (auto& match : out) {
        match.total_amount = TotalAbsAmount(match.items);
        match.severity = type == gl::AFTER_HOURS_POSTING
            ? AfterHoursSeverity(match.items.size(), match.total_amount)
            : WeekendSeverity(match.items.size(), match.total_amount);
    }
    return out;
}

std::vector<PostingPatternMatch> BehavioralDetector::DetectAfterHoursPostings(
    const LineItemRefs& items, int after_hours_start, int after_hours_end) const {
    LineItemRefs flagged;
    for (const auto* item : items) {
        if (IsAfterHours(MomentOf(item).hour, after_hours_start, after_hours_end)) {
            flagged.push_back(item);
        }
    }
    return GroupByUser(gl::AFTER_HOURS_POSTING, flagged);
}

std::vector<PostingPatternMatch> BehavioralDetector::DetectWeekendPostings(const LineItemRefs& items) const {
    LineItemRefs flagged;
    for (const auto* item : items) {
        if (IsWeekend(MomentOf(item).weekday)) {
            flagged.push_back(item);
        }
    }
    return GroupByUser(gl::WEEKEND_POSTING, flagged);
}

std::vector<ReversalMatch> BehavioralDetector::DetectSameDayReversals(
    const LineItemRefs& items, double window_hours) const {
    std::unordered_map<std::string, const gl::LineItem*> originals;
    for (const auto* item : items) {
        if (!item->is_reversal()) {
            originals.try_emplace(item->gl_account() + '\x1f' + item->document_number(), item);
        }
    }

    std::vector<ReversalMatch> out;
    for (const auto* reversal : items) {
        if (!reversal->has_reversal_document_number() || reversal->reversal_document_number().empty()) {
            continue;
        }

        auto it = originals.find(reversal->gl_account() + '\x1f' + reversal->reversal_document_number());
        if (it == originals.end() || it->second == reversal) continue;
        const auto* original = it->second;

        const auto& reversal_moment = MomentOf(reversal);
        const auto& original_moment = MomentOf(original);
        // A reversal cannot precede the document it reverses
        if (reversal_moment.instant < original_moment.instant) continue;

        const double hours = PostingCalendar::HoursBetween(reversal_moment, original_moment);
        if (hours > window_hours) continue;

        ReversalMatch match;
        match.original = original;
        match.reversal = reversal;
        match.hours_between = hours;
        match.window_hours = window_hours;
        match.severity = std::abs(original->amount()) > 50000 || hours < 1.0 ? gl::HIGH : gl::MEDIUM;
        out.push_back(match);
    }
    return out;
}

std::vector<DuplicateMatch> BehavioralDetector::DetectDuplicateEntries(
    const LineItemRefs& items,
    double time_window_hours,
    double amount_tolerance,
    bool require_matching_description) const {
    std::vector<DuplicateMatch> out;
    std::vector<bool> processed(items.size(), false);

    for (std::size_t i = 0; i < items.size(); ++i) {
        if (processed[i]) continue;
        const auto* first = items[i];
        const double first_amount = std::abs(first->amount());

        LineItemRefs cluster{first};
        for (std::size_t j = i + 1; j < items.size(); ++j) {
            if (processed[j]) continue;
            const auto* candidate = items[j];

            if (candidate->gl_account() != first->gl_account()) continue;
            if (require_matching_description && candidate->description() != first->description()) continue;

            const double amount_diff = std::abs(first_amount - std::abs(candidate->amount()));
            if (amount_diff > first_amount * amount_tolerance) continue;

            const double hours = PostingCalendar::HoursBetween(MomentOf(first), MomentOf(candidate));
            if (hours > time_window_hours) continue;

            cluster.push_back(candidate);
            processed[j] = true;
        }

        if (cluster.size() < 2) continue;
        processed[i] = true;

        DuplicateMatch match;
        match.total_amount = TotalAbsAmount(cluster);
        match.severity = DuplicateSeverity(cluster.size(), match.total_amount);
        match.items = std::move(cluster);
        out.push_back(std::move(match));
    }
    return out;
}

std::optional<RoundNumberMatch> DetectRoundNumberPattern(
    const LineItemRefs& items,
    const std::vector<double>& thresholds,
    int min_occurrences) {
    if (items.empty()) return std::nullopt;

    LineItemRefs round_items;
    for (const auto* item : items) {
        const double abs_amount = std::abs(item->amount());
        if (std::find(thresholds.begin(), thresholds.end(), abs_amount) != thresholds.end()) {
            round_items.push_back(item);
        }
    }

    if (static_cast<int>(round_items.size()) < min_occurrences) {
        return std::nullopt;
    }

    RoundNumberMatch match;
    match.gl_account = items.front()->gl_account();
    match.total_transactions = static_cast<int>(items.size());
    match.percentage = static_cast<double>(round_items.size()) / items.size() * 100.0;
    match.total_amount = TotalAbsAmount(round_items);
    match.thresholds = thresholds;
    match.severity = RoundNumberSeverity(round_items.size(), match.percentage);
    match.items = std::move(round_items);
    return match;
}

}  // namespace gl_anomaly
