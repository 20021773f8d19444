#include "account_stats.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include "statistics/statistics.hpp"

namespace gl_anomaly {

namespace {

struct CountedKey {
    std::string key;
    std::string label;
    int count = 0;
};

// Counts in first-appearance order, then keeps the `limit` most frequent.
class TopCounter {
public:
    void Add(const std::string& key, const std::string& label) {
        auto [it, inserted] = positions_.try_emplace(key, entries_.size());
        if (inserted) {
            entries_.push_back(CountedKey{key, label, 0});
        }
        ++entries_[it->second].count;
    }

    std::vector<CountedKey> Top(std::size_t limit) && {
        std::stable_sort(entries_.begin(), entries_.end(),
                         [](const CountedKey& lhs, const CountedKey& rhs) {
                             return lhs.count > rhs.count;
                         });
        if (entries_.size() > limit) {
            entries_.resize(limit);
        }
        return std::move(entries_);
    }

private:
    std::vector<CountedKey> entries_;
    std::unordered_map<std::string, std::size_t> positions_;
};

}  // anonymous namespace

gl::AccountStats CalculateAccountStats(
    const LineItemRefs& items,
    const std::string& gl_account,
    const PostingMoments& moments) {
    gl::AccountStats stats;
    stats.set_gl_account(gl_account);
    if (items.empty()) {
        return stats;
    }

    std::vector<double> amounts;
    amounts.reserve(items.size());
    double total_debit = 0.0;
    double total_credit = 0.0;
    TopCounter users;
    TopCounter document_types;
    auto& by_day = *stats.mutable_postings_by_day();
    auto& by_hour = *stats.mutable_postings_by_hour();

    for (const auto* item : items) {
        amounts.push_back(std::abs(item->amount()));
        if (item->debit_credit() == gl::LineItem::DEBIT) {
            total_debit += item->amount();
        } else {
            total_credit += item->amount();
        }

        users.Add(item->user_id(), item->user_name());
        document_types.Add(item->document_type(), item->document_type());

        auto moment = moments.find(item);
        if (moment != moments.end()) {
            ++by_day[std::string(PostingCalendar::WeekdayName(moment->second.weekday))];
            if (moment->second.hour) {
                ++by_hour[fmt::format("{}:00", *moment->second.hour)];
            }
        }
    }

    const double mean = statistics::Mean(amounts);
    const auto quartiles = statistics::CalculateQuartiles(amounts);
    const auto [min_it, max_it] = std::minmax_element(amounts.begin(), amounts.end());

    stats.set_gl_account_name(items.front()->gl_account_name());
    stats.set_total_transactions(static_cast<int>(items.size()));
    stats.set_total_debit(total_debit);
    stats.set_total_credit(total_credit);
    stats.set_net_balance(total_debit - total_credit);
    stats.set_currency(items.front()->currency());
    stats.set_average_amount(mean);
    stats.set_median_amount(statistics::Median(amounts));
    stats.set_std_deviation(statistics::StandardDeviation(amounts, mean));
    stats.set_min_amount(*min_it);
    stats.set_max_amount(*max_it);
    stats.set_first_quartile(quartiles.q1);
    stats.set_third_quartile(quartiles.q3);
    stats.set_iqr(quartiles.iqr);

    for (auto& user : std::move(users).Top(kTopEntriesLimit)) {
        auto* activity = stats.add_top_users();
        activity->set_user_id(std::move(user.key));
        activity->set_user_name(std::move(user.label));
        activity->set_transaction_count(user.count);
    }
    for (auto& type : std::move(document_types).Top(kTopEntriesLimit)) {
        auto* entry = stats.add_top_document_types();
        entry->set_document_type(std::move(type.key));
        entry->set_count(type.count);
    }
    return stats;
}

}  // namespace gl_anomaly
