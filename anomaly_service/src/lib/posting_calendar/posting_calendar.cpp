#include "posting_calendar.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <stdexcept>

#include <userver/utils/datetime.hpp>

#include "errors/errors.hpp"

namespace gl_anomaly {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;
constexpr const char* kWallClockFormat = "%Y-%m-%d %H:%M:%S";

constexpr std::array<const char*, 7> kWeekdayNames = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

std::string NormalizeTime(const std::string& posting_time) {
    // HH:MM is accepted as well as HH:MM:SS
    if (posting_time.size() == 5) {
        return posting_time + ":00";
    }
    return posting_time;
}

int WeekdayFromEpochSeconds(std::int64_t seconds) {
    std::int64_t days = seconds / kSecondsPerDay;
    if (seconds % kSecondsPerDay < 0) --days;
    // 1970-01-01 was a Thursday
    return static_cast<int>(((days + 4) % 7 + 7) % 7);
}

}  // anonymous namespace

PostingCalendar::PostingCalendar(std::string timezone) : timezone_(std::move(timezone)) {
    if (timezone_.empty()) {
        throw ConfigError("Posting time zone is required");
    }
    try {
        userver::utils::datetime::Stringtime("2000-01-01 00:00:00", timezone_, kWallClockFormat);
    } catch (const userver::utils::datetime::TimezoneLookupError& e) {
        throw ConfigError("Unknown posting time zone '" + timezone_ + "': " + e.what());
    }
}

PostingMoment PostingCalendar::Resolve(const gl::LineItem& item) const {
    const bool has_time = item.has_posting_time() && !item.posting_time().empty();
    const std::string wall_clock =
        item.posting_date() + " " + (has_time ? NormalizeTime(item.posting_time()) : "00:00:00");

    PostingMoment moment;
    try {
        const auto as_utc = userver::utils::datetime::Stringtime(wall_clock, "UTC", kWallClockFormat);
        moment.instant = userver::utils::datetime::Stringtime(wall_clock, timezone_, kWallClockFormat);

        const auto seconds =
            std::chrono::duration_cast<std::chrono::seconds>(as_utc.time_since_epoch()).count();
        moment.weekday = WeekdayFromEpochSeconds(seconds);
        if (has_time) {
            std::int64_t second_of_day = seconds % kSecondsPerDay;
            if (second_of_day < 0) second_of_day += kSecondsPerDay;
            moment.hour = static_cast<int>(second_of_day / 3600);
        }
    } catch (const userver::utils::datetime::DateParseError& e) {
        throw MalformedLineItemError(
            item.document_number(), "unparsable posting date/time '" + wall_clock + "': " + e.what());
    }
    return moment;
}

PostingMoments PostingCalendar::ResolveAll(const std::vector<const gl::LineItem*>& items) const {
    PostingMoments moments;
    moments.reserve(items.size());
    for (const auto* item : items) {
        moments.emplace(item, Resolve(*item));
    }
    return moments;
}

double PostingCalendar::HoursBetween(const PostingMoment& lhs, const PostingMoment& rhs) {
    const auto diff = std::chrono::duration_cast<std::chrono::seconds>(lhs.instant - rhs.instant);
    return std::abs(static_cast<double>(diff.count())) / 3600.0;
}

const char* PostingCalendar::WeekdayName(int weekday) {
    return kWeekdayNames.at(static_cast<std::size_t>(weekday));
}

}  // namespace gl_anomaly
