#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <gl/line_item.pb.h>

namespace gl_anomaly {

struct PostingMoment {
    // Absolute instant of the posting; midnight when the posting time is missing.
    std::chrono::system_clock::time_point instant;
    // 0 = Sunday .. 6 = Saturday, from the posting date.
    int weekday = 0;
    // Hour of the wall-clock posting time, if one was recorded.
    std::optional<int> hour;
};

using PostingMoments = std::unordered_map<const gl::LineItem*, PostingMoment>;

// Interprets posting date/time of line items as wall-clock values in a named
// time zone (IANA name, e.g. "Europe/Berlin" or "UTC").
class PostingCalendar {
public:
    // Throws ConfigError for an empty or unknown time zone.
    explicit PostingCalendar(std::string timezone);

    // Throws MalformedLineItemError when the date or time cannot be parsed.
    PostingMoment Resolve(const gl::LineItem& item) const;

    PostingMoments ResolveAll(const std::vector<const gl::LineItem*>& items) const;

    const std::string& Timezone() const { return timezone_; }

    static double HoursBetween(const PostingMoment& lhs, const PostingMoment& rhs);

    static const char* WeekdayName(int weekday);

private:
    std::string timezone_;
};

}  // namespace gl_anomaly
