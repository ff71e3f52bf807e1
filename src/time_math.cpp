#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include "time_math.hpp"

namespace chr = std::chrono;

// Parse exactly `width` digits at `pos`.
static bool digits(std::string_view s, size_t pos, size_t width,
                   int& result)
{
    if(pos + width > s.size())
    {
        return false;
    }
    for(size_t i = pos; i < pos + width; i++)
    {
        if(s[i] < '0' || s[i] > '9')
        {
            return false;
        }
    }
    auto status = std::from_chars(s.data() + pos, s.data() + pos + width,
                                  result);
    return status.ec == std::errc();
}

static bool expect(std::string_view s, size_t pos, char c)
{
    return pos < s.size() && s[pos] == c;
}

std::string formatIso8601(TimePoint tp)
{
    auto ms = chr::floor<chr::milliseconds>(tp);
    auto day = chr::floor<chr::days>(ms);
    chr::year_month_day ymd{day};
    chr::hh_mm_ss<chr::milliseconds> hms{ms - day};
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(),
                       hms.seconds().count(), hms.subseconds().count());
}

std::optional<TimePoint> parseIso8601(std::string_view s)
{
    int year, month, day, hour, minute, second;
    if(!digits(s, 0, 4, year) || !expect(s, 4, '-') ||
       !digits(s, 5, 2, month) || !expect(s, 7, '-') ||
       !digits(s, 8, 2, day) ||
       !(expect(s, 10, 'T') || expect(s, 10, 't') || expect(s, 10, ' ')) ||
       !digits(s, 11, 2, hour) || !expect(s, 13, ':') ||
       !digits(s, 14, 2, minute) || !expect(s, 16, ':') ||
       !digits(s, 17, 2, second))
    {
        return std::nullopt;
    }

    chr::year_month_day ymd{chr::year{year}, chr::month(month),
                            chr::day(day)};
    if(!ymd.ok() || hour > 23 || minute > 59 || second > 60)
    {
        return std::nullopt;
    }

    size_t pos = 19;
    chr::nanoseconds frac{0};
    if(expect(s, pos, '.') || expect(s, pos, ','))
    {
        pos++;
        int64_t scale = 100000000;
        size_t start = pos;
        while(pos < s.size() && s[pos] >= '0' && s[pos] <= '9')
        {
            frac += chr::nanoseconds((s[pos] - '0') * scale);
            scale /= 10;
            pos++;
        }
        if(pos == start)
        {
            return std::nullopt;
        }
    }

    chr::minutes offset{0};
    if(pos == s.size() || expect(s, pos, 'Z') || expect(s, pos, 'z'))
    {
        if(pos < s.size())
        {
            pos++;
        }
    }
    else if(expect(s, pos, '+') || expect(s, pos, '-'))
    {
        int sign = s[pos] == '-' ? -1 : 1;
        int off_h, off_m;
        if(!digits(s, pos + 1, 2, off_h))
        {
            return std::nullopt;
        }
        pos += 3;
        if(expect(s, pos, ':'))
        {
            pos++;
        }
        if(!digits(s, pos, 2, off_m))
        {
            return std::nullopt;
        }
        pos += 2;
        offset = chr::minutes(sign * (off_h * 60 + off_m));
    }
    if(pos != s.size())
    {
        return std::nullopt;
    }

    TimePoint tp = chr::sys_days{ymd} + chr::hours(hour)
        + chr::minutes(minute) + chr::seconds(second)
        + chr::duration_cast<Clock::duration>(frac);
    return tp - offset;
}

std::string formatDuration(chr::seconds d)
{
    int64_t total_min = d.count() / 60;
    int64_t days = total_min / 1440;
    int64_t hours = (total_min % 1440) / 60;
    int64_t mins = total_min % 60;
    if(days > 0)
    {
        return std::format("{}d{}h", days, hours);
    }
    else if(hours > 0)
    {
        return std::format("{}h{}m", hours, mins);
    }
    else
    {
        return std::format("{}m", mins);
    }
}

std::string timeUntil(std::string_view timestamp, TimePoint now)
{
    if(timestamp.empty())
    {
        return {};
    }
    auto target = parseIso8601(timestamp);
    if(!target.has_value())
    {
        return {};
    }
    auto delta = chr::duration_cast<chr::seconds>(*target - now);
    if(delta.count() <= 0)
    {
        return "0 min";
    }
    return formatDuration(delta);
}

std::string timeSince(std::string_view timestamp, TimePoint now)
{
    auto then = parseIso8601(timestamp);
    if(!then.has_value())
    {
        return {};
    }
    auto delta = chr::duration_cast<chr::seconds>(now - *then);
    if(delta.count() < 0)
    {
        delta = chr::seconds(0);
    }
    return formatDuration(delta) + " ago";
}
