// src/core/Time.cpp
#include "eldritch/core/Time.h"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace eldritch {

namespace {

std::time_t UtcTmToTime(std::tm& tm)
{
#if defined(_WIN32)
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

} // namespace

Clock SystemClockSource()
{
    return [] { return SystemClock::now(); };
}

std::string FormatIso8601(TimePoint t)
{
    using namespace std::chrono;

    const auto secs = time_point_cast<seconds>(t);
    auto micros = duration_cast<microseconds>(t - secs).count();
    std::time_t tt = SystemClock::to_time_t(secs);
    if (micros < 0)
    {
        // Pre-epoch values round toward negative infinity.
        micros += 1000000;
        tt -= 1;
    }

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return oss.str();
}

std::optional<TimePoint> ParseIso8601(std::string_view text)
{
    const std::string s(text);
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6)
        return std::nullopt;

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
        return std::nullopt;

    long long micros = 0;
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < s.size() && s[pos] == '.')
    {
        ++pos;
        int digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9')
        {
            if (digits < 6)
            {
                micros = micros * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0)
            return std::nullopt;
        for (; digits < 6; ++digits)
            micros *= 10;
    }
    if (pos < s.size() && s[pos] == 'Z')
        ++pos;
    if (pos != s.size())
        return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon  = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min  = minute;
    tm.tm_sec  = second;

    const std::time_t tt = UtcTmToTime(tm);
    return SystemClock::from_time_t(tt)
         + std::chrono::duration_cast<SystemClock::duration>(std::chrono::microseconds(micros));
}

std::string FormatDurationHMS(Seconds d)
{
    long long total = d.count();
    if (total < 0)
        total = 0;
    const long long h = total / 3600;
    const long long m = (total % 3600) / 60;
    const long long sec = total % 60;

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld", h, m, sec);
    return buf;
}

} // namespace eldritch
