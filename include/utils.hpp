// Utility helpers for timestamps, uptime formatting and input validation.
#pragma once
#include <string>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <cctype>

using Clock = std::chrono::system_clock;
// Microsecond ticks cover years 1 to 9999; nanosecond ticks end in 2262.
using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

// Representable range: 0001-01-01T00:00:00 to 9999-12-31T23:59:59 UTC.
constexpr std::int64_t MIN_UNIX_SECONDS = -62135596800;
constexpr std::int64_t MAX_UNIX_SECONDS = 253402300799;

inline TimePoint current_time()
{
    return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

// Converts whole Unix seconds; std::nullopt outside the representable range.
inline std::optional<TimePoint> from_time_t_checked(std::time_t t)
{
    auto secs = static_cast<std::int64_t>(t);
    if (secs < MIN_UNIX_SECONDS || secs > MAX_UNIX_SECONDS)
        return std::nullopt;
    return TimePoint(std::chrono::seconds(secs));
}

// Returns local time in "YYYY-MM-DD HH:MM:SS" format.
inline std::string current_timestamp() {
    auto now = Clock::now();
    std::time_t t_c = Clock::to_time_t(now);

    std::tm local{};
    localtime_r(&t_c, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

// Formats a time point as naive local ISO-8601 with microseconds,
// e.g. "2024-05-01T13:45:10.250000".
inline std::string format_iso_local(TimePoint tp)
{
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    if (secs > tp)
        secs -= std::chrono::seconds(1);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();

    auto t_c = static_cast<std::time_t>(secs.time_since_epoch().count());
    std::tm local{};
    localtime_r(&t_c, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

// Parses a naive local ISO-8601 string ("YYYY-MM-DDTHH:MM:SS[.ffffff]", a
// space is accepted in place of 'T'). A trailing 'Z' or +HH:MM offset is
// dropped and the wall-clock digits are kept as local time.
inline std::optional<TimePoint> parse_iso_local(const std::string &text)
{
    std::string s = text;
    if (s.size() > 10 && s[10] == ' ')
        s[10] = 'T';

    std::tm tm{};
    std::istringstream in(s);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail())
    {
        // Date-only values are midnight local time.
        std::istringstream date_only(s);
        tm = std::tm{};
        date_only >> std::get_time(&tm, "%Y-%m-%d");
        if (date_only.fail() || s.size() != 10)
            return std::nullopt;
        tm.tm_isdst = -1;
        std::time_t t = std::mktime(&tm);
        if (t == static_cast<std::time_t>(-1))
            return std::nullopt;
        return from_time_t_checked(t);
    }

    std::int64_t micros = 0;
    if (in.peek() == '.')
    {
        in.get();
        int digits = 0;
        while (std::isdigit(in.peek()))
        {
            char c = static_cast<char>(in.get());
            if (digits < 6)
            {
                micros = micros * 10 + (c - '0');
                ++digits;
            }
        }
        if (digits == 0)
            return std::nullopt;
        while (digits++ < 6)
            micros *= 10;
    }

    std::string rest;
    std::getline(in, rest);
    if (!rest.empty() && rest != "Z" && !((rest[0] == '+' || rest[0] == '-') && rest.size() >= 3))
        return std::nullopt;

    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1))
        return std::nullopt;
    auto base = from_time_t_checked(t);
    if (!base)
        return std::nullopt;
    return *base + std::chrono::microseconds(micros);
}

// Converts Unix seconds (fractional allowed) into a time point. Non-finite
// values and values outside the representable range yield std::nullopt.
inline std::optional<TimePoint> from_unix_seconds(double seconds)
{
    if (!std::isfinite(seconds) || seconds < static_cast<double>(MIN_UNIX_SECONDS) ||
        seconds >= static_cast<double>(MAX_UNIX_SECONDS + 1))
        return std::nullopt;
    auto micros = static_cast<std::int64_t>(std::llround(seconds * 1'000'000.0));
    return TimePoint(std::chrono::microseconds(micros));
}

// Formats uptime as "Nd Nh Nm Ns", dropping leading zero units.
inline std::string format_uptime(double uptime_seconds)
{
    if (uptime_seconds < 0)
        uptime_seconds = 0;
    auto total = static_cast<std::int64_t>(uptime_seconds);
    std::int64_t days = total / 86400;
    std::int64_t hours = (total % 86400) / 3600;
    std::int64_t minutes = (total % 3600) / 60;
    std::int64_t seconds = total % 60;

    std::ostringstream ss;
    if (days > 0)
        ss << days << "d " << hours << "h " << minutes << "m " << seconds << "s";
    else if (hours > 0)
        ss << hours << "h " << minutes << "m " << seconds << "s";
    else if (minutes > 0)
        ss << minutes << "m " << seconds << "s";
    else
        ss << seconds << "s";
    return ss.str();
}

inline bool isValidQuantity(std::int64_t quantity)
{
    return quantity >= 1;
}

inline bool isValidPage(const std::string &page, std::size_t maxLen = 2048)
{
    if (page.empty() || page.size() > maxLen)
        return false;
    for (unsigned char ch : page)
    {
        if (std::iscntrl(ch) || std::isspace(ch))
            return false;
    }
    return true;
}
