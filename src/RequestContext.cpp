#include "RequestContext.hpp"

#include <array>
#include <optional>
#include <stdexcept>

namespace
{
    // Checked in order; x-forwarded-for may hold a comma-separated chain.
    constexpr std::array<const char *, 7> IP_HEADERS = {
        "x-forwarded-for",
        "x-real-ip",
        "cf-connecting-ip",
        "x-client-ip",
        "x-forwarded",
        "forwarded-for",
        "forwarded"};

    constexpr std::array<const char *, 4> CLIENT_TIME_HEADERS = {
        "x-timestamp",
        "x-client-time",
        "x-request-time",
        "timestamp"};

    constexpr std::array<const char *, 4> PROXY_TIME_HEADERS = {
        "x-request-start",
        "x-queue-start",
        "x-request-received",
        "x-forwarded-start"};

    constexpr std::array<const char *, 5> PRIVATE_PREFIXES = {
        "127.", "10.", "192.168.", "172.", "169.254."};

    std::string trim(const std::string &s)
    {
        auto begin = s.find_first_not_of(" \t");
        if (begin == std::string::npos)
            return "";
        auto end = s.find_last_not_of(" \t");
        return s.substr(begin, end - begin + 1);
    }

    std::string header_value(const nlohmann::json &headers, const char *name)
    {
        if (!headers.is_object())
            return "";
        auto it = headers.find(name);
        if (it == headers.end() || !it->is_string())
            return "";
        return it->get<std::string>();
    }

    std::optional<double> parse_number(const std::string &value)
    {
        try
        {
            std::size_t used = 0;
            double v = std::stod(value, &used);
            if (used != value.size())
                return std::nullopt;
            return v;
        }
        catch (const std::invalid_argument &)
        {
            return std::nullopt;
        }
        catch (const std::out_of_range &)
        {
            return std::nullopt;
        }
    }

    std::optional<TimePoint> parse_client_time(const std::string &value)
    {
        if (value.find('T') != std::string::npos || value.find('-') != std::string::npos)
            return parse_iso_local(value);

        auto ts = parse_number(value);
        if (!ts)
            return std::nullopt;
        double seconds = *ts;
        if (seconds > 1e10) // Milliseconds.
            seconds /= 1000.0;
        return from_unix_seconds(seconds);
    }

    std::optional<TimePoint> parse_proxy_time(const std::string &value)
    {
        auto ts = parse_number(value);
        if (!ts)
            return std::nullopt;
        double seconds = *ts;
        if (seconds > 1e12) // Microseconds.
            seconds /= 1'000'000.0;
        else if (seconds > 1e10) // Milliseconds.
            seconds /= 1000.0;
        return from_unix_seconds(seconds);
    }
}

bool is_private_ip(const std::string &ip)
{
    for (const char *prefix : PRIVATE_PREFIXES)
    {
        if (ip.rfind(prefix, 0) == 0)
            return true;
    }
    return ip == "localhost" || ip == "::1" || ip == "0.0.0.0";
}

std::string extract_client_ip(const nlohmann::json &headers, const std::string &peer_address)
{
    for (const char *name : IP_HEADERS)
    {
        std::string value = header_value(headers, name);
        if (value.empty())
            continue;

        std::size_t start = 0;
        while (start <= value.size())
        {
            std::size_t comma = value.find(',', start);
            std::string ip = trim(value.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
            if (!ip.empty() && !is_private_ip(ip))
                return ip;
            if (comma == std::string::npos)
                break;
            start = comma + 1;
        }
    }

    if (!peer_address.empty())
        return peer_address;
    return "unknown";
}

TimePoint resolve_generation_time(const nlohmann::json &headers, TimePoint received)
{
    for (const char *name : CLIENT_TIME_HEADERS)
    {
        std::string value = header_value(headers, name);
        if (value.empty())
            continue;
        if (auto tp = parse_client_time(value))
            return *tp;
    }

    for (const char *name : PROXY_TIME_HEADERS)
    {
        std::string value = header_value(headers, name);
        if (value.empty())
            continue;
        if (auto tp = parse_proxy_time(value))
            return *tp;
    }

    return received;
}

std::string peer_host(const std::string &peer)
{
    auto colon = peer.rfind(':');
    if (colon == std::string::npos)
        return peer;
    return peer.substr(0, colon);
}
