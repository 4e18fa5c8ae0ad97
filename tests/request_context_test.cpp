#include <gtest/gtest.h>
#include <chrono>

#include "RequestContext.hpp"

using json = nlohmann::json;

TEST(RequestContextTest, PrivateRangesDetected)
{
    // Loopback, RFC 1918, link-local and wildcard addresses count as private.
    EXPECT_TRUE(is_private_ip("127.0.0.1"));
    EXPECT_TRUE(is_private_ip("10.1.2.3"));
    EXPECT_TRUE(is_private_ip("192.168.0.10"));
    EXPECT_TRUE(is_private_ip("172.16.5.4"));
    EXPECT_TRUE(is_private_ip("169.254.1.1"));
    EXPECT_TRUE(is_private_ip("localhost"));
    EXPECT_TRUE(is_private_ip("::1"));
    EXPECT_TRUE(is_private_ip("0.0.0.0"));
    EXPECT_FALSE(is_private_ip("203.0.113.7"));
    EXPECT_FALSE(is_private_ip("8.8.8.8"));
}

TEST(RequestContextTest, ForwardedChainYieldsFirstPublicAddress)
{
    // Private hops in x-forwarded-for are skipped in favour of the first public one.
    json headers = {{"x-forwarded-for", "10.0.0.1, 192.168.1.1 ,203.0.113.7, 198.51.100.1"}};
    EXPECT_EQ(extract_client_ip(headers, "127.0.0.1"), "203.0.113.7");
}

TEST(RequestContextTest, HeaderPrecedenceFollowsProxyOrder)
{
    // x-real-ip is consulted only when x-forwarded-for has no public entry.
    json headers = {
        {"x-forwarded-for", "10.0.0.1"},
        {"x-real-ip", "198.51.100.20"},
        {"cf-connecting-ip", "198.51.100.30"}};
    EXPECT_EQ(extract_client_ip(headers, ""), "198.51.100.20");
}

TEST(RequestContextTest, FallsBackToPeerThenUnknown)
{
    // Without usable headers the peer host is used, and "unknown" when that is empty.
    json headers = {{"x-real-ip", "127.0.0.1"}, {"x-client-ip", 42}};
    EXPECT_EQ(extract_client_ip(headers, "198.51.100.9"), "198.51.100.9");
    EXPECT_EQ(extract_client_ip(json::object(), ""), "unknown");
    EXPECT_EQ(extract_client_ip(json(), ""), "unknown");
}

TEST(RequestContextTest, PeerHostStripsPort)
{
    // The "ip:port" peer label is reduced to the host part.
    EXPECT_EQ(peer_host("203.0.113.1:50122"), "203.0.113.1");
    EXPECT_EQ(peer_host("203.0.113.1"), "203.0.113.1");
}

TEST(RequestContextTest, IsoClientTimestampDropsOffset)
{
    // ISO timestamps keep their wall-clock digits and lose the zone designator.
    TimePoint received = current_time();
    auto expected = parse_iso_local("2024-06-01T09:30:00");
    ASSERT_TRUE(expected.has_value());

    EXPECT_EQ(resolve_generation_time({{"x-timestamp", "2024-06-01T09:30:00Z"}}, received), *expected);
    EXPECT_EQ(resolve_generation_time({{"x-client-time", "2024-06-01T09:30:00+02:00"}}, received), *expected);
}

TEST(RequestContextTest, UnixClientTimestampsInSecondsOrMilliseconds)
{
    // Numeric client headers are seconds, or milliseconds when above 1e10.
    TimePoint received = current_time();
    EXPECT_EQ(resolve_generation_time({{"timestamp", "1700000000"}}, received),
              TimePoint(std::chrono::seconds(1700000000)));
    EXPECT_EQ(resolve_generation_time({{"x-request-time", "1700000000123"}}, received),
              TimePoint(std::chrono::milliseconds(1700000000123)));
}

TEST(RequestContextTest, ProxyTimestampsAcceptMicroseconds)
{
    // Proxy timing headers additionally treat values above 1e12 as microseconds.
    TimePoint received = current_time();
    EXPECT_EQ(resolve_generation_time({{"x-queue-start", "1700000000123456"}}, received),
              TimePoint(std::chrono::microseconds(1700000000123456)));
    EXPECT_EQ(resolve_generation_time({{"x-request-start", "1700000000250"}}, received),
              TimePoint(std::chrono::milliseconds(1700000000250)));
}

TEST(RequestContextTest, ClientHeadersWinOverProxyHeaders)
{
    // A parsable client timestamp takes precedence over proxy timing.
    TimePoint received = current_time();
    json headers = {{"x-request-start", "1600000000"}, {"x-timestamp", "1700000000"}};
    EXPECT_EQ(resolve_generation_time(headers, received), TimePoint(std::chrono::seconds(1700000000)));
}

TEST(RequestContextTest, UnparsableValuesFallThrough)
{
    // Garbage values are skipped; with nothing usable the receive time is returned.
    TimePoint received = current_time();
    EXPECT_EQ(resolve_generation_time({{"x-timestamp", "yesterday"}}, received), received);
    EXPECT_EQ(resolve_generation_time({{"x-timestamp", "2024-13-45Tnope"}}, received), received);
    EXPECT_EQ(resolve_generation_time({{"x-timestamp", "abc"}, {"x-forwarded-start", "1700000000"}}, received),
              TimePoint(std::chrono::seconds(1700000000)));
    EXPECT_EQ(resolve_generation_time(json::object(), received), received);
}

TEST(RequestContextTest, FarFutureTimestampsAreKept)
{
    // Client times after 2262 are stored as given, not wrapped into the past.
    TimePoint received = current_time();
    EXPECT_EQ(resolve_generation_time({{"x-timestamp", "9999999999"}}, received),
              TimePoint(std::chrono::seconds(9999999999LL)));

    auto iso_2300 = parse_iso_local("2300-01-01T00:00:00");
    ASSERT_TRUE(iso_2300.has_value());
    EXPECT_EQ(resolve_generation_time({{"x-timestamp", "2300-01-01T00:00:00"}}, received), *iso_2300);
    EXPECT_GT(*iso_2300, received);
}

TEST(RequestContextTest, UnrepresentableTimestampsFallThrough)
{
    // Infinite or huge numbers are skipped in favour of the next usable header.
    TimePoint received = current_time();
    EXPECT_EQ(resolve_generation_time({{"x-timestamp", "inf"}}, received), received);
    EXPECT_EQ(resolve_generation_time({{"x-timestamp", "1e300"}}, received), received);
    EXPECT_EQ(resolve_generation_time({{"x-timestamp", "nan"}, {"x-request-start", "1e300"}}, received), received);
    EXPECT_EQ(resolve_generation_time({{"x-timestamp", "1e300"}, {"x-queue-start", "1700000000"}}, received),
              TimePoint(std::chrono::seconds(1700000000)));
}
