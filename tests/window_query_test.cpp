#include <gtest/gtest.h>
#include <chrono>
#include <vector>

#include "Ledger.hpp"
#include "WindowQuery.hpp"

using namespace std::chrono_literals;

namespace
{
    EventRecord visit_at(TimePoint ts)
    {
        return make_visit(1, "/product/42", "unknown", ts);
    }
}

TEST(WindowQueryTest, CountsRecordsInsideTrailingWindow)
{
    // Records at now-30m, now-90m and now-200m fall into the 1h, 2h and 6h windows as 1, 2 and 3.
    Ledger ledger;
    TimePoint now = current_time();
    ledger.append(visit_at(now - 30min));
    ledger.append(visit_at(now - 90min));
    ledger.append(visit_at(now - 200min));

    EXPECT_EQ(count_within(ledger, 1.0, now), 1u);
    EXPECT_EQ(count_within(ledger, 2.0, now), 2u);
    EXPECT_EQ(count_within(ledger, 6.0, now), 3u);
}

TEST(WindowQueryTest, EmptyLedgerCountsZero)
{
    // Nothing is counted for any window size on an empty ledger.
    Ledger ledger;
    TimePoint now = current_time();
    for (double h : {0.1, 1.0, 24.0, 168.0, 10000.0})
        EXPECT_EQ(count_within(ledger, h, now), 0u);
    auto stats = query_window(ledger, 1.0, now);
    EXPECT_EQ(stats.total, 0u);
    EXPECT_EQ(stats.recent, 0u);
}

TEST(WindowQueryTest, WiderWindowNeverCountsFewer)
{
    // For a fixed now, growing the window never lowers the count.
    Ledger ledger;
    TimePoint now = current_time();
    for (int minutes : {1, 7, 45, 59, 61, 180, 720, 1440, 5000, 10080, 20000})
        ledger.append(visit_at(now - std::chrono::minutes(minutes)));

    std::uint64_t previous = 0;
    for (double h = 0.1; h <= 400.0; h *= 1.7)
    {
        auto count = count_within(ledger, h, now);
        EXPECT_GE(count, previous) << "hours=" << h;
        previous = count;
    }
}

TEST(WindowQueryTest, WindowEdgeIsInclusive)
{
    // A record exactly `hours` old is counted; one a second older is not.
    std::vector<EventRecord> records = {visit_at(TimePoint{} + 10h)};
    TimePoint now = TimePoint{} + 12h;
    EXPECT_EQ(count_within(records, 2.0, now), 1u);
    EXPECT_EQ(count_within(records, 2.0, now + 1s), 0u);
}

TEST(WindowQueryTest, FutureDatedRecordsAlwaysCount)
{
    // Records stamped after `now` have negative age and fall inside every window.
    Ledger ledger;
    TimePoint now = current_time();
    ledger.append(visit_at(now + 3h));
    ledger.append(visit_at(now - 5h));

    EXPECT_EQ(count_within(ledger, 0.1, now), 1u);
    EXPECT_EQ(count_within(ledger, 6.0, now), 2u);
}

TEST(WindowQueryTest, UsesTimestampsNotArrivalOrder)
{
    // Out-of-order arrivals are filtered by their own timestamps.
    Ledger ledger;
    TimePoint now = current_time();
    ledger.append(visit_at(now - 10h));
    ledger.append(visit_at(now - 10min));
    ledger.append(visit_at(now - 20h));
    ledger.append(visit_at(now - 5min));

    EXPECT_EQ(count_within(ledger, 1.0, now), 2u);
}

TEST(WindowQueryTest, QueryWindowReportsQuantityTotalAndRecordCount)
{
    // The running total sums quantities while the window count counts records.
    Ledger ledger;
    TimePoint now = current_time();
    ledger.append(make_purchase(1, 2, 3, 5, "unknown", now - 10min));
    ledger.append(make_purchase(1, 2, 3, 2, "unknown", now - 3h));

    auto stats = query_window(ledger, 1.0, now);
    EXPECT_EQ(stats.total, 7u);
    EXPECT_EQ(stats.recent, 1u);
}

TEST(WindowLimitsTest, DefaultRangeIsTenthOfHourToOneWeek)
{
    // Default limits accept 0.1 to 168 hours inclusive.
    WindowLimits limits;
    EXPECT_TRUE(limits.contains(0.1));
    EXPECT_TRUE(limits.contains(1.0));
    EXPECT_TRUE(limits.contains(168.0));
    EXPECT_FALSE(limits.contains(0.05));
    EXPECT_FALSE(limits.contains(168.5));
    EXPECT_DOUBLE_EQ(limits.default_hours, 1.0);
}
