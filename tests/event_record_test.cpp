#include <gtest/gtest.h>
#include <stdexcept>

#include "EventRecord.hpp"

TEST(EventRecordTest, PurchaseRejectsNonPositiveQuantity)
{
    // Purchases with quantity 0 or negative are refused before a record exists.
    auto now = current_time();
    EXPECT_THROW(make_purchase(1, 2, 3, 0, "unknown", now), InvalidQuantity);
    EXPECT_THROW(make_purchase(1, 2, 3, -4, "unknown", now), InvalidQuantity);
    try
    {
        make_purchase(1, 2, 3, -4, "unknown", now);
        FAIL() << "expected InvalidQuantity";
    }
    catch (const InvalidQuantity &e)
    {
        EXPECT_EQ(e.quantity(), -4);
    }
}

TEST(EventRecordTest, VisitDefaultsToQuantityOne)
{
    // Page visits are non-quantity events and always carry quantity 1.
    auto now = current_time();
    auto v = make_visit(9, "/checkout", "198.51.100.4", now);
    EXPECT_EQ(v.kind, EventKind::Visit);
    EXPECT_EQ(v.quantity, 1);
    EXPECT_EQ(v.page_url, "/checkout");
    EXPECT_EQ(v.timestamp, now);
}

TEST(EventRecordTest, JsonCarriesPurchaseFields)
{
    // Serialized purchases expose ids, quantity, origin and a naive ISO timestamp.
    auto ts = parse_iso_local("2024-03-10T08:15:30.500000");
    ASSERT_TRUE(ts.has_value());
    auto p = make_purchase(11, 22, 33, 4, "203.0.113.9", *ts);

    auto j = p.to_json();
    EXPECT_EQ(j["kind"], "purchase");
    EXPECT_EQ(j["user_id"], 11);
    EXPECT_EQ(j["promotion_id"], 22);
    EXPECT_EQ(j["product_id"], 33);
    EXPECT_EQ(j["quantity"], 4);
    EXPECT_EQ(j["ip_address"], "203.0.113.9");
    EXPECT_EQ(j["timestamp"], "2024-03-10T08:15:30.500000");
    EXPECT_FALSE(j.contains("page_url"));

    auto back = EventRecord::from_json(j);
    EXPECT_EQ(back.kind, EventKind::Purchase);
    EXPECT_EQ(back.quantity, 4);
    EXPECT_EQ(back.timestamp, *ts);
}

TEST(EventRecordTest, FromJsonRejectsBadInput)
{
    // Missing fields, unknown kinds and zero quantities are refused.
    nlohmann::json j = {
        {"kind", "purchase"}, {"user_id", 1}, {"promotion_id", 2}, {"product_id", 3},
        {"quantity", 0}, {"timestamp", "2024-03-10T08:15:30"}};
    EXPECT_THROW(EventRecord::from_json(j), InvalidQuantity);

    j["quantity"] = 1;
    j["kind"] = "refund";
    EXPECT_THROW(EventRecord::from_json(j), std::invalid_argument);

    j["kind"] = "visit";
    EXPECT_THROW(EventRecord::from_json(j), nlohmann::json::exception);
}

TEST(EventRecordTest, KindNamesConvertBothWays)
{
    // Kind names round-trip through their string form.
    EXPECT_STREQ(to_string(EventKind::Visit), "visit");
    EXPECT_STREQ(to_string(EventKind::Purchase), "purchase");
    EXPECT_EQ(event_kind_from_string("visit"), EventKind::Visit);
    EXPECT_EQ(event_kind_from_string("purchase"), EventKind::Purchase);
}
