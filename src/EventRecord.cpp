#include "EventRecord.hpp"

#include <utility>

using json = nlohmann::json;

InvalidQuantity::InvalidQuantity(std::int64_t quantity)
    : std::invalid_argument("Quantity must be a positive integer, got " + std::to_string(quantity)),
      quantity_(quantity)
{
}

const char *to_string(EventKind kind)
{
    switch (kind)
    {
    case EventKind::Visit:
        return "visit";
    case EventKind::Purchase:
        return "purchase";
    }
    return "unknown";
}

EventKind event_kind_from_string(const std::string &name)
{
    if (name == "visit")
        return EventKind::Visit;
    if (name == "purchase")
        return EventKind::Purchase;
    throw std::invalid_argument("Unknown event kind: " + name);
}

json EventRecord::to_json() const
{
    json j = {
        {"kind", ::to_string(kind)},
        {"user_id", user_id},
        {"quantity", quantity},
        {"ip_address", ip_address},
        {"timestamp", format_iso_local(timestamp)}};
    if (kind == EventKind::Visit)
    {
        j["page_url"] = page_url;
    }
    else
    {
        j["promotion_id"] = promotion_id;
        j["product_id"] = product_id;
    }
    return j;
}

EventRecord EventRecord::from_json(const json &j)
{
    EventRecord r;
    r.kind = event_kind_from_string(j.at("kind").get<std::string>());
    r.user_id = j.at("user_id").get<std::int64_t>();
    r.quantity = j.value("quantity", std::int64_t{1});
    if (!isValidQuantity(r.quantity))
        throw InvalidQuantity(r.quantity);
    r.ip_address = j.value("ip_address", std::string("unknown"));

    auto ts = parse_iso_local(j.at("timestamp").get<std::string>());
    if (!ts)
        throw std::invalid_argument("Invalid timestamp: " + j.at("timestamp").get<std::string>());
    r.timestamp = *ts;

    if (r.kind == EventKind::Visit)
    {
        r.page_url = j.at("page_url").get<std::string>();
    }
    else
    {
        r.promotion_id = j.at("promotion_id").get<std::int64_t>();
        r.product_id = j.at("product_id").get<std::int64_t>();
    }
    return r;
}

EventRecord make_visit(std::int64_t user_id, std::string page_url,
                       std::string ip_address, TimePoint timestamp)
{
    EventRecord r;
    r.kind = EventKind::Visit;
    r.user_id = user_id;
    r.page_url = std::move(page_url);
    r.quantity = 1;
    r.ip_address = std::move(ip_address);
    r.timestamp = timestamp;
    return r;
}

EventRecord make_purchase(std::int64_t user_id, std::int64_t promotion_id,
                          std::int64_t product_id, std::int64_t quantity,
                          std::string ip_address, TimePoint timestamp)
{
    if (!isValidQuantity(quantity))
        throw InvalidQuantity(quantity);

    EventRecord r;
    r.kind = EventKind::Purchase;
    r.user_id = user_id;
    r.promotion_id = promotion_id;
    r.product_id = product_id;
    r.quantity = quantity;
    r.ip_address = std::move(ip_address);
    r.timestamp = timestamp;
    return r;
}
