#ifndef EVENT_RECORD_HPP
#define EVENT_RECORD_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "utils.hpp"

// Raised when an event is built or appended with a non-positive quantity.
class InvalidQuantity : public std::invalid_argument
{
public:
    explicit InvalidQuantity(std::int64_t quantity);

    std::int64_t quantity() const { return quantity_; }

private:
    std::int64_t quantity_;
};

enum class EventKind
{
    Visit,
    Purchase
};

const char *to_string(EventKind kind);
EventKind event_kind_from_string(const std::string &name);

// One logged occurrence. Records are immutable once appended to a ledger.
struct EventRecord
{
    EventKind kind = EventKind::Visit;
    std::int64_t user_id = 0;
    std::string page_url;           // Visits only.
    std::int64_t promotion_id = 0;  // Purchases only.
    std::int64_t product_id = 0;    // Purchases only.
    std::int64_t quantity = 1;
    std::string ip_address = "unknown";
    TimePoint timestamp{};

    // Serializes the record; the timestamp is naive local ISO-8601.
    nlohmann::json to_json() const;

    // Builds a record from a JSON object; throws on missing fields and
    // InvalidQuantity on a non-positive quantity.
    static EventRecord from_json(const nlohmann::json &j);
};

// Builds a page visit (quantity 1).
EventRecord make_visit(std::int64_t user_id, std::string page_url,
                       std::string ip_address, TimePoint timestamp);

// Builds a product purchase; throws InvalidQuantity when quantity < 1.
EventRecord make_purchase(std::int64_t user_id, std::int64_t promotion_id,
                          std::int64_t product_id, std::int64_t quantity,
                          std::string ip_address, TimePoint timestamp);

#endif
