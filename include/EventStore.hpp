#pragma once

#include <cstdint>
#include <vector>

#include "EventRecord.hpp"

// Records and running total captured in one critical section.
struct LedgerView
{
    std::vector<EventRecord> records;
    std::uint64_t total = 0;
};

// Read/write surface shared by request handlers. One instance is built at
// startup and passed by reference; implementations must be thread-safe.
class EventStore
{
public:
    virtual ~EventStore() = default;

    // Appends a record and returns the updated running total.
    // Throws InvalidQuantity when record.quantity < 1 and std::overflow_error
    // when the total would wrap; the store is unchanged in both cases.
    virtual std::uint64_t append(EventRecord record) = 0;

    // Sum of quantities across all stored records.
    virtual std::uint64_t total() const = 0;

    // Number of stored records.
    virtual std::size_t size() const = 0;

    // Copy of all records in arrival order.
    virtual std::vector<EventRecord> snapshot() const = 0;

    // Records and total as one consistent state.
    virtual LedgerView view() const = 0;
};
