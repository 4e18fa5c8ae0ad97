#pragma once
#include <cstdint>
#include <mutex>
#include <vector>

#include "EventStore.hpp"

// In-memory append-only ledger. A single mutex guards the record sequence and
// the running total so [push; increment] is one atomic step for readers.
//
// Memory grows with every append for the lifetime of the process; there is no
// eviction and no persistence.
class Ledger : public EventStore
{
public:
    Ledger() = default;

    Ledger(const Ledger &) = delete;
    Ledger &operator=(const Ledger &) = delete;

    std::uint64_t append(EventRecord record) override;
    std::uint64_t total() const override;
    std::size_t size() const override;
    std::vector<EventRecord> snapshot() const override;
    LedgerView view() const override;

private:
    std::vector<EventRecord> records_;
    std::uint64_t total_ = 0;
    mutable std::mutex mutex_;
};
