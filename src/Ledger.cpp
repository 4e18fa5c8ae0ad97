#include "Ledger.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

std::uint64_t Ledger::append(EventRecord record)
{
    // Rejected records never reach the guarded state.
    if (!isValidQuantity(record.quantity))
        throw InvalidQuantity(record.quantity);

    auto quantity = static_cast<std::uint64_t>(record.quantity);
    std::lock_guard<std::mutex> lock(mutex_);
    if (quantity > std::numeric_limits<std::uint64_t>::max() - total_)
        throw std::overflow_error("Quantity " + std::to_string(quantity) + " would overflow the running total");
    records_.push_back(std::move(record));
    total_ += quantity;
    return total_;
}

std::uint64_t Ledger::total() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

std::size_t Ledger::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::vector<EventRecord> Ledger::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

LedgerView Ledger::view() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return LedgerView{records_, total_};
}
