#pragma once
#include <cstdint>
#include <vector>

#include "EventStore.hpp"

// Accepted range for trailing window sizes, in hours.
struct WindowLimits
{
    double min_hours = 0.1;
    double max_hours = 168.0; // One week.
    double default_hours = 1.0;

    bool contains(double hours) const
    {
        return hours >= min_hours && hours <= max_hours;
    }
};

// Answer to the query contract: running total plus events inside the window.
struct WindowStats
{
    std::uint64_t total = 0;
    std::uint64_t recent = 0;
};

// Counts records whose age at `now` is at most `hours`. Records dated after
// `now` have negative age and are always counted. Linear in records.size().
std::uint64_t count_within(const std::vector<EventRecord> &records, double hours, TimePoint now);

// Snapshots the store and counts the records inside the window.
std::uint64_t count_within(const EventStore &store, double hours, TimePoint now);

// Running total and window count taken from the same ledger state.
WindowStats query_window(const EventStore &store, double hours, TimePoint now);
