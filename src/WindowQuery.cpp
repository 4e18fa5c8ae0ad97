#include "WindowQuery.hpp"

#include <chrono>

std::uint64_t count_within(const std::vector<EventRecord> &records, double hours, TimePoint now)
{
    const double window_seconds = hours * 3600.0;
    std::uint64_t count = 0;
    for (const auto &record : records)
    {
        std::chrono::duration<double> elapsed = now - record.timestamp;
        if (elapsed.count() <= window_seconds)
            ++count;
    }
    return count;
}

std::uint64_t count_within(const EventStore &store, double hours, TimePoint now)
{
    return count_within(store.snapshot(), hours, now);
}

WindowStats query_window(const EventStore &store, double hours, TimePoint now)
{
    LedgerView view = store.view();
    WindowStats stats;
    stats.total = view.total;
    stats.recent = count_within(view.records, hours, now);
    return stats;
}
