#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Fixed-bucket latency histogram in microseconds.
class Histogram
{
public:
    Histogram()
        : bounds_{100, 250, 500, 1000, 5000, 10000, 50000, 100000, 500000, 1000000},
          counts_(bounds_.size() + 1, 0)
    {
    }

    // Adds a latency observation in microseconds.
    void observe(std::int64_t micros)
    {
        if (micros < 0)
            micros = 0;
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t idx = 0;
        while (idx < bounds_.size() && micros > bounds_[idx])
        {
            ++idx;
        }
        ++counts_[idx];
    }

    struct Snapshot
    {
        std::uint64_t count = 0;
        double p50_ms = 0;
        double p95_ms = 0;
        double p99_ms = 0;
    };

    // Returns a snapshot with count and percentile estimates.
    Snapshot snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Snapshot snap;
        for (auto c : counts_)
            snap.count += c;

        snap.p50_ms = percentile(snap.count, 50);
        snap.p95_ms = percentile(snap.count, 95);
        snap.p99_ms = percentile(snap.count, 99);
        return snap;
    }

private:
    // Upper bucket bound of the pct-th observation; the overflow bucket
    // reports the largest bound.
    double percentile(std::uint64_t total, int pct) const
    {
        if (total == 0)
            return 0.0;

        std::uint64_t target = (total * pct + 99) / 100; // Round up to the next count.
        std::uint64_t cumulative = 0;
        for (std::size_t i = 0; i < counts_.size(); ++i)
        {
            cumulative += counts_[i];
            if (cumulative >= target)
            {
                std::int64_t upper = (i < bounds_.size()) ? bounds_[i] : bounds_.back();
                return static_cast<double>(upper) / 1000.0;
            }
        }
        return static_cast<double>(bounds_.back()) / 1000.0;
    }

    std::vector<std::int64_t> bounds_;
    std::vector<std::uint64_t> counts_;
    mutable std::mutex mutex_;
};

// Request counters for the tracker service. Ledger figures are added to the
// snapshot by the server; this class never touches the ledger.
class Metrics
{
public:
    Metrics() : last_snapshot_(std::chrono::steady_clock::now()) {}

    void inc_connections() { connections_.fetch_add(1, std::memory_order_relaxed); }
    void dec_connections() { connections_.fetch_sub(1, std::memory_order_relaxed); }

    // Records one handled request with its outcome and latency. An empty
    // error code means success.
    void record_request(const std::string &action, const std::string &error_code, std::chrono::microseconds latency)
    {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
        window_requests_.fetch_add(1, std::memory_order_relaxed);

        std::lock_guard<std::mutex> lock(map_mutex_);
        auto &stats = actions_[action];
        if (error_code.empty())
            ++stats.ok;
        else
        {
            ++stats.failed;
            ++error_counts_[error_code];
        }
        stats.latency.observe(latency.count());
    }

    std::uint64_t total_requests() const { return total_requests_.load(std::memory_order_relaxed); }

    // Produces a metrics snapshot and resets the window counters.
    nlohmann::json snapshot_and_reset_window()
    {
        std::uint64_t window = window_requests_.exchange(0);

        double secs = 0.0;
        nlohmann::json actions = nlohmann::json::object();
        nlohmann::json errors = nlohmann::json::object();
        {
            std::lock_guard<std::mutex> lock(map_mutex_);
            auto now = std::chrono::steady_clock::now();
            secs = std::chrono::duration_cast<std::chrono::microseconds>(now - last_snapshot_).count() / 1'000'000.0;
            if (secs <= 0.0)
                secs = 1e-6;
            last_snapshot_ = now;

            for (const auto &kv : actions_)
            {
                auto snap = kv.second.latency.snapshot();
                actions[kv.first] = {
                    {"ok", kv.second.ok},
                    {"failed", kv.second.failed},
                    {"p50_ms", snap.p50_ms},
                    {"p95_ms", snap.p95_ms},
                    {"p99_ms", snap.p99_ms}};
            }
            for (const auto &kv : error_counts_)
                errors[kv.first] = kv.second;
        }

        nlohmann::json root;
        root["connections"] = connections_.load(std::memory_order_relaxed);
        root["total_requests"] = total_requests_.load(std::memory_order_relaxed);
        root["window_requests"] = window;
        root["qps"] = window / secs;
        root["actions"] = actions;
        root["errors"] = errors;
        return root;
    }

private:
    struct ActionStats
    {
        std::uint64_t ok = 0;
        std::uint64_t failed = 0;
        Histogram latency;
    };

    std::atomic<int> connections_{0};
    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> window_requests_{0};

    std::map<std::string, ActionStats> actions_;
    std::map<std::string, std::uint64_t> error_counts_;
    std::mutex map_mutex_;

    std::chrono::steady_clock::time_point last_snapshot_;
};
