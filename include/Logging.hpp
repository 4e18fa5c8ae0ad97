#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "utils.hpp"

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

inline const char *to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "unknown";
}

inline LogLevel log_level_from_string(const std::string &name)
{
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "warn")
        return LogLevel::Warn;
    if (name == "error")
        return LogLevel::Error;
    throw std::invalid_argument("Unknown log level: " + name);
}

// Thread-safe structured logger that prints one JSON object per line.
class Logger
{
public:
    // Emits a structured log event as a single JSON line when `level` is at
    // or above the configured minimum.
    static void log_event(LogLevel level, const std::string &action, const std::string &message, const nlohmann::json &extra = nlohmann::json::object())
    {
        if (static_cast<int>(level) < min_level().load(std::memory_order_relaxed))
            return;

        nlohmann::json j = extra;
        j["ts"] = current_timestamp();
        j["level"] = to_string(level);
        j["action"] = action;
        j["message"] = message;

        // Serialize output to avoid interleaved JSON lines.
        std::lock_guard<std::mutex> lock(mutex());
        *sink() << j.dump() << std::endl;
    }

    static void set_min_level(LogLevel level)
    {
        min_level().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    // Redirects output; the stream must outlive every later log call.
    static void set_sink(std::ostream &out)
    {
        std::lock_guard<std::mutex> lock(mutex());
        sink() = &out;
    }

private:
    static std::mutex &mutex()
    {
        static std::mutex m;
        return m;
    }

    static std::atomic<int> &min_level()
    {
        static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
        return level;
    }

    static std::ostream *&sink()
    {
        static std::ostream *out = &std::cout;
        return out;
    }
};
