#pragma once
#include <chrono>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "EventStore.hpp"
#include "Metrics.hpp"
#include "WindowQuery.hpp"

// Standardized error codes for client-side handling.
namespace errors
{
    constexpr const char *ERR_BAD_REQUEST = "ERR_BAD_REQUEST";
    constexpr const char *ERR_INVALID_QUANTITY = "ERR_INVALID_QUANTITY";
    constexpr const char *ERR_INVALID_TIMEFRAME = "ERR_INVALID_TIMEFRAME";
    constexpr const char *ERR_UNKNOWN_ACTION = "ERR_UNKNOWN_ACTION";
    constexpr const char *ERR_JSON_PARSE = "ERR_JSON_PARSE";
    constexpr const char *ERR_INTERNAL = "ERR_INTERNAL";
}

constexpr const char *SERVICE_VERSION = "0.1.0";

// Turns one decoded request into a response. Holds no connection state, so a
// single instance is shared by every worker thread.
class RequestHandler
{
public:
    using NowFn = std::function<TimePoint()>;

    // `store` and `metrics` must outlive the handler. `now` defaults to the
    // system clock and is replaceable for tests.
    RequestHandler(EventStore &store, Metrics &metrics, WindowLimits limits, NowFn now = nullptr);

    // Dispatches on request["action"]. Always returns a response object
    // carrying "status" ("success" or "fail"); failures add "error" and
    // "message". `peer` is the "ip:port" of the connection.
    nlohmann::json handle(const nlohmann::json &request, const std::string &peer);

    double uptime_seconds() const;

private:
    nlohmann::json handle_buy(const nlohmann::json &request, const std::string &peer, std::string &error_code);
    nlohmann::json handle_visit(const nlohmann::json &request, const std::string &peer, std::string &error_code);
    nlohmann::json handle_stats(const nlohmann::json &request, std::string &error_code);
    nlohmann::json handle_health() const;
    nlohmann::json handle_info() const;

    EventStore &store_;
    Metrics &metrics_;
    WindowLimits limits_;
    NowFn now_;
    std::chrono::steady_clock::time_point started_;
};

// Builds {"status":"fail","error":code,"message":message}.
nlohmann::json make_failure(const std::string &code, const std::string &message);
