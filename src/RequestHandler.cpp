#include "RequestHandler.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "Logging.hpp"
#include "RequestContext.hpp"

using json = nlohmann::json;
using namespace errors;

namespace
{
    bool has_integer(const json &request, const char *key)
    {
        auto it = request.find(key);
        return it != request.end() && it->is_number_integer();
    }

    const json &request_headers(const json &request)
    {
        static const json empty = json::object();
        auto it = request.find("headers");
        if (it == request.end() || it->is_null())
            return empty;
        return *it;
    }
}

json make_failure(const std::string &code, const std::string &message)
{
    json resp;
    resp["status"] = "fail";
    resp["error"] = code;
    resp["message"] = message;
    return resp;
}

RequestHandler::RequestHandler(EventStore &store, Metrics &metrics, WindowLimits limits, NowFn now)
    : store_(store),
      metrics_(metrics),
      limits_(limits),
      now_(now ? std::move(now) : NowFn([]()
                                         { return current_time(); })),
      started_(std::chrono::steady_clock::now())
{
}

double RequestHandler::uptime_seconds() const
{
    auto elapsed = std::chrono::steady_clock::now() - started_;
    return std::chrono::duration<double>(elapsed).count();
}

json RequestHandler::handle(const json &request, const std::string &peer)
{
    if (!request.is_object() || !request.contains("action") || !request["action"].is_string())
    {
        Logger::log_event(LogLevel::Warn, "request", "Rejected request without action", {{"peer", peer}, {"error", ERR_BAD_REQUEST}});
        return make_failure(ERR_BAD_REQUEST, "Invalid request format.");
    }

    const std::string action = request["action"];
    auto start_time = std::chrono::steady_clock::now();
    std::string error_code;
    json response;

    try
    {
        if (action == "buy")
            response = handle_buy(request, peer, error_code);
        else if (action == "visit")
            response = handle_visit(request, peer, error_code);
        else if (action == "stats")
            response = handle_stats(request, error_code);
        else if (action == "health")
            response = handle_health();
        else if (action == "info")
            response = handle_info();
        else
        {
            error_code = ERR_UNKNOWN_ACTION;
            response = make_failure(ERR_UNKNOWN_ACTION, "Unknown action: " + action);
            response["available_actions"] = {"buy", "visit", "stats", "health", "info"};
        }
    }
    catch (const std::exception &e)
    {
        Logger::log_event(LogLevel::Error, "request_error", "Unhandled error while processing request",
                          {{"action", action}, {"peer", peer}, {"detail", e.what()}});
        error_code = ERR_INTERNAL;
        response = make_failure(ERR_INTERNAL, "Internal error.");
    }

    if (error_code.empty())
        response["status"] = "success";

    auto latency = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_time);
    metrics_.record_request(action, error_code, latency);

    json extra = {
        {"action", action},
        {"status", error_code.empty() ? "success" : "fail"},
        {"latency_ms", latency.count() / 1000.0},
        {"peer", peer}};
    if (!error_code.empty())
        extra["error"] = error_code;
    Logger::log_event(error_code.empty() ? LogLevel::Info : LogLevel::Warn, "request", "Handled request", extra);

    return response;
}

json RequestHandler::handle_buy(const json &request, const std::string &peer, std::string &error_code)
{
    if (!has_integer(request, "user_id") || !has_integer(request, "promotion_id") ||
        !has_integer(request, "product_id") || !request.contains("product_quantity"))
    {
        error_code = ERR_BAD_REQUEST;
        return make_failure(ERR_BAD_REQUEST, "Buy requires integer user_id, promotion_id, product_id and product_quantity.");
    }
    if (!request["product_quantity"].is_number_integer())
    {
        error_code = ERR_INVALID_QUANTITY;
        return make_failure(ERR_INVALID_QUANTITY, "product_quantity must be a positive integer.");
    }

    const json &headers = request_headers(request);
    if (!headers.is_object())
    {
        error_code = ERR_BAD_REQUEST;
        return make_failure(ERR_BAD_REQUEST, "headers must be an object.");
    }

    std::uint64_t total = 0;
    try
    {
        auto record = make_purchase(request["user_id"].get<std::int64_t>(),
                                    request["promotion_id"].get<std::int64_t>(),
                                    request["product_id"].get<std::int64_t>(),
                                    request["product_quantity"].get<std::int64_t>(),
                                    extract_client_ip(headers, peer_host(peer)),
                                    resolve_generation_time(headers, now_()));
        total = store_.append(std::move(record));
    }
    catch (const InvalidQuantity &e)
    {
        error_code = ERR_INVALID_QUANTITY;
        return make_failure(ERR_INVALID_QUANTITY, e.what());
    }
    catch (const std::overflow_error &e)
    {
        error_code = ERR_INVALID_QUANTITY;
        return make_failure(ERR_INVALID_QUANTITY, e.what());
    }

    json payload;
    payload["action"] = "buy";
    payload["buy_count"] = total;
    payload["message"] = "Buy logged successfully. Total buys: " + std::to_string(total);
    return payload;
}

json RequestHandler::handle_visit(const json &request, const std::string &peer, std::string &error_code)
{
    if (!has_integer(request, "user_id") || !request.contains("page") || !request["page"].is_string())
    {
        error_code = ERR_BAD_REQUEST;
        return make_failure(ERR_BAD_REQUEST, "Visit requires integer user_id and string page.");
    }
    std::string page = request["page"];
    if (!isValidPage(page))
    {
        error_code = ERR_BAD_REQUEST;
        return make_failure(ERR_BAD_REQUEST, "Invalid page.");
    }

    const json &headers = request_headers(request);
    if (!headers.is_object())
    {
        error_code = ERR_BAD_REQUEST;
        return make_failure(ERR_BAD_REQUEST, "headers must be an object.");
    }

    auto record = make_visit(request["user_id"].get<std::int64_t>(), std::move(page),
                             extract_client_ip(headers, peer_host(peer)),
                             resolve_generation_time(headers, now_()));
    std::uint64_t total = store_.append(std::move(record));

    json payload;
    payload["action"] = "visit";
    payload["visit_count"] = total;
    payload["message"] = "Visit logged successfully. Total events: " + std::to_string(total);
    return payload;
}

json RequestHandler::handle_stats(const json &request, std::string &error_code)
{
    double hours = limits_.default_hours;
    auto it = request.find("timeframe_hours");
    if (it != request.end() && !it->is_null())
    {
        if (!it->is_number())
        {
            error_code = ERR_BAD_REQUEST;
            return make_failure(ERR_BAD_REQUEST, "timeframe_hours must be a number.");
        }
        hours = it->get<double>();
    }
    if (!limits_.contains(hours))
    {
        error_code = ERR_INVALID_TIMEFRAME;
        return make_failure(ERR_INVALID_TIMEFRAME,
                            "timeframe_hours must lie in [" + std::to_string(limits_.min_hours) + ", " +
                                std::to_string(limits_.max_hours) + "].");
    }

    TimePoint now = now_();
    WindowStats stats = query_window(store_, hours, now);
    double uptime = uptime_seconds();

    json payload;
    payload["action"] = "stats";
    payload["uptime_seconds"] = uptime;
    payload["uptime_formatted"] = format_uptime(uptime);
    payload["total_events"] = stats.total;
    payload["current_time"] = format_iso_local(now);
    payload["server_status"] = "healthy";
    payload["recent_events"] = stats.recent;
    payload["timeframe_hours"] = hours;
    return payload;
}

json RequestHandler::handle_health() const
{
    json payload;
    payload["action"] = "health";
    payload["server_status"] = "healthy";
    payload["timestamp"] = format_iso_local(now_());
    payload["uptime_seconds"] = uptime_seconds();
    return payload;
}

json RequestHandler::handle_info() const
{
    json payload;
    payload["action"] = "info";
    payload["message"] = "Purchase Tracker";
    payload["version"] = SERVICE_VERSION;
    payload["actions"] = {
        {"buy", "Log a product purchase"},
        {"visit", "Log a page visit"},
        {"stats", "Get server statistics"},
        {"health", "Health check"},
        {"info", "Service information"}};
    return payload;
}
