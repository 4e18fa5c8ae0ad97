#ifndef SERVER_CONFIG_HPP
#define SERVER_CONFIG_HPP

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "Framing.hpp"
#include "Logging.hpp"
#include "WindowQuery.hpp"

constexpr const char *DEFAULT_CONFIG_PATH = "config/tracker.json";

struct ServerConfig
{
    std::uint16_t port = 8080;
    std::size_t worker_threads = 0; // 0 = hardware concurrency, at most 1024.
    std::string cert_path = "config/cert.pem";
    std::string key_path = "config/key.pem";
    std::size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
    int metrics_interval_seconds = 10;
    LogLevel log_level = LogLevel::Info;
    WindowLimits window;

    // Reads overrides from a JSON object; keys that are absent keep their
    // defaults. Throws std::runtime_error on wrong types or invalid values.
    static ServerConfig from_json(const nlohmann::json &j);

    // Loads from `path`. A missing file yields the defaults; an unreadable
    // or malformed file throws std::runtime_error.
    static ServerConfig load(const std::string &path);

    nlohmann::json to_json() const;
};

// Parses a decimal TCP port; throws std::runtime_error when out of range.
std::uint16_t parse_port(const std::string &text);

#endif
