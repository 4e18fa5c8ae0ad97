#include "ServerConfig.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace
{
    template <typename T>
    void read_field(const json &j, const char *key, T &out)
    {
        auto it = j.find(key);
        if (it == j.end())
            return;
        try
        {
            out = it->get<T>();
        }
        catch (const json::exception &e)
        {
            throw std::runtime_error(std::string("Invalid config field '") + key + "': " + e.what());
        }
    }
}

ServerConfig ServerConfig::from_json(const json &j)
{
    if (!j.is_object())
        throw std::runtime_error("Config root must be a JSON object");

    ServerConfig cfg;

    int port = cfg.port;
    read_field(j, "port", port);
    if (port < 1 || port > 65535)
        throw std::runtime_error("Config port out of range: " + std::to_string(port));
    cfg.port = static_cast<std::uint16_t>(port);

    std::int64_t workers = static_cast<std::int64_t>(cfg.worker_threads);
    read_field(j, "worker_threads", workers);
    if (workers < 0 || workers > 1024)
        throw std::runtime_error("Config worker_threads must lie in [0, 1024]: " + std::to_string(workers));
    cfg.worker_threads = static_cast<std::size_t>(workers);

    read_field(j, "cert_path", cfg.cert_path);
    read_field(j, "key_path", cfg.key_path);
    read_field(j, "max_frame_size", cfg.max_frame_size);
    if (cfg.max_frame_size == 0)
        throw std::runtime_error("Config max_frame_size must be positive");

    read_field(j, "metrics_interval_seconds", cfg.metrics_interval_seconds);
    if (cfg.metrics_interval_seconds <= 0)
        throw std::runtime_error("Config metrics_interval_seconds must be positive");

    std::string level = to_string(cfg.log_level);
    read_field(j, "log_level", level);
    try
    {
        cfg.log_level = log_level_from_string(level);
    }
    catch (const std::invalid_argument &e)
    {
        throw std::runtime_error(e.what());
    }

    auto window = j.find("window");
    if (window != j.end())
    {
        if (!window->is_object())
            throw std::runtime_error("Config window must be a JSON object");
        read_field(*window, "min_hours", cfg.window.min_hours);
        read_field(*window, "max_hours", cfg.window.max_hours);
        read_field(*window, "default_hours", cfg.window.default_hours);
    }
    if (cfg.window.min_hours <= 0 || cfg.window.min_hours > cfg.window.max_hours)
        throw std::runtime_error("Config window requires 0 < min_hours <= max_hours");
    if (!cfg.window.contains(cfg.window.default_hours))
        throw std::runtime_error("Config window default_hours must lie within [min_hours, max_hours]");

    return cfg;
}

ServerConfig ServerConfig::load(const std::string &path)
{
    if (!std::filesystem::exists(path))
        return ServerConfig{};

    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open config file " + path);

    json j;
    try
    {
        in >> j;
    }
    catch (const json::parse_error &e)
    {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    return from_json(j);
}

json ServerConfig::to_json() const
{
    return {
        {"port", port},
        {"worker_threads", worker_threads},
        {"cert_path", cert_path},
        {"key_path", key_path},
        {"max_frame_size", max_frame_size},
        {"metrics_interval_seconds", metrics_interval_seconds},
        {"log_level", ::to_string(log_level)},
        {"window", {{"min_hours", window.min_hours}, {"max_hours", window.max_hours}, {"default_hours", window.default_hours}}}};
}

std::uint16_t parse_port(const std::string &text)
{
    std::size_t used = 0;
    long port = 0;
    try
    {
        port = std::stol(text, &used);
    }
    catch (const std::exception &)
    {
        throw std::runtime_error("Invalid port: " + text);
    }
    if (used != text.size() || port < 1 || port > 65535)
        throw std::runtime_error("Invalid port: " + text);
    return static_cast<std::uint16_t>(port);
}
