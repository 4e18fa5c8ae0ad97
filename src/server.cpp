#include <csignal>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

#include "Ledger.hpp"
#include "Logging.hpp"
#include "Metrics.hpp"
#include "RequestHandler.hpp"
#include "ServerConfig.hpp"
#include "TrackerServer.hpp"
#include "Tls.hpp"

namespace
{
    volatile std::sig_atomic_t shutdown_requested = 0;

    void on_signal(int)
    {
        shutdown_requested = 1;
    }
}

int main(int argc, char *argv[])
{
    if (argc < 2 || argc > 3)
    {
        std::cerr << "Usage: " << argv[0] << " <PORT> [CONFIG_PATH]\n";
        return EXIT_FAILURE;
    }

    ServerConfig config;
    try
    {
        config = ServerConfig::load(argc == 3 ? argv[2] : DEFAULT_CONFIG_PATH);
        config.port = parse_port(argv[1]);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    Logger::set_min_level(config.log_level);
    Logger::log_event(LogLevel::Info, "config_loaded", "Configuration loaded", config.to_json());

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);

    // The one ledger for this process; everything below borrows it.
    Ledger ledger;
    Metrics metrics;
    RequestHandler handler(ledger, metrics, config.window);

    SslCtxPtr ctx;
    try
    {
        ctx = make_server_context(config.cert_path, config.key_path);
    }
    catch (const std::exception &e)
    {
        Logger::log_event(LogLevel::Error, "tls_setup_error", "Failed to set up TLS", {{"detail", e.what()}});
        return EXIT_FAILURE;
    }

    TrackerServer server(config, std::move(ctx), handler, metrics);
    try
    {
        server.listen();
    }
    catch (const std::exception &e)
    {
        Logger::log_event(LogLevel::Error, "listen_error", "Failed to start listening", {{"detail", e.what()}});
        return EXIT_FAILURE;
    }

    std::thread metrics_thread([&]()
                               {
                                   auto interval = std::chrono::seconds(config.metrics_interval_seconds);
                                   auto next_dump = std::chrono::steady_clock::now() + interval;
                                   while (!shutdown_requested)
                                   {
                                       std::this_thread::sleep_for(std::chrono::milliseconds(200));
                                       if (std::chrono::steady_clock::now() < next_dump)
                                           continue;
                                       next_dump += interval;
                                       auto snap = metrics.snapshot_and_reset_window();
                                       snap["ledger_total"] = ledger.total();
                                       snap["ledger_records"] = ledger.size();
                                       snap["uptime_seconds"] = handler.uptime_seconds();
                                       Logger::log_event(LogLevel::Info, "metrics_dump", "Periodic metrics snapshot", snap);
                                   }
                                   server.stop(); });

    server.run();
    shutdown_requested = 1;
    metrics_thread.join();

    Logger::log_event(LogLevel::Info, "server_stop", "Server stopped",
                      {{"ledger_total", ledger.total()}, {"ledger_records", ledger.size()}});
    return EXIT_SUCCESS;
}
