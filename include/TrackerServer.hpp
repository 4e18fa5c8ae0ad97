#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "FdWrapper.hpp"
#include "Framing.hpp"
#include "Metrics.hpp"
#include "RequestHandler.hpp"
#include "ResponseQueue.hpp"
#include "ServerConfig.hpp"
#include "ThreadPool.hpp"
#include "Tls.hpp"

// Edge-triggered epoll loop serving length-prefixed JSON over TLS. Decoded
// requests run on the thread pool; responses are queued and flushed by the
// loop thread.
class TrackerServer
{
public:
    // `handler` and `metrics` must outlive the server.
    TrackerServer(const ServerConfig &config, SslCtxPtr ctx, RequestHandler &handler, Metrics &metrics);

    TrackerServer(const TrackerServer &) = delete;
    TrackerServer &operator=(const TrackerServer &) = delete;

    // Binds and listens; throws std::runtime_error on socket failures.
    void listen();

    // Runs until stop() is called or epoll fails.
    void run();

    // Asks the loop to exit at its next wakeup. Safe from any thread.
    void stop() { stopping_.store(true, std::memory_order_release); }

private:
    struct Connection
    {
        std::uint64_t id = 0; // Unique per accepted socket; fds get reused.
        Fd fd;
        SslPtr ssl;
        bool handshaked = false;
        std::string peer; // IP:port
        std::string send_buffer;
        FrameDecoder decoder;
    };

    enum class SendResult
    {
        Ok,      // All data sent.
        Pending, // Awaiting more I/O.
        Error
    };

    void accept_clients();
    void handle_client_event(int fd, uint32_t evs);
    bool complete_handshake(Connection &conn, int fd);
    // Returns false when the connection was closed.
    bool read_frames(Connection &conn, int fd);
    void dispatch(int fd, const std::string &peer, const std::string &payload);
    void enqueue_response(int fd, std::uint64_t connection_id, const nlohmann::json &j);
    void drain_outgoing_and_arm();
    SendResult send_buffered(Connection &conn);
    void send_disconnect(SSL *ssl, const char *error, const char *message);
    void close_connection(int fd, const char *error = nullptr, const char *message = nullptr);

    ServerConfig config_;
    SslCtxPtr ctx_;
    RequestHandler &handler_;
    Metrics &metrics_;
    Epoll epoll_;
    Fd listen_fd_;
    std::atomic<bool> stopping_{false};

    std::unordered_map<int, Connection> connections_;
    std::mutex connections_mutex_;
    std::uint64_t next_connection_id_ = 1; // Event loop thread only.

    ResponseQueue responses_;

    // Declared last so workers are joined before the queues they write to
    // are destroyed.
    ThreadPool pool_;
};
