#include "TrackerServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <openssl/err.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

#include "Logging.hpp"

using json = nlohmann::json;
using namespace errors;

TrackerServer::TrackerServer(const ServerConfig &config, SslCtxPtr ctx, RequestHandler &handler, Metrics &metrics)
    : config_(config),
      ctx_(std::move(ctx)),
      handler_(handler),
      metrics_(metrics),
      pool_(config.worker_threads)
{
}

void TrackerServer::listen()
{
    if (!epoll_.valid())
        throw std::runtime_error(std::string("epoll_create1 failed: ") + std::strerror(errno));

    listen_fd_.reset(::socket(AF_INET, SOCK_STREAM, 0));
    if (!listen_fd_.valid())
        throw std::runtime_error(std::string("socket failed: ") + std::strerror(errno));

    int opt = 1;
    if (::setsockopt(listen_fd_.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        throw std::runtime_error(std::string("setsockopt failed: ") + std::strerror(errno));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(config_.port);
    if (::bind(listen_fd_.get(), reinterpret_cast<sockaddr *>(&address), sizeof(address)) < 0)
        throw std::runtime_error(std::string("bind failed: ") + std::strerror(errno));
    if (::listen(listen_fd_.get(), 128) < 0)
        throw std::runtime_error(std::string("listen failed: ") + std::strerror(errno));
    if (!listen_fd_.set_nonblocking())
        throw std::runtime_error(std::string("set_nonblocking failed: ") + std::strerror(errno));
    if (!epoll_.add(listen_fd_.get(), EPOLLIN))
        throw std::runtime_error(std::string("epoll add failed: ") + std::strerror(errno));

    Logger::log_event(LogLevel::Info, "server_listen", "Server listening",
                      {{"port", config_.port}, {"workers", pool_.size()}});
}

void TrackerServer::run()
{
    std::vector<epoll_event> events(64);
    while (!stopping_.load(std::memory_order_acquire))
    {
        drain_outgoing_and_arm();
        int n = epoll_.wait(events, 100);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            Logger::log_event(LogLevel::Error, "epoll_wait_error", "epoll_wait failed", {{"detail", std::strerror(errno)}});
            break;
        }

        for (int i = 0; i < n; ++i)
        {
            int fd = events[i].data.fd;
            if (fd == listen_fd_.get())
                accept_clients();
            else
                handle_client_event(fd, events[i].events);
        }
    }

    pool_.shutdown();
    std::vector<int> open_fds;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto &kv : connections_)
            open_fds.push_back(kv.first);
    }
    for (int fd : open_fds)
        close_connection(fd, ERR_INTERNAL, "Server shutting down.");
}

void TrackerServer::accept_clients()
{
    while (true)
    {
        sockaddr_in address{};
        socklen_t addrlen = sizeof(address);
        int client_fd = ::accept(listen_fd_.get(), reinterpret_cast<sockaddr *>(&address), &addrlen);
        if (client_fd < 0)
        {
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                Logger::log_event(LogLevel::Warn, "accept_error", "accept failed", {{"detail", std::strerror(errno)}});
            break;
        }

        Fd client_handle(client_fd);
        if (!client_handle.set_nonblocking())
        {
            Logger::log_event(LogLevel::Warn, "accept_error", "Could not make client socket non-blocking", {{"fd", client_fd}});
            continue;
        }

        char client_ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &address.sin_addr, client_ip, sizeof(client_ip));
        std::string peer = std::string(client_ip) + ":" + std::to_string(ntohs(address.sin_port));

        SslPtr ssl(SSL_new(ctx_.get()));
        if (!ssl)
        {
            Logger::log_event(LogLevel::Warn, "accept_error", "SSL_new failed", {{"peer", peer}, {"detail", openssl_error_string()}});
            continue;
        }
        SSL_set_fd(ssl.get(), client_handle.get());
        SSL_set_accept_state(ssl.get());

        Connection conn;
        conn.id = next_connection_id_++;
        conn.fd = std::move(client_handle);
        conn.ssl = std::move(ssl);
        conn.peer = peer;
        conn.decoder = FrameDecoder(config_.max_frame_size);
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_[client_fd] = std::move(conn);
        }

        epoll_.add(client_fd, EPOLLIN | EPOLLOUT | EPOLLET);
        metrics_.inc_connections();
        Logger::log_event(LogLevel::Info, "connection_open", "New client connected", {{"fd", client_fd}, {"peer", peer}});
    }
}

void TrackerServer::handle_client_event(int fd, uint32_t evs)
{
    // Only this thread inserts or erases connections, so the pointer stays
    // valid until close_connection below.
    Connection *conn_ptr = nullptr;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(fd);
        if (it != connections_.end())
            conn_ptr = &it->second;
    }
    if (!conn_ptr)
        return;
    Connection &conn = *conn_ptr;

    if (evs & (EPOLLHUP | EPOLLERR))
    {
        Logger::log_event(LogLevel::Warn, "epoll_error", "EPOLL hangup/error", {{"fd", fd}, {"events", static_cast<int>(evs)}});
        close_connection(fd);
        return;
    }

    if (!conn.handshaked && !complete_handshake(conn, fd))
        return;

    if ((evs & EPOLLIN) && !read_frames(conn, fd))
        return;

    if (evs & EPOLLOUT)
    {
        SendResult res = send_buffered(conn);
        if (res == SendResult::Error)
        {
            close_connection(fd);
            return;
        }
        if (res == SendResult::Ok)
            epoll_.mod(fd, EPOLLIN | EPOLLET);
    }
}

bool TrackerServer::complete_handshake(Connection &conn, int fd)
{
    int ret = SSL_accept(conn.ssl.get());
    if (ret == 1)
    {
        conn.handshaked = true;
        Logger::log_event(LogLevel::Info, "tls_handshake", "Handshake complete", {{"fd", fd}, {"peer", conn.peer}});
        uint32_t events = EPOLLIN | EPOLLET;
        if (!conn.send_buffer.empty())
            events |= EPOLLOUT;
        epoll_.mod(fd, events);
        return true;
    }

    int err = SSL_get_error(conn.ssl.get(), ret);
    if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE)
    {
        Logger::log_event(LogLevel::Warn, "tls_handshake_fail", "TLS handshake failed",
                          {{"fd", fd}, {"peer", conn.peer}, {"ssl_error", err}, {"detail", openssl_error_string()}});
        close_connection(fd);
    }
    return false;
}

bool TrackerServer::read_frames(Connection &conn, int fd)
{
    while (true)
    {
        char buffer[4096];
        int bytes_read = SSL_read(conn.ssl.get(), buffer, sizeof(buffer));
        if (bytes_read <= 0)
        {
            int err = SSL_get_error(conn.ssl.get(), bytes_read);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                return true;
            if (err == SSL_ERROR_ZERO_RETURN)
            {
                Logger::log_event(LogLevel::Info, "peer_close", "Peer closed TLS", {{"fd", fd}});
                close_connection(fd);
            }
            else
            {
                Logger::log_event(LogLevel::Warn, "ssl_read_error", "SSL_read failed",
                                  {{"fd", fd}, {"ssl_error", err}, {"detail", openssl_error_string()}});
                close_connection(fd, ERR_INTERNAL, "TLS read error.");
            }
            return false;
        }

        conn.decoder.feed(buffer, static_cast<std::size_t>(bytes_read));
        std::string payload;
        while (true)
        {
            auto status = conn.decoder.next(payload);
            if (status == FrameDecoder::Status::NeedMore)
                break;
            if (status == FrameDecoder::Status::BadLength)
            {
                Logger::log_event(LogLevel::Warn, "frame_length_error", "Frame length invalid",
                                  {{"fd", fd}, {"len", conn.decoder.last_length()}});
                close_connection(fd, ERR_BAD_REQUEST, "Invalid frame length.");
                return false;
            }

            json request;
            try
            {
                request = json::parse(payload);
            }
            catch (const json::parse_error &e)
            {
                Logger::log_event(LogLevel::Warn, "json_parse_error", "Failed to parse JSON request",
                                  {{"fd", fd}, {"error", ERR_JSON_PARSE}, {"detail", e.what()}});
                close_connection(fd, ERR_JSON_PARSE, "JSON parse error.");
                return false;
            }

            std::string peer = conn.peer;
            std::uint64_t id = conn.id;
            bool accepted = pool_.post([this, fd, id, peer, request]()
                                       { enqueue_response(fd, id, handler_.handle(request, peer)); });
            if (!accepted)
                enqueue_response(fd, id, make_failure(ERR_INTERNAL, "Server shutting down."));
        }
    }
}

void TrackerServer::enqueue_response(int fd, std::uint64_t connection_id, const json &j)
{
    responses_.push(fd, connection_id, frame_message(j.dump()));
}

void TrackerServer::drain_outgoing_and_arm()
{
    std::lock_guard<std::mutex> lock(connections_mutex_);
    std::size_t dropped = responses_.dispatch(connections_, [this](int fd, Connection &conn, const std::string &data)
                                              {
                                                  conn.send_buffer.append(data);
                                                  epoll_.mod(fd, EPOLLIN | EPOLLET | EPOLLOUT); });
    if (dropped > 0)
        Logger::log_event(LogLevel::Debug, "response_dropped", "Discarded responses for closed connections", {{"count", dropped}});
}

TrackerServer::SendResult TrackerServer::send_buffered(Connection &conn)
{
    while (!conn.send_buffer.empty())
    {
        int ret = SSL_write(conn.ssl.get(), conn.send_buffer.data(), static_cast<int>(conn.send_buffer.size()));
        if (ret > 0)
        {
            conn.send_buffer.erase(0, static_cast<std::size_t>(ret));
            continue;
        }
        int err = SSL_get_error(conn.ssl.get(), ret);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
            return SendResult::Pending;
        return SendResult::Error;
    }
    return SendResult::Ok;
}

void TrackerServer::send_disconnect(SSL *ssl, const char *error, const char *message)
{
    if (!ssl)
        return;
    json resp;
    resp["action"] = "disconnect";
    resp["status"] = "fail";
    if (error)
        resp["error"] = error;
    if (message)
        resp["message"] = message;
    std::string framed = frame_message(resp.dump());
    // Best effort on a socket that is about to close: stop at the first
    // write that does not complete.
    const char *data = framed.data();
    std::size_t remaining = framed.size();
    while (remaining > 0)
    {
        int written = SSL_write(ssl, data, static_cast<int>(remaining));
        if (written <= 0)
        {
            ERR_clear_error();
            break;
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

void TrackerServer::close_connection(int fd, const char *error, const char *message)
{
    bool had_connection = false;
    std::string peer_info;
    epoll_.del(fd);
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(fd);
        if (it != connections_.end())
        {
            had_connection = true;
            peer_info = it->second.peer;
            if ((error || message) && it->second.handshaked)
                send_disconnect(it->second.ssl.get(), error, message);
            if (it->second.ssl && it->second.handshaked)
                SSL_shutdown(it->second.ssl.get());
            connections_.erase(it); // Fd/SslPtr destructors handle cleanup.
        }
    }
    if (!had_connection)
        return;

    metrics_.dec_connections();
    json extra = {{"fd", fd}, {"peer", peer_info}};
    if (error)
        extra["error"] = error;
    if (message)
        extra["reason"] = message;
    Logger::log_event(LogLevel::Info, "connection_close", "Client disconnected", extra);
}
