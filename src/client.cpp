#include <iostream>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <openssl/err.h>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "FdWrapper.hpp"
#include "Framing.hpp"
#include "Tls.hpp"

using json = nlohmann::json;

namespace
{
    constexpr const char *CA_PATH = "config/cert.pem";

    void print_usage(const char *prog)
    {
        std::cerr << "Usage: " << prog << " <SERVER_ADDRESS> <PORT> [--timestamp VALUE] <command> [args]\n"
                  << "\n=== Commands ===\n"
                  << "  buy <user_id> <promotion_id> <product_id> [quantity]   Log a purchase\n"
                  << "  visit <user_id> <page>                                 Log a page visit\n"
                  << "  stats [hours]                                          Totals and recent events\n"
                  << "  health                                                 Health check\n"
                  << "  info                                                   Service information\n";
    }

    std::int64_t parse_int(const std::string &text, const char *what)
    {
        std::size_t used = 0;
        std::int64_t value = 0;
        try
        {
            value = std::stoll(text, &used);
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument(std::string("Invalid ") + what + ": " + text);
        }
        if (used != text.size())
            throw std::invalid_argument(std::string("Invalid ") + what + ": " + text);
        return value;
    }

    double parse_hours(const std::string &text)
    {
        std::size_t used = 0;
        double value = 0;
        try
        {
            value = std::stod(text, &used);
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument("Invalid hours: " + text);
        }
        if (used != text.size())
            throw std::invalid_argument("Invalid hours: " + text);
        return value;
    }

    // Builds the request object from the command words.
    json build_request(const std::vector<std::string> &words, const std::string &timestamp)
    {
        if (words.empty())
            throw std::invalid_argument("Missing command");

        const std::string &cmd = words[0];
        json j;
        if (cmd == "buy" && (words.size() == 4 || words.size() == 5))
        {
            j["action"] = "buy";
            j["user_id"] = parse_int(words[1], "user_id");
            j["promotion_id"] = parse_int(words[2], "promotion_id");
            j["product_id"] = parse_int(words[3], "product_id");
            j["product_quantity"] = words.size() == 5 ? parse_int(words[4], "quantity") : 1;
        }
        else if (cmd == "visit" && words.size() == 3)
        {
            j["action"] = "visit";
            j["user_id"] = parse_int(words[1], "user_id");
            j["page"] = words[2];
        }
        else if (cmd == "stats" && words.size() <= 2)
        {
            j["action"] = "stats";
            if (words.size() == 2)
                j["timeframe_hours"] = parse_hours(words[1]);
        }
        else if ((cmd == "health" || cmd == "info") && words.size() == 1)
        {
            j["action"] = cmd;
        }
        else
        {
            throw std::invalid_argument("Unknown command or wrong arguments: " + cmd);
        }

        if (!timestamp.empty())
            j["headers"] = {{"x-timestamp", timestamp}};
        return j;
    }

    Fd connect_to(const char *host, const char *port)
    {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;     // Allow IPv4 or IPv6.
        hints.ai_socktype = SOCK_STREAM; // TCP stream socket.
        hints.ai_protocol = IPPROTO_TCP;

        addrinfo *result = nullptr;
        int gai_rc = getaddrinfo(host, port, &hints, &result);
        if (gai_rc != 0)
            throw std::runtime_error(std::string("Invalid address / Address not supported: ") + gai_strerror(gai_rc));

        Fd sock;
        for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next)
        {
            Fd candidate(::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol));
            if (!candidate.valid())
                continue;
            if (::connect(candidate.get(), rp->ai_addr, rp->ai_addrlen) == 0)
            {
                sock = std::move(candidate);
                break;
            }
        }
        freeaddrinfo(result);

        if (!sock.valid())
            throw std::runtime_error(std::string("Connection failed to ") + host + ":" + port);
        return sock;
    }

    // Reads until one complete frame arrives.
    json read_response(SSL *ssl)
    {
        FrameDecoder decoder;
        std::string payload;
        while (true)
        {
            auto status = decoder.next(payload);
            if (status == FrameDecoder::Status::Frame)
                return json::parse(payload);
            if (status == FrameDecoder::Status::BadLength)
                throw std::runtime_error("Invalid frame length from server");

            char buffer[2048];
            int bytes = SSL_read(ssl, buffer, sizeof(buffer));
            if (bytes <= 0)
                throw std::runtime_error("Server disconnected: " + openssl_error_string());
            decoder.feed(buffer, static_cast<std::size_t>(bytes));
        }
    }
}

int main(int argc, char *argv[])
{
    if (argc < 4)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::string timestamp;
    std::vector<std::string> words;
    for (int i = 3; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--timestamp" && i + 1 < argc)
            timestamp = argv[++i];
        else
            words.push_back(arg);
    }

    json request;
    try
    {
        request = build_request(words, timestamp);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        Fd sock = connect_to(argv[1], argv[2]);

        bool verified = false;
        SslCtxPtr ctx = make_client_context(CA_PATH, verified);
        if (!verified)
            std::cerr << "Could not load " << CA_PATH << ", skipping verification (development only).\n";

        SslPtr ssl(SSL_new(ctx.get()));
        if (!ssl)
            throw std::runtime_error("Failed to create SSL object: " + openssl_error_string());
        SSL_set_fd(ssl.get(), sock.get());
        if (SSL_connect(ssl.get()) <= 0)
            throw std::runtime_error("TLS handshake failed: " + openssl_error_string());

        std::string framed = frame_message(request.dump());
        if (framed.size() > DEFAULT_MAX_FRAME_SIZE + sizeof(uint32_t))
            throw std::runtime_error("Payload too large to send");
        if (!tls_write_all(ssl.get(), framed.data(), framed.size()))
            throw std::runtime_error("Failed to send request: " + openssl_error_string());

        json response = read_response(ssl.get());
        SSL_shutdown(ssl.get());

        std::cout << response.dump(4) << "\n";
        if (response.value("status", "") != "success")
        {
            std::cerr << "[" << response.value("error", "ERR_UNKNOWN") << "] " << response.value("message", "") << "\n";
            return EXIT_FAILURE;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
