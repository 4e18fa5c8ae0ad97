#pragma once

#include <openssl/ssl.h>
#include <memory>
#include <string>

struct SslDeleter
{
    void operator()(SSL *ssl) const
    {
        if (ssl)
        {
            SSL_free(ssl);
        }
    }
};

struct SslCtxDeleter
{
    void operator()(SSL_CTX *ctx) const
    {
        if (ctx)
        {
            SSL_CTX_free(ctx);
        }
    }
};

using SslPtr = std::unique_ptr<SSL, SslDeleter>;
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;

// Loads the OpenSSL error strings and algorithms once per process.
void init_openssl();

// Returns the queued OpenSSL errors as one line, clearing the queue.
std::string openssl_error_string();

// Builds a server context with the PEM certificate and key.
// Throws std::runtime_error when either file cannot be loaded.
SslCtxPtr make_server_context(const std::string &cert_path, const std::string &key_path);

// Builds a client context. Peer verification is enabled when `ca_path`
// loads; `verified` reports which mode was chosen.
SslCtxPtr make_client_context(const std::string &ca_path, bool &verified);

// Writes the whole buffer, retrying on WANT_READ/WANT_WRITE.
bool tls_write_all(SSL *ssl, const char *data, std::size_t len);
