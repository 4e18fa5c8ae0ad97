#include "Tls.hpp"

#include <openssl/err.h>
#include <mutex>
#include <stdexcept>

void init_openssl()
{
    static std::once_flag once;
    std::call_once(once, []()
                   {
                       SSL_library_init();
                       SSL_load_error_strings();
                       OpenSSL_add_all_algorithms(); });
}

std::string openssl_error_string()
{
    std::string out;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0)
    {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty())
            out += "; ";
        out += buf;
    }
    return out;
}

SslCtxPtr make_server_context(const std::string &cert_path, const std::string &key_path)
{
    init_openssl();
    SslCtxPtr ctx(SSL_CTX_new(TLS_server_method()));
    if (!ctx)
        throw std::runtime_error("Failed to create SSL_CTX: " + openssl_error_string());

    if (SSL_CTX_use_certificate_file(ctx.get(), cert_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        throw std::runtime_error("Failed to load certificate " + cert_path + ": " + openssl_error_string());
    if (SSL_CTX_use_PrivateKey_file(ctx.get(), key_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        throw std::runtime_error("Failed to load private key " + key_path + ": " + openssl_error_string());
    if (SSL_CTX_check_private_key(ctx.get()) != 1)
        throw std::runtime_error("Private key does not match certificate: " + openssl_error_string());

    SSL_CTX_set_ecdh_auto(ctx.get(), 1);
    return ctx;
}

SslCtxPtr make_client_context(const std::string &ca_path, bool &verified)
{
    init_openssl();
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx)
        throw std::runtime_error("Failed to create SSL_CTX: " + openssl_error_string());

    verified = SSL_CTX_load_verify_locations(ctx.get(), ca_path.c_str(), nullptr) == 1;
    if (verified)
    {
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
    }
    else
    {
        // Development fallback when no local certificate is available.
        ERR_clear_error();
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
    }
    return ctx;
}

bool tls_write_all(SSL *ssl, const char *data, std::size_t len)
{
    std::size_t sent = 0;
    while (sent < len)
    {
        int ret = SSL_write(ssl, data + sent, static_cast<int>(len - sent));
        if (ret <= 0)
        {
            int err = SSL_get_error(ssl, ret);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                continue;
            return false;
        }
        sent += static_cast<std::size_t>(ret);
    }
    return true;
}
