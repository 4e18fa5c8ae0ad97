#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "utils.hpp"

// Returns true for loopback, RFC 1918, link-local and wildcard addresses.
bool is_private_ip(const std::string &ip);

// Picks the origin address from proxy headers (first public entry), then the
// peer host, then "unknown". `headers` is a JSON object of lower-case names.
std::string extract_client_ip(const nlohmann::json &headers, const std::string &peer_address);

// Resolves when the request was generated from client or proxy timing
// headers; falls back to `received` when none parse.
TimePoint resolve_generation_time(const nlohmann::json &headers, TimePoint received);

// Strips ":port" from an "ip:port" peer string.
std::string peer_host(const std::string &peer);
