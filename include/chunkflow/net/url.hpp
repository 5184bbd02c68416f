#pragma once

#include "chunkflow/core/result.hpp"

#include <cstdint>
#include <string>

namespace chunkflow {
namespace net {

/**
 * @brief Parsed absolute http(s) URL
 *
 * Only what an upload client needs: no query strings, no fragments,
 * no userinfo (credentials travel in the Authorization header).
 */
struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string path;     // Always starts with '/'

    bool is_tls() const { return scheme == "https"; }

    /// Value for the Host header; the port is omitted when it is the default.
    std::string host_header() const;

    std::string to_string() const;
};

Result<Url> parse_url(const std::string& text);

/// Joins path segments with single slashes ("a/", "/b" -> "a/b").
std::string join_path(const std::string& left, const std::string& right);

/// Percent-encodes everything outside RFC 3986 unreserved characters and '/'.
std::string encode_path(const std::string& path);

} // namespace net
} // namespace chunkflow
