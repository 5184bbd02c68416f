#pragma once

#include "chunkflow/net/url.hpp"
#include "chunkflow/transfer/transport.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace chunkflow {
namespace net {

struct HttpTransportOptions {
    std::string base_url;                 // "https://nexus.example.com"
    std::string path_prefix;              // "repository/raw-hosted" or "generic-local"
    std::string username;
    std::string password;
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{300};
    bool verify_tls = true;
    std::string user_agent = "chunkflow/1.0";
};

/**
 * @brief Transport to an artifact repository over HTTP/1.1
 *
 * One connection per request (Connection: close). The body is streamed
 * from the ChunkStream with Content-Length framing, one chunk in memory at
 * a time. Every network step runs on a private io_context bounded by the
 * connect or read timeout; a step that overruns closes the socket and is
 * reported as a connection-level error.
 *
 * Destination "a/b.bin" maps to <base_url>/<path_prefix>/a/b.bin.
 */
class HttpTransport : public transfer::Transport {
public:
    static Result<std::unique_ptr<HttpTransport>> create(HttpTransportOptions options);

    Result<transfer::TransportResponse> put_stream(const std::string& destination,
                                                   transfer::ChunkStream& body,
                                                   const transfer::HeaderMap& headers,
                                                   std::uint64_t content_length) override;

    Result<transfer::TransportResponse> head(const std::string& destination) override;

    std::string describe() const override;

    /// Full URL a destination is sent to.
    std::string url_for(const std::string& destination) const;

private:
    HttpTransport(HttpTransportOptions options, Url base);

    std::string target_for(const std::string& destination) const;
    std::string authorization() const;

    HttpTransportOptions options_;
    Url base_;
};

/// RFC 4648 base64, used for the Basic Authorization header.
std::string base64_encode(const std::string& input);

} // namespace net
} // namespace chunkflow
