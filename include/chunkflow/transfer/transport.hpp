#pragma once

#include "chunkflow/core/result.hpp"
#include "chunkflow/transfer/chunk_stream.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace chunkflow::transfer {

using HeaderMap = std::map<std::string, std::string>;

struct TransportResponse {
    int status_code = 0;
    std::string body;
    HeaderMap headers;

    /// Case-insensitive lookup; HTTP header names are not case-sensitive.
    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;

    /// Parsed Content-Length, if present and numeric.
    [[nodiscard]] std::optional<std::uint64_t> content_length() const;
};

inline bool is_success_status(int status_code) {
    return status_code == 200 || status_code == 201;
}

inline bool is_retryable_status(int status_code) {
    return status_code >= 500 && status_code <= 599;
}

/**
 * @brief Remote store adapter
 *
 * An error Result means the request never produced a response
 * (resolve/connect/timeout/reset); the retry layer treats it as retryable.
 * Any response, whatever its status, is returned as a value.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /// Sends the remaining chunks of @p body as one request of @p content_length bytes.
    virtual Result<TransportResponse> put_stream(const std::string& destination,
                                                 ChunkStream& body,
                                                 const HeaderMap& headers,
                                                 std::uint64_t content_length) = 0;

    virtual Result<TransportResponse> head(const std::string& destination) = 0;

    /// Short name for logs ("http://host:port/repo", "local:/mnt/mirror").
    [[nodiscard]] virtual std::string describe() const = 0;
};

} // namespace chunkflow::transfer
