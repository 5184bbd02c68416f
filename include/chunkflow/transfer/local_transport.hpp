#pragma once

#include "chunkflow/transfer/integrity.hpp"
#include "chunkflow/transfer/transport.hpp"

#include <filesystem>
#include <optional>

namespace chunkflow::transfer {

/**
 * @brief Transport that mirrors items into a directory on disk
 *
 * Destinations are relative paths below the root. Data is written to a
 * ".part" sibling and renamed into place once the stream is exhausted.
 * head() reports Content-Length and, unless disabled, the checksum header
 * for @p exposed_digest so validation can run at full strength.
 */
class LocalTransport : public Transport {
public:
    explicit LocalTransport(std::filesystem::path root,
                            std::optional<DigestAlgorithm> exposed_digest = DigestAlgorithm::Md5);

    Result<TransportResponse> put_stream(const std::string& destination,
                                         ChunkStream& body,
                                         const HeaderMap& headers,
                                         std::uint64_t content_length) override;

    Result<TransportResponse> head(const std::string& destination) override;

    [[nodiscard]] std::string describe() const override;

    /// Absolute location of @p destination, or nullopt if it escapes the root.
    [[nodiscard]] std::optional<std::filesystem::path> resolve(const std::string& destination) const;

private:
    std::filesystem::path root_;
    std::optional<DigestAlgorithm> exposed_digest_;
};

} // namespace chunkflow::transfer
