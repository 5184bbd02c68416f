#pragma once

#include "chunkflow/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace chunkflow::transfer {

enum class DigestAlgorithm {
    Md5,
    Sha1,
    Sha256
};

const char* to_string(DigestAlgorithm algorithm);
Result<DigestAlgorithm> parse_digest_algorithm(const std::string& name);

/// Header carrying this digest on artifact repositories (X-Checksum-Md5, ...).
std::string checksum_header_name(DigestAlgorithm algorithm);

/**
 * @brief Incremental digest over an OpenSSL EVP context
 *
 * Memory use is independent of input length. digest() finalizes the
 * context; the hasher must be reset() before it is fed again.
 */
class StreamHasher {
public:
    explicit StreamHasher(DigestAlgorithm algorithm = DigestAlgorithm::Md5);
    ~StreamHasher();

    StreamHasher(const StreamHasher&) = delete;
    StreamHasher& operator=(const StreamHasher&) = delete;

    Result<void> reset();
    Result<void> update(const void* data, std::size_t len);
    Result<std::string> digest();

    [[nodiscard]] DigestAlgorithm algorithm() const noexcept { return algorithm_; }

private:
    struct Context;

    DigestAlgorithm algorithm_;
    std::unique_ptr<Context> context_;
};

enum class ValidationStrength {
    None,     ///< Nothing could be compared (remote exposes neither size nor hash)
    Partial,  ///< Size compared, remote hash unavailable
    Full      ///< Size and hash compared
};

const char* to_string(ValidationStrength strength);

struct ValidationResult {
    bool passed = false;
    ValidationStrength strength = ValidationStrength::None;
    std::string detail;
};

class IntegrityValidator {
public:
    static constexpr std::size_t kReadBufferSize = 64 * 1024;

    explicit IntegrityValidator(DigestAlgorithm algorithm = DigestAlgorithm::Md5);

    /// Hex digest of the remaining content of @p input.
    Result<std::string> digest(std::istream& input) const;

    Result<std::string> digest_file(const std::filesystem::path& path) const;

    /**
     * @brief Compare local and remote views of one transferred item
     *
     * A size mismatch always fails. A hash mismatch fails when the remote
     * hash is known; without it the check degrades to Partial.
     */
    [[nodiscard]] ValidationResult validate(std::uint64_t local_size,
                                            const std::string& local_hash,
                                            std::uint64_t remote_size,
                                            const std::optional<std::string>& remote_hash) const;

    [[nodiscard]] DigestAlgorithm algorithm() const noexcept { return algorithm_; }

private:
    DigestAlgorithm algorithm_;
};

} // namespace chunkflow::transfer
