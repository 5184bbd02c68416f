#include "chunkflow/transfer/integrity.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace chunkflow::transfer {
namespace fs = std::filesystem;

namespace {

const EVP_MD* evp_for(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::Md5: return EVP_md5();
        case DigestAlgorithm::Sha1: return EVP_sha1();
        case DigestAlgorithm::Sha256: return EVP_sha256();
    }
    return nullptr;
}

std::string openssl_error(const char* operation) {
    std::ostringstream oss;
    oss << operation << " failed (OpenSSL error " << ERR_get_error() << ")";
    return oss.str();
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

struct StreamHasher::Context {
    EVP_MD_CTX* ctx = nullptr;

    Context() : ctx(EVP_MD_CTX_new()) {}
    ~Context() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

const char* to_string(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::Md5: return "md5";
        case DigestAlgorithm::Sha1: return "sha1";
        case DigestAlgorithm::Sha256: return "sha256";
    }
    return "unknown";
}

Result<DigestAlgorithm> parse_digest_algorithm(const std::string& name) {
    const auto normalized = lowercase(name);
    if (normalized == "md5") {
        return Ok(DigestAlgorithm::Md5);
    }
    if (normalized == "sha1" || normalized == "sha-1") {
        return Ok(DigestAlgorithm::Sha1);
    }
    if (normalized == "sha256" || normalized == "sha-256") {
        return Ok(DigestAlgorithm::Sha256);
    }
    return Err<DigestAlgorithm>(std::string("Unsupported digest algorithm: ") + name);
}

std::string checksum_header_name(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::Md5: return "X-Checksum-Md5";
        case DigestAlgorithm::Sha1: return "X-Checksum-Sha1";
        case DigestAlgorithm::Sha256: return "X-Checksum-Sha256";
    }
    return "X-Checksum";
}

StreamHasher::StreamHasher(DigestAlgorithm algorithm)
    : algorithm_(algorithm), context_(std::make_unique<Context>()) {}

StreamHasher::~StreamHasher() = default;

Result<void> StreamHasher::reset() {
    if (!context_->ctx) {
        return Err<void>(std::string("EVP_MD_CTX_new failed"));
    }
    if (EVP_DigestInit_ex(context_->ctx, evp_for(algorithm_), nullptr) != 1) {
        return Err<void>(openssl_error("EVP_DigestInit_ex"));
    }
    return Ok();
}

Result<void> StreamHasher::update(const void* data, std::size_t len) {
    if (len == 0) {
        return Ok();
    }
    if (EVP_DigestUpdate(context_->ctx, data, len) != 1) {
        return Err<void>(openssl_error("EVP_DigestUpdate"));
    }
    return Ok();
}

Result<std::string> StreamHasher::digest() {
    unsigned char buffer[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context_->ctx, buffer, &length) != 1) {
        return Err<std::string>(openssl_error("EVP_DigestFinal_ex"));
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < length; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(buffer[i]);
    }
    return Ok(hex.str());
}

const char* to_string(ValidationStrength strength) {
    switch (strength) {
        case ValidationStrength::None: return "none";
        case ValidationStrength::Partial: return "partial";
        case ValidationStrength::Full: return "full";
    }
    return "unknown";
}

IntegrityValidator::IntegrityValidator(DigestAlgorithm algorithm)
    : algorithm_(algorithm) {}

Result<std::string> IntegrityValidator::digest(std::istream& input) const {
    StreamHasher hasher(algorithm_);
    if (auto res = hasher.reset(); res.is_error()) {
        return Err<std::string>(res.error());
    }

    std::vector<char> buffer(kReadBufferSize);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        if (auto res = hasher.update(buffer.data(), static_cast<std::size_t>(input.gcount())); res.is_error()) {
            return Err<std::string>(res.error());
        }
    }
    if (input.bad()) {
        return Err<std::string>(std::string("Read error while hashing stream"));
    }
    return hasher.digest();
}

Result<std::string> IntegrityValidator::digest_file(const fs::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(std::string("Failed to open file for hashing: ") + path.string());
    }
    auto result = digest(input);
    if (result.is_error()) {
        return Err<std::string>(path.string() + ": " + result.error());
    }
    return result;
}

ValidationResult IntegrityValidator::validate(std::uint64_t local_size,
                                              const std::string& local_hash,
                                              std::uint64_t remote_size,
                                              const std::optional<std::string>& remote_hash) const {
    ValidationResult result;
    if (local_size != remote_size) {
        result.passed = false;
        result.strength = remote_hash ? ValidationStrength::Full : ValidationStrength::Partial;
        result.detail = "size mismatch: local=" + std::to_string(local_size) +
                        " remote=" + std::to_string(remote_size);
        return result;
    }

    if (!remote_hash || remote_hash->empty()) {
        result.passed = true;
        result.strength = ValidationStrength::Partial;
        result.detail = "size matches (" + std::to_string(local_size) + " bytes); remote hash unavailable";
        return result;
    }

    result.strength = ValidationStrength::Full;
    if (lowercase(local_hash) != lowercase(*remote_hash)) {
        result.passed = false;
        result.detail = std::string(to_string(algorithm_)) + " mismatch: local=" + local_hash +
                        " remote=" + *remote_hash;
        return result;
    }

    result.passed = true;
    result.detail = "size and " + std::string(to_string(algorithm_)) + " match";
    return result;
}

} // namespace chunkflow::transfer
