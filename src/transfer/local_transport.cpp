#include "chunkflow/transfer/local_transport.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace chunkflow::transfer {
namespace fs = std::filesystem;

namespace {

TransportResponse make_response(int status_code, std::string body) {
    TransportResponse response;
    response.status_code = status_code;
    response.body = std::move(body);
    return response;
}

} // namespace

LocalTransport::LocalTransport(fs::path root, std::optional<DigestAlgorithm> exposed_digest)
    : root_(std::move(root)),
      exposed_digest_(exposed_digest) {}

std::string LocalTransport::describe() const {
    return "local:" + root_.string();
}

std::optional<fs::path> LocalTransport::resolve(const std::string& destination) const {
    fs::path relative = fs::path(destination).relative_path().lexically_normal();
    if (relative.empty()) {
        return std::nullopt;
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return std::nullopt;
        }
    }
    return root_ / relative;
}

Result<TransportResponse> LocalTransport::put_stream(const std::string& destination,
                                                     ChunkStream& body,
                                                     const HeaderMap& /*headers*/,
                                                     std::uint64_t content_length) {
    auto target = resolve(destination);
    if (!target) {
        return Ok(make_response(400, "invalid destination path: " + destination));
    }

    std::error_code ec;
    fs::create_directories(target->parent_path(), ec);
    if (ec) {
        return Err<TransportResponse>("Failed to create directory " + target->parent_path().string() +
                                      ": " + ec.message());
    }

    fs::path partial = *target;
    partial += ".part";

    {
        std::ofstream output(partial, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<TransportResponse>("Failed to open " + partial.string() + " for writing");
        }

        Chunk chunk;
        while (true) {
            auto more = body.next(chunk);
            if (more.is_error()) {
                output.close();
                fs::remove(partial, ec);
                return Err<TransportResponse>(more.error());
            }
            if (!more.value()) {
                break;
            }
            output.write(reinterpret_cast<const char*>(chunk.data), static_cast<std::streamsize>(chunk.size));
            if (!output) {
                output.close();
                fs::remove(partial, ec);
                return Err<TransportResponse>("Write failed for " + partial.string());
            }
        }
    }

    if (body.bytes_read() != content_length) {
        spdlog::warn("{}: declared {} bytes, received {}", destination, content_length, body.bytes_read());
    }

    fs::rename(partial, *target, ec);
    if (ec) {
        fs::remove(partial, ec);
        return Err<TransportResponse>("Failed to move " + partial.string() + " into place");
    }
    return Ok(make_response(201, ""));
}

Result<TransportResponse> LocalTransport::head(const std::string& destination) {
    auto target = resolve(destination);
    if (!target) {
        return Ok(make_response(400, ""));
    }

    std::error_code ec;
    if (!fs::is_regular_file(*target, ec)) {
        return Ok(make_response(404, ""));
    }

    const auto size = fs::file_size(*target, ec);
    if (ec) {
        return Err<TransportResponse>("Failed to stat " + target->string() + ": " + ec.message());
    }

    auto response = make_response(200, "");
    response.headers["Content-Length"] = std::to_string(size);
    if (exposed_digest_) {
        auto digest = IntegrityValidator(*exposed_digest_).digest_file(*target);
        if (digest.is_error()) {
            return Err<TransportResponse>(digest.error());
        }
        response.headers[checksum_header_name(*exposed_digest_)] = digest.value();
    }
    return Ok(response);
}

} // namespace chunkflow::transfer
