#pragma once

#include "chunkflow/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <vector>

namespace chunkflow::transfer {

class ProgressTracker;

/// Opens a source for reading; a null or failed stream means it cannot be opened.
using SourceOpener = std::function<std::unique_ptr<std::istream>(const std::filesystem::path&)>;

/// View into the stream's buffer; valid until the next call to next().
struct Chunk {
    const std::uint8_t* data = nullptr;
    std::size_t size = 0;
    std::uint64_t offset = 0;
};

/**
 * @brief Lazy, finite sequence of fixed-size reads over one file
 *
 * Holds at most one chunk in memory. The stream is single-use: once it has
 * been opened it cannot be rewound, and a retry builds a new ChunkStream.
 * Every byte handed out is reported to the optional ProgressTracker.
 */
class ChunkStream {
public:
    ChunkStream(std::filesystem::path path,
                std::size_t chunk_size,
                ProgressTracker* progress = nullptr,
                SourceOpener opener = {});

    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;

    Result<void> open();

    /// Fills @p chunk and returns true, or returns false once the file is exhausted.
    Result<bool> next(Chunk& chunk);

    [[nodiscard]] std::uint64_t bytes_read() const noexcept { return bytes_read_; }
    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }

private:
    std::filesystem::path path_;
    std::size_t chunk_size_;
    ProgressTracker* progress_;
    SourceOpener opener_;

    std::unique_ptr<std::istream> input_;
    std::vector<std::uint8_t> buffer_;
    std::uint64_t bytes_read_ = 0;
    bool opened_ = false;
    bool exhausted_ = false;
};

} // namespace chunkflow::transfer
