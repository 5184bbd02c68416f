#include "chunkflow/transfer/chunk_stream.hpp"
#include "chunkflow/transfer/progress.hpp"

#include <fstream>

namespace chunkflow::transfer {
namespace fs = std::filesystem;

ChunkStream::ChunkStream(fs::path path, std::size_t chunk_size, ProgressTracker* progress, SourceOpener opener)
    : path_(std::move(path)),
      chunk_size_(chunk_size),
      progress_(progress),
      opener_(std::move(opener)) {}

Result<void> ChunkStream::open() {
    if (opened_) {
        return Err<void>(std::string("Chunk stream already consumed: ") + path_.string());
    }
    if (chunk_size_ == 0) {
        return Err<void>(std::string("chunk_size must be > 0"));
    }

    if (opener_) {
        input_ = opener_(path_);
    } else {
        input_ = std::make_unique<std::ifstream>(path_, std::ios::binary);
    }
    if (!input_ || !*input_) {
        input_.reset();
        return Err<void>(std::string("Failed to open source file: ") + path_.string());
    }

    buffer_.resize(chunk_size_);
    opened_ = true;
    return Ok();
}

Result<bool> ChunkStream::next(Chunk& chunk) {
    if (!opened_) {
        return Err<bool, std::string>("Chunk stream read before open: " + path_.string());
    }
    if (exhausted_) {
        return Ok(false);
    }

    input_->read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
    const auto count = static_cast<std::size_t>(input_->gcount());
    if (input_->bad()) {
        exhausted_ = true;
        input_.reset();
        return Err<bool, std::string>("Read error in " + path_.string() + " at offset " +
                                      std::to_string(bytes_read_));
    }

    if (count == 0) {
        exhausted_ = true;
        input_.reset();
        return Ok(false);
    }

    chunk.data = buffer_.data();
    chunk.size = count;
    chunk.offset = bytes_read_;
    bytes_read_ += count;

    if (progress_) {
        progress_->advance(count);
    }
    if (input_->eof()) {
        exhausted_ = true;
        input_.reset();
    }
    return Ok(true);
}

} // namespace chunkflow::transfer
