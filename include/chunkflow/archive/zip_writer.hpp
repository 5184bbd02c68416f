#pragma once

#include "chunkflow/core/error.hpp"
#include "chunkflow/core/result.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct archive;

namespace chunkflow::archive {

enum class CompressionMethod {
    Stored,
    Deflate
};

/// Writer/reader failure; kind is ArchiveEntryCorrupt or IoError.
struct ZipError {
    ErrorKind kind = ErrorKind::IoError;
    std::string message;
};

struct WrittenEntry {
    std::string name;
    std::uint64_t size = 0;
    /// Bytes the entry occupies in the container, headers included.
    std::uint64_t stored_bytes = 0;
    CompressionMethod method = CompressionMethod::Stored;
};

/**
 * @brief Streaming ZIP64 writer on top of libarchive
 *
 * Each entry declares its uncompressed size up front. write() rejects
 * bytes beyond the declared size and end_entry() rejects an entry that
 * came up short; both report ArchiveEntryCorrupt and leave the writer
 * unusable.
 *
 * The entry header is committed with the first write() (or by end_entry()
 * for an empty entry). Until then abort_entry() drops the entry without a
 * trace; afterwards the container cannot be rolled back, and abort_entry()
 * fails and leaves the writer unusable. A committed entry stays open, so a caller may instead supply the
 * remaining entry_bytes()..declared_size bytes and end it normally.
 *
 * Nothing is valid until close() has written the central directory.
 */
class ZipWriter {
public:
    using Status = Result<void, ZipError>;

    /// Creates (truncates) the container; a failure here is always an I/O error.
    static Result<std::unique_ptr<ZipWriter>> create(const std::filesystem::path& path,
                                                     CompressionMethod method = CompressionMethod::Stored,
                                                     int compression_level = -1);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    Status begin_entry(const std::string& name, std::uint64_t declared_size, std::time_t modified = 0);
    Status write(const void* data, std::size_t len);
    Status end_entry();
    Status abort_entry();
    Status close();

    [[nodiscard]] bool in_entry() const noexcept { return current_.has_value(); }
    [[nodiscard]] bool entry_committed() const noexcept { return current_ && current_->committed; }
    /// Bytes of the open entry already handed to the container.
    [[nodiscard]] std::uint64_t entry_bytes() const noexcept { return current_ ? current_->streamed : 0; }
    [[nodiscard]] bool failed() const noexcept { return failed_; }
    [[nodiscard]] bool closed() const noexcept { return closed_; }
    [[nodiscard]] CompressionMethod method() const noexcept { return method_; }
    [[nodiscard]] std::uint64_t offset() const;
    [[nodiscard]] const std::vector<WrittenEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    struct OpenEntry {
        WrittenEntry info;
        std::time_t modified = 0;
        std::uint64_t streamed = 0;
        std::uint64_t start = 0;
        bool committed = false;
    };

    ZipWriter(std::filesystem::path path, CompressionMethod method);

    Status commit_header();
    Status ready() const;
    Status broken(ErrorKind kind, std::string message);

    std::filesystem::path path_;
    CompressionMethod method_;
    ::archive* archive_ = nullptr;
    std::vector<WrittenEntry> entries_;
    std::optional<OpenEntry> current_;
    std::uint64_t final_size_ = 0;
    bool closed_ = false;
    bool failed_ = false;
};

} // namespace chunkflow::archive
