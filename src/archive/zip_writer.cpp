#include "chunkflow/archive/zip_writer.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

namespace chunkflow::archive {
namespace fs = std::filesystem;

namespace {

ZipWriter::Status io_error(std::string message) {
    return Err<void>(ZipError{ErrorKind::IoError, std::move(message)});
}

std::string describe(::archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

struct EntryDeleter {
    void operator()(archive_entry* entry) const { archive_entry_free(entry); }
};

} // namespace

Result<std::unique_ptr<ZipWriter>> ZipWriter::create(const fs::path& path,
                                                     CompressionMethod method,
                                                     int compression_level) {
    std::unique_ptr<ZipWriter> writer(new ZipWriter(path, method));
    ::archive* a = writer->archive_;
    if (!a) {
        return Err<std::unique_ptr<ZipWriter>>(std::string("archive_write_new failed"));
    }

    if (archive_write_set_format_zip(a) != ARCHIVE_OK) {
        return Err<std::unique_ptr<ZipWriter>>("Cannot select ZIP format: " + describe(a));
    }
    if (archive_write_set_format_option(a, "zip", "zip64", "1") != ARCHIVE_OK) {
        return Err<std::unique_ptr<ZipWriter>>("Cannot force ZIP64: " + describe(a));
    }
    const char* compression = method == CompressionMethod::Deflate ? "deflate" : "store";
    if (archive_write_set_format_option(a, "zip", "compression", compression) != ARCHIVE_OK) {
        return Err<std::unique_ptr<ZipWriter>>("Cannot select compression: " + describe(a));
    }
    if (method == CompressionMethod::Deflate && compression_level >= 0) {
        const auto level = std::to_string(compression_level);
        const int rc = archive_write_set_format_option(a, "zip", "compression-level", level.c_str());
        if (rc == ARCHIVE_WARN) {
            spdlog::warn("libarchive ignored compression level {}: {}", compression_level, describe(a));
        } else if (rc != ARCHIVE_OK) {
            return Err<std::unique_ptr<ZipWriter>>("Invalid compression level " + level + ": " + describe(a));
        }
    }

    // Unblocked output keeps archive_filter_bytes() equal to the file size.
    archive_write_set_bytes_per_block(a, 0);
    if (archive_write_open_filename(a, path.string().c_str()) != ARCHIVE_OK) {
        return Err<std::unique_ptr<ZipWriter>>("Failed to create archive " + path.string() + ": " + describe(a));
    }
    return Ok(std::move(writer));
}

ZipWriter::ZipWriter(fs::path path, CompressionMethod method)
    : path_(std::move(path)),
      method_(method),
      archive_(archive_write_new()) {}

ZipWriter::~ZipWriter() {
    if (!archive_) {
        return;
    }
    if (!closed_) {
        // Whatever is on disk is partial; skip the central directory.
        archive_write_fail(archive_);
    }
    archive_write_free(archive_);
}

std::uint64_t ZipWriter::offset() const {
    if (closed_) {
        return final_size_;
    }
    const auto written = archive_filter_bytes(archive_, -1);
    return written < 0 ? 0 : static_cast<std::uint64_t>(written);
}

ZipWriter::Status ZipWriter::ready() const {
    if (closed_) {
        return io_error("Archive already closed: " + path_.string());
    }
    if (failed_) {
        return io_error("Archive is unusable after an earlier failure: " + path_.string());
    }
    return Ok<ZipError>();
}

ZipWriter::Status ZipWriter::broken(ErrorKind kind, std::string message) {
    failed_ = true;
    return Err<void>(ZipError{kind, std::move(message)});
}

ZipWriter::Status ZipWriter::begin_entry(const std::string& name, std::uint64_t declared_size, std::time_t modified) {
    if (auto ok = ready(); ok.is_error()) {
        return ok;
    }
    if (current_) {
        return io_error("Entry still open: " + current_->info.name);
    }
    if (name.empty() || name.size() > 0xFFFF) {
        return io_error("Invalid entry name: '" + name + "'");
    }

    OpenEntry entry;
    entry.info.name = name;
    entry.info.size = declared_size;
    // libarchive stores empty entries uncompressed whatever was requested.
    entry.info.method = declared_size == 0 ? CompressionMethod::Stored : method_;
    entry.modified = modified == 0 ? std::time(nullptr) : modified;
    entry.start = offset();
    current_ = std::move(entry);
    return Ok<ZipError>();
}

ZipWriter::Status ZipWriter::commit_header() {
    std::unique_ptr<archive_entry, EntryDeleter> header(archive_entry_new());
    archive_entry_set_pathname_utf8(header.get(), current_->info.name.c_str());
    archive_entry_set_size(header.get(), static_cast<la_int64_t>(current_->info.size));
    archive_entry_set_filetype(header.get(), AE_IFREG);
    archive_entry_set_perm(header.get(), 0644);
    archive_entry_set_mtime(header.get(), current_->modified, 0);

    const int rc = archive_write_header(archive_, header.get());
    if (rc == ARCHIVE_WARN) {
        spdlog::warn("Header for {}: {}", current_->info.name, describe(archive_));
    } else if (rc != ARCHIVE_OK) {
        return broken(ErrorKind::IoError, "Failed to write header for " + current_->info.name + ": " + describe(archive_));
    }
    current_->committed = true;
    return Ok<ZipError>();
}

ZipWriter::Status ZipWriter::write(const void* data, std::size_t len) {
    if (auto ok = ready(); ok.is_error()) {
        return ok;
    }
    if (!current_) {
        return io_error("write() outside an entry");
    }
    if (current_->streamed + len > current_->info.size) {
        return broken(ErrorKind::ArchiveEntryCorrupt,
                      current_->info.name + ": more data than the declared " +
                          std::to_string(current_->info.size) + " bytes");
    }
    if (len == 0) {
        return Ok<ZipError>();
    }
    if (!current_->committed) {
        if (auto res = commit_header(); res.is_error()) {
            return res;
        }
    }

    const auto* bytes = static_cast<const char*>(data);
    std::size_t remaining = len;
    while (remaining > 0) {
        const la_ssize_t n = archive_write_data(archive_, bytes, remaining);
        if (n <= 0) {
            return broken(ErrorKind::IoError, "Write failed in " + current_->info.name + ": " + describe(archive_));
        }
        bytes += n;
        remaining -= static_cast<std::size_t>(n);
    }
    current_->streamed += len;
    return Ok<ZipError>();
}

ZipWriter::Status ZipWriter::end_entry() {
    if (auto ok = ready(); ok.is_error()) {
        return ok;
    }
    if (!current_) {
        return io_error("end_entry() outside an entry");
    }
    if (current_->streamed != current_->info.size) {
        return broken(ErrorKind::ArchiveEntryCorrupt,
                      current_->info.name + ": streamed " + std::to_string(current_->streamed) +
                          " bytes, declared " + std::to_string(current_->info.size));
    }
    if (!current_->committed) {
        if (auto res = commit_header(); res.is_error()) {
            return res;
        }
    }
    if (archive_write_finish_entry(archive_) < ARCHIVE_WARN) {
        return broken(ErrorKind::IoError, "Failed to finish " + current_->info.name + ": " + describe(archive_));
    }

    WrittenEntry info = std::move(current_->info);
    info.stored_bytes = offset() - current_->start;
    current_.reset();
    entries_.push_back(std::move(info));
    return Ok<ZipError>();
}

ZipWriter::Status ZipWriter::abort_entry() {
    if (!current_) {
        return Ok<ZipError>();
    }
    if (current_->committed) {
        const auto name = current_->info.name;
        current_.reset();
        return broken(ErrorKind::IoError, "Cannot roll back " + name + ": data already written to " + path_.string());
    }
    spdlog::debug("Dropped entry {} before its header was written", current_->info.name);
    current_.reset();
    return Ok<ZipError>();
}

ZipWriter::Status ZipWriter::close() {
    if (auto ok = ready(); ok.is_error()) {
        return ok;
    }
    if (current_) {
        return io_error("Cannot close with entry open: " + current_->info.name);
    }
    if (archive_write_close(archive_) != ARCHIVE_OK) {
        return broken(ErrorKind::IoError, "Failed to finalize " + path_.string() + ": " + describe(archive_));
    }
    final_size_ = offset();
    closed_ = true;
    return Ok<ZipError>();
}

} // namespace chunkflow::archive
