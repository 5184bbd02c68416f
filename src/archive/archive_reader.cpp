#include "chunkflow/archive/archive_reader.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstring>
#include <memory>

namespace chunkflow::archive {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kReadBufferSize = 64 * 1024;

struct ReadDeleter {
    void operator()(::archive* a) const { archive_read_free(a); }
};

using ReadHandle = std::unique_ptr<::archive, ReadDeleter>;

std::string describe(::archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

Result<ReadHandle> open_zip(const fs::path& container) {
    ReadHandle a(archive_read_new());
    if (!a) {
        return Err<ReadHandle>(std::string("archive_read_new failed"));
    }
    archive_read_support_format_zip(a.get());
    if (archive_read_open_filename(a.get(), container.string().c_str(), kReadBufferSize) != ARCHIVE_OK) {
        return Err<ReadHandle>(container.string() + ": " + describe(a.get()));
    }
    return Ok(std::move(a));
}

std::string entry_name(archive_entry* header) {
    const char* name = archive_entry_pathname_utf8(header);
    if (!name) {
        name = archive_entry_pathname(header);
    }
    return name ? name : "";
}

/// Drains the current entry's data into @p out (or nowhere), returning the byte count.
Result<std::uint64_t> drain(::archive* a, std::string* out) {
    std::uint64_t total = 0;
    char buffer[kReadBufferSize];
    while (true) {
        const la_ssize_t n = archive_read_data(a, buffer, sizeof(buffer));
        if (n == 0) {
            return Ok(total);
        }
        if (n < 0) {
            // libarchive reports a CRC mismatch as ARCHIVE_WARN.
            return Err<std::uint64_t>(describe(a));
        }
        if (out) {
            out->append(buffer, static_cast<std::size_t>(n));
        }
        total += static_cast<std::uint64_t>(n);
    }
}

} // namespace

Result<std::vector<ContainerEntry>> list_container(const fs::path& container) {
    auto opened = open_zip(container);
    if (opened.is_error()) {
        return Err<std::vector<ContainerEntry>>(opened.error());
    }
    auto a = opened.take();

    std::vector<ContainerEntry> entries;
    archive_entry* header = nullptr;
    while (true) {
        const int rc = archive_read_next_header(a.get(), &header);
        if (rc == ARCHIVE_EOF) {
            break;
        }
        if (rc < ARCHIVE_WARN) {
            return Err<std::vector<ContainerEntry>>(container.string() + ": " + describe(a.get()));
        }
        if (archive_entry_filetype(header) != AE_IFREG) {
            continue;
        }

        ContainerEntry entry;
        entry.name = entry_name(header);
        const char* format = archive_format_name(a.get());
        entry.compressed = format && std::strstr(format, "deflation") != nullptr;

        if (archive_entry_size_is_set(header)) {
            entry.size = static_cast<std::uint64_t>(archive_entry_size(header));
            if (archive_read_data_skip(a.get()) < ARCHIVE_WARN) {
                return Err<std::vector<ContainerEntry>>(container.string() + ": " + describe(a.get()));
            }
        } else {
            auto counted = drain(a.get(), nullptr);
            if (counted.is_error()) {
                return Err<std::vector<ContainerEntry>>(entry.name + ": " + counted.error());
            }
            entry.size = counted.value();
        }
        entries.push_back(std::move(entry));
    }
    return Ok(std::move(entries));
}

Result<std::string> read_container_entry(const fs::path& container, const std::string& name) {
    auto opened = open_zip(container);
    if (opened.is_error()) {
        return Err<std::string>(opened.error());
    }
    auto a = opened.take();

    archive_entry* header = nullptr;
    while (true) {
        const int rc = archive_read_next_header(a.get(), &header);
        if (rc == ARCHIVE_EOF) {
            return Err<std::string>("No entry " + name + " in " + container.string());
        }
        if (rc < ARCHIVE_WARN) {
            return Err<std::string>(container.string() + ": " + describe(a.get()));
        }
        if (entry_name(header) != name) {
            continue;
        }

        std::string content;
        auto read = drain(a.get(), &content);
        if (read.is_error()) {
            return Err<std::string>(name + ": " + read.error());
        }
        return Ok(std::move(content));
    }
}

} // namespace chunkflow::archive
