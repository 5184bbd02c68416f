#include "chunkflow/archive/archive_builder.hpp"
#include "chunkflow/archive/archive_reader.hpp"
#include "chunkflow/archive/zip_writer.hpp"
#include "chunkflow/events/events.hpp"
#include "chunkflow/transfer/chunk_advisor.hpp"
#include "chunkflow/transfer/chunk_stream.hpp"
#include "chunkflow/transfer/integrity.hpp"
#include "chunkflow/transfer/progress.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>
#include <thread>

namespace chunkflow::archive {
namespace fs = std::filesystem;

namespace {

std::time_t to_time_t(fs::file_time_type ftime) {
    const auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::system_clock::to_time_t(system_time);
}

bool is_zip(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".zip";
}

Result<void, ZipError> io_error(std::string message) {
    return Err<void>(ZipError{ErrorKind::IoError, std::move(message)});
}

Result<void, ZipError> corrupt(std::string message) {
    return Err<void>(ZipError{ErrorKind::ArchiveEntryCorrupt, std::move(message)});
}

} // namespace

std::string ArchiveValidation::preview(std::size_t limit) const {
    std::ostringstream oss;
    if (!missing.empty()) {
        oss << "missing " << missing.size() << ": ";
        for (std::size_t i = 0; i < std::min(limit, missing.size()); ++i) {
            oss << (i ? ", " : "") << missing[i];
        }
        if (missing.size() > limit) {
            oss << " (+" << (missing.size() - limit) << " more)";
        }
    }
    if (!size_mismatches.empty()) {
        if (!missing.empty()) {
            oss << "; ";
        }
        oss << "size mismatches " << size_mismatches.size() << ": ";
        for (std::size_t i = 0; i < std::min(limit, size_mismatches.size()); ++i) {
            const auto& m = size_mismatches[i];
            oss << (i ? ", " : "") << m.relative_path << " (source " << m.source_size
                << ", archive " << m.archived_size << ")";
        }
        if (size_mismatches.size() > limit) {
            oss << " (+" << (size_mismatches.size() - limit) << " more)";
        }
    }
    return oss.str();
}

StreamingArchiveBuilder::StreamingArchiveBuilder(const memory::MemoryStatsProvider& memory,
                                                 ArchiveOptions options,
                                                 events::EventBus* bus)
    : memory_(memory),
      options_(std::move(options)),
      bus_(bus) {
    if (options_.entry_attempts < 1) {
        options_.entry_attempts = 1;
    }
}

void StreamingArchiveBuilder::sleep(std::chrono::duration<double> delay) const {
    if (options_.sleeper) {
        options_.sleeper(delay);
        return;
    }
    std::this_thread::sleep_for(delay);
}

Result<std::vector<std::string>> StreamingArchiveBuilder::collect_entries(const fs::path& source_root,
                                                                         const fs::path& exclude) {
    std::error_code ec;
    if (!fs::is_directory(source_root, ec)) {
        return Err<std::vector<std::string>>("Source directory not found: " + source_root.string());
    }

    const fs::path excluded = exclude.empty() ? fs::path() : fs::weakly_canonical(exclude, ec);

    std::vector<std::string> entries;
    try {
        for (const auto& item : fs::recursive_directory_iterator(source_root)) {
            if (!item.is_regular_file()) {
                continue;
            }
            if (is_zip(item.path())) {
                spdlog::debug("Skipping existing archive {}", item.path().string());
                continue;
            }
            if (!excluded.empty() && fs::weakly_canonical(item.path(), ec) == excluded) {
                continue;
            }
            entries.push_back(item.path().lexically_relative(source_root).generic_string());
        }
    } catch (const fs::filesystem_error& e) {
        return Err<std::vector<std::string>>(std::string("Failed to walk source tree: ") + e.what());
    }

    std::sort(entries.begin(), entries.end());
    return Ok(std::move(entries));
}

ArchiveResult StreamingArchiveBuilder::fail(ArchiveResult result, ErrorKind kind, std::string error) {
    result.succeeded = false;
    result.error_kind = kind;
    result.error = std::move(error);

    std::error_code ec;
    if (fs::exists(result.container, ec)) {
        fs::remove(result.container, ec);
        if (ec) {
            spdlog::error("Failed to remove partial archive {}: {}", result.container.string(), ec.message());
        } else {
            spdlog::warn("Removed partial archive {}", result.container.string());
        }
    }

    publish(events::ArchiveFailed{result.container, kind, result.error});
    return result;
}

ArchiveResult StreamingArchiveBuilder::build(const fs::path& source_root,
                                             const std::vector<std::string>& entries,
                                             const fs::path& destination) {
    const auto started = std::chrono::steady_clock::now();
    ArchiveResult result;
    result.container = destination;

    std::vector<PlannedEntry> plan;
    plan.reserve(entries.size());
    for (const auto& name : entries) {
        PlannedEntry entry;
        entry.name = name;
        entry.source = source_root / fs::path(name);

        std::error_code ec;
        entry.size = fs::file_size(entry.source, ec);
        if (ec) {
            result.failed_entry = name;
            return fail(std::move(result), ErrorKind::NotFound,
                        "Cannot read " + entry.source.string() + ": " + ec.message());
        }
        auto modified = fs::last_write_time(entry.source, ec);
        entry.modified = ec ? 0 : to_time_t(modified);
        result.source_bytes += entry.size;
        plan.push_back(std::move(entry));
    }

    std::sort(plan.begin(), plan.end(), [](const PlannedEntry& a, const PlannedEntry& b) {
        return a.size != b.size ? a.size < b.size : a.name < b.name;
    });

    spdlog::info("Creating archive {} from {} files ({:.2f} MB){}",
                 destination.string(), plan.size(), to_mib(result.source_bytes),
                 options_.compress ? " with DEFLATE" : " without compression");

    if (destination.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(destination.parent_path(), ec);
    }

    const auto method = options_.compress ? CompressionMethod::Deflate : CompressionMethod::Stored;
    auto created = ZipWriter::create(destination, method, options_.compression_level);
    if (created.is_error()) {
        return fail(std::move(result), ErrorKind::IoError, created.error());
    }
    auto writer = created.take();

    for (std::size_t index = 0; index < plan.size(); ++index) {
        const auto& entry = plan[index];

        Result<void, ZipError> written = Ok<ZipError>();
        std::string committed_digest;
        int attempt = 0;
        for (attempt = 1; attempt <= options_.entry_attempts; ++attempt) {
            written = write_entry(*writer, entry, committed_digest);
            if (written.is_ok()) {
                break;
            }
            if (written.error().kind == ErrorKind::ArchiveEntryCorrupt || writer->failed()) {
                break;
            }

            if (writer->entry_committed()) {
                spdlog::debug("Entry {} keeps its {} archived bytes for the next attempt",
                              entry.name, writer->entry_bytes());
            } else if (auto dropped = writer->abort_entry(); dropped.is_error()) {
                written = dropped;
                break;
            }

            spdlog::warn("Entry {} failed (attempt {}/{}): {}",
                         entry.name, attempt, options_.entry_attempts, written.error().message);
            if (attempt < options_.entry_attempts) {
                sleep(options_.entry_retry_delay);
            }
        }

        if (written.is_error()) {
            result.failed_entry = entry.name;
            const auto kind = written.error().kind;
            const auto message = written.error().message;
            writer.reset();
            return fail(std::move(result), kind, "Entry " + entry.name + ": " + message);
        }

        const auto& info = writer->entries().back();
        result.entries.push_back({entry.name, entry.size, info.method == CompressionMethod::Deflate});
        publish(events::ArchiveEntryWritten{entry.name, entry.size, info.stored_bytes, std::min(attempt, options_.entry_attempts)});

        if ((index + 1) % 100 == 0 || index + 1 == plan.size()) {
            spdlog::info("Archived {}/{} files", index + 1, plan.size());
        }
    }

    if (auto closed = writer->close(); closed.is_error()) {
        const auto kind = closed.error().kind;
        const auto message = closed.error().message;
        writer.reset();
        return fail(std::move(result), kind, message);
    }
    result.container_bytes = writer->offset();
    writer.reset();

    if (options_.validate) {
        result.validation = validate(source_root, entries, destination);
        if (!result.validation.passed()) {
            spdlog::error("Archive validation failed: {}", result.validation.preview());
            result.error_kind = ErrorKind::ValidationFailed;
            result.error = "Archive validation failed: " + result.validation.preview();
            result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            publish(events::ArchiveFailed{result.container, ErrorKind::ValidationFailed, result.error});
            return result;
        }
        spdlog::info("Archive validation passed: {} entries present with matching sizes", result.validation.checked);
    }

    result.succeeded = true;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    publish(events::ArchiveCompleted{result.container, result.entries.size(), result.source_bytes,
                                     result.container_bytes, result.elapsed});
    return result;
}

Result<void, ZipError> StreamingArchiveBuilder::write_entry(ZipWriter& writer,
                                                            const PlannedEntry& entry,
                                                            std::string& committed_digest) {
    if (entry.size < options_.in_memory_threshold) {
        std::unique_ptr<std::istream> input;
        if (options_.open_source) {
            input = options_.open_source(entry.source);
        } else {
            input = std::make_unique<std::ifstream>(entry.source, std::ios::binary);
        }
        if (!input || !*input) {
            return io_error("Failed to open " + entry.source.string());
        }
        // One byte of slack so a file that grew is seen as oversized, not truncated.
        std::vector<char> content(static_cast<std::size_t>(entry.size) + 1);
        input->read(content.data(), static_cast<std::streamsize>(content.size()));
        if (input->bad()) {
            return io_error("Read error in " + entry.source.string());
        }
        content.resize(static_cast<std::size_t>(input->gcount()));

        if (auto res = writer.begin_entry(entry.name, entry.size, entry.modified); res.is_error()) {
            return res;
        }
        if (auto res = writer.write(content.data(), content.size()); res.is_error()) {
            return res;
        }
        return writer.end_entry();
    }

    const std::uint64_t chunk_size = options_.chunk_size_bytes
        ? transfer::ChunkSizeAdvisor::clamp(*options_.chunk_size_bytes)
        : transfer::ChunkSizeAdvisor::advise_for_item(memory_, options_.chunk_streams, entry.size);
    spdlog::debug("Streaming {} ({:.2f} MB) in {} KB chunks", entry.name, to_mib(entry.size), chunk_size / kKiB);

    transfer::ProgressTracker progress(entry.name, entry.size,
        [this](const std::string& label, const transfer::ProgressState& state) {
            publish(events::ProgressUpdated{label, state.transferred_bytes, state.total_bytes});
        });
    transfer::ChunkStream stream(entry.source, static_cast<std::size_t>(chunk_size), &progress, options_.open_source);
    if (auto opened = stream.open(); opened.is_error()) {
        return io_error(opened.error());
    }

    if (!writer.in_entry()) {
        if (auto res = writer.begin_entry(entry.name, entry.size, entry.modified); res.is_error()) {
            return res;
        }
    }

    // Bytes an earlier attempt already put in the container are read again
    // and compared by digest instead of being written twice.
    const std::uint64_t committed = writer.entry_bytes();
    if (committed > 0 && committed_digest.empty()) {
        return io_error("No digest for the " + std::to_string(committed) + " archived bytes of " + entry.name);
    }
    transfer::StreamHasher written;
    transfer::StreamHasher reread;
    std::uint64_t offset = 0;

    transfer::Chunk chunk;
    while (true) {
        auto more = stream.next(chunk);
        if (more.is_error()) {
            if (offset >= committed) {
                auto digest = written.digest();
                committed_digest = digest.is_ok() ? digest.value() : std::string();
            }
            return io_error(more.error());
        }
        if (!more.value()) {
            break;
        }

        std::size_t head = 0;
        if (offset < committed) {
            head = static_cast<std::size_t>(std::min<std::uint64_t>(chunk.size, committed - offset));
            if (reread.update(chunk.data, head).is_error() || written.update(chunk.data, head).is_error()) {
                return io_error("Digest failed while re-reading " + entry.name);
            }
            offset += head;
            if (offset == committed) {
                auto digest = reread.digest();
                if (digest.is_error()) {
                    return io_error(digest.error());
                }
                if (digest.value() != committed_digest) {
                    return corrupt(entry.name + ": first " + std::to_string(committed) +
                                   " bytes changed after they were archived");
                }
                spdlog::info("Resuming {} after {} verified bytes", entry.name, committed);
            }
        }
        if (head < chunk.size) {
            const auto* tail = chunk.data + head;
            const std::size_t len = chunk.size - head;
            if (written.update(tail, len).is_error()) {
                return io_error("Digest failed for " + entry.name);
            }
            if (auto res = writer.write(tail, len); res.is_error()) {
                return res;
            }
            offset += len;
        }
    }
    if (offset < committed) {
        return corrupt(entry.name + ": source ends at " + std::to_string(offset) + " bytes, before the " +
                       std::to_string(committed) + " already archived");
    }
    progress.finish();
    committed_digest.clear();
    return writer.end_entry();
}

ArchiveValidation StreamingArchiveBuilder::validate(const fs::path& source_root,
                                                    const std::vector<std::string>& entries,
                                                    const fs::path& container) const {
    ArchiveValidation validation;
    validation.performed = true;

    std::vector<std::string> expected = entries;
    auto walked = collect_entries(source_root, container);
    if (walked.is_ok()) {
        expected.insert(expected.end(), walked.value().begin(), walked.value().end());
    } else {
        spdlog::warn("Validation checks requested entries only: {}", walked.error());
    }
    std::sort(expected.begin(), expected.end());
    expected.erase(std::unique(expected.begin(), expected.end()), expected.end());

    auto listed = list_container(container);
    if (listed.is_error()) {
        spdlog::error("Cannot read archive for validation: {}", listed.error());
        validation.checked = expected.size();
        validation.missing = expected;
        return validation;
    }

    std::map<std::string, std::uint64_t> archived;
    for (const auto& item : listed.value()) {
        archived.emplace(item.name, item.size);
    }

    for (const auto& name : expected) {
        ++validation.checked;
        const auto found = archived.find(name);
        if (found == archived.end()) {
            validation.missing.push_back(name);
            continue;
        }

        std::error_code ec;
        const auto source_size = fs::file_size(source_root / fs::path(name), ec);
        if (ec) {
            // Source vanished after the build: nothing left to compare against.
            validation.size_mismatches.push_back({name, 0, found->second});
            continue;
        }
        if (source_size != found->second) {
            validation.size_mismatches.push_back({name, source_size, found->second});
        }
    }
    return validation;
}

} // namespace chunkflow::archive
