#include "chunkflow/api/engine.hpp"

#include "chunkflow/core/units.hpp"
#include "chunkflow/transfer/chunk_advisor.hpp"
#include "chunkflow/transfer/scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace chunkflow::api {
namespace fs = std::filesystem;

Result<std::unique_ptr<Engine>> Engine::create(EngineConfig config,
                                               transfer::Transport* transport,
                                               const memory::MemoryStatsProvider& memory,
                                               events::EventBus* bus) {
    auto options = config.scheduler_options();
    if (options.is_error()) {
        return Err<std::unique_ptr<Engine>>("Invalid configuration: " + options.error());
    }
    return Ok(std::unique_ptr<Engine>(new Engine(std::move(config), options.take(), transport, memory, bus)));
}

Engine::Engine(EngineConfig config,
               transfer::SchedulerOptions scheduler_options,
               transfer::Transport* transport,
               const memory::MemoryStatsProvider& memory,
               events::EventBus* bus)
    : config_(std::move(config))
    , scheduler_options_(std::move(scheduler_options))
    , transport_(transport)
    , memory_(memory)
    , bus_(bus) {
}

transfer::TransferReport Engine::transfer(std::vector<transfer::TransferItem> items) {
    if (!transport_) {
        spdlog::error("No transport configured; {} items not transferred", items.size());
        transfer::TransferReport report;
        for (auto& item : items) {
            transfer::TransferOutcome outcome;
            outcome.item = std::move(item);
            outcome.error_kind = ErrorKind::TransportRejected;
            outcome.last_error = "no transport configured";
            report.outcomes.push_back(std::move(outcome));
        }
        return report;
    }

    transfer::TransferScheduler scheduler(*transport_, memory_, scheduler_options_, bus_);
    auto report = scheduler.run(std::move(items));

    for (const auto& outcome : report.outcomes) {
        if (!outcome.succeeded) {
            spdlog::error("Failed: {} <- {} [{}] after {} attempt(s): {}",
                          outcome.item.destination_path,
                          outcome.item.source_path.string(),
                          to_string(outcome.error_kind),
                          outcome.attempts,
                          outcome.last_error);
        }
    }
    return report;
}

archive::ArchiveResult Engine::build_archive(const fs::path& source_root, const fs::path& destination) {
    auto entries = archive::StreamingArchiveBuilder::collect_entries(source_root, destination);
    if (entries.is_error()) {
        spdlog::error("Cannot list {}: {}", source_root.string(), entries.error());
        archive::ArchiveResult result;
        result.container = destination;
        result.error_kind = ErrorKind::NotFound;
        result.error = entries.error();
        return result;
    }

    archive::StreamingArchiveBuilder builder(memory_, config_.archive_options(), bus_);
    auto result = builder.build(source_root, entries.value(), destination);

    if (result.succeeded) {
        const double ratio = result.source_bytes == 0
            ? 100.0
            : 100.0 * static_cast<double>(result.container_bytes) / static_cast<double>(result.source_bytes);
        spdlog::info("Archive {}: {} files, {:.2f} MB -> {:.2f} MB ({:.1f}%) in {:.2f}s",
                     result.container.string(),
                     result.entries.size(),
                     to_mib(result.source_bytes),
                     to_mib(result.container_bytes),
                     ratio,
                     result.elapsed.count() / 1000.0);
    } else {
        spdlog::error("Archive {} failed [{}]{}: {}",
                      result.container.string(),
                      to_string(result.error_kind),
                      result.failed_entry.empty() ? std::string() : " at " + result.failed_entry,
                      result.error);
    }
    return result;
}

Result<std::vector<transfer::TransferItem>> Engine::collect_items(const fs::path& source,
                                                                  const std::string& target_prefix) {
    std::error_code ec;
    const auto status = fs::status(source, ec);
    if (ec || !fs::exists(status)) {
        return Err<std::vector<transfer::TransferItem>>("Source not found: " + source.string());
    }

    std::vector<transfer::TransferItem> items;
    if (fs::is_regular_file(status)) {
        const auto size = fs::file_size(source, ec);
        if (ec) {
            return Err<std::vector<transfer::TransferItem>>("Cannot stat " + source.string() + ": " + ec.message());
        }
        items.push_back({source, join_destination(target_prefix, source.filename().generic_string()), size});
        return Ok(std::move(items));
    }

    if (!fs::is_directory(status)) {
        return Err<std::vector<transfer::TransferItem>>("Not a file or directory: " + source.string());
    }

    fs::recursive_directory_iterator it(source, ec);
    if (ec) {
        return Err<std::vector<transfer::TransferItem>>("Cannot walk " + source.string() + ": " + ec.message());
    }
    for (fs::recursive_directory_iterator end; it != end;) {
        if (it->is_regular_file(ec)) {
            const auto size = it->file_size(ec);
            if (ec) {
                spdlog::warn("Skipping {}: {}", it->path().string(), ec.message());
            } else {
                const auto relative = it->path().lexically_relative(source).generic_string();
                items.push_back({it->path(), join_destination(target_prefix, relative), size});
            }
        }
        it.increment(ec);
        if (ec) {
            return Err<std::vector<transfer::TransferItem>>("Cannot walk " + source.string() + ": " + ec.message());
        }
    }

    std::sort(items.begin(), items.end(), [](const auto& a, const auto& b) {
        return a.destination_path < b.destination_path;
    });
    spdlog::info("Found {} files under {}", items.size(), source.string());
    return Ok(std::move(items));
}

void log_memory_info(const memory::MemoryStatsProvider& provider, int concurrent_streams) {
    auto stats = provider.read();
    if (stats.is_error()) {
        spdlog::warn("Memory information unavailable: {}", stats.error());
    } else {
        spdlog::info("Memory: {:.2f} GB total, {:.2f} GB available",
                     to_gib(stats.value().total_bytes),
                     to_gib(stats.value().available_bytes));
    }
    const auto chunk = transfer::ChunkSizeAdvisor::advise(provider, concurrent_streams);
    spdlog::info("Advised chunk size: {:.2f} MB for {} streams", to_mib(chunk), concurrent_streams);
}

std::string join_destination(const std::string& prefix, const std::string& relative) {
    std::string head = prefix;
    while (!head.empty() && head.back() == '/') {
        head.pop_back();
    }
    std::string tail = relative;
    tail.erase(0, tail.find_first_not_of('/') == std::string::npos ? tail.size() : tail.find_first_not_of('/'));
    if (head.empty()) {
        return tail;
    }
    return head + "/" + tail;
}

} // namespace chunkflow::api
