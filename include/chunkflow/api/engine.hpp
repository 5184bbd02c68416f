#pragma once

#include "chunkflow/api/config.hpp"
#include "chunkflow/archive/archive_builder.hpp"
#include "chunkflow/core/result.hpp"
#include "chunkflow/events/event_bus.hpp"
#include "chunkflow/memory/memory_stats.hpp"
#include "chunkflow/transfer/transport.hpp"
#include "chunkflow/transfer/types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace chunkflow::api {

/**
 * @brief Caller-facing facade over the scheduler and the archive builder
 *
 * Holds the configuration and the collaborators every run needs. The
 * transport is optional: an engine without one can still build archives,
 * and every item handed to transfer() fails with TransportRejected.
 */
class Engine {
public:
    static Result<std::unique_ptr<Engine>> create(EngineConfig config,
                                                  transfer::Transport* transport,
                                                  const memory::MemoryStatsProvider& memory,
                                                  events::EventBus* bus = nullptr);

    transfer::TransferReport transfer(std::vector<transfer::TransferItem> items);

    /// Archives every regular file under @p source_root except .zip files and @p destination.
    archive::ArchiveResult build_archive(const std::filesystem::path& source_root,
                                         const std::filesystem::path& destination);

    /**
     * @brief Items for a file or a directory tree
     *
     * A single file maps to "<target_prefix>/<file name>". A directory is
     * walked recursively and each regular file maps to
     * "<target_prefix>/<relative path>" with '/' separators. Sizes are read
     * once, here.
     */
    static Result<std::vector<transfer::TransferItem>> collect_items(const std::filesystem::path& source,
                                                                     const std::string& target_prefix);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    Engine(EngineConfig config,
           transfer::SchedulerOptions scheduler_options,
           transfer::Transport* transport,
           const memory::MemoryStatsProvider& memory,
           events::EventBus* bus);

    EngineConfig config_;
    transfer::SchedulerOptions scheduler_options_;
    transfer::Transport* transport_;
    const memory::MemoryStatsProvider& memory_;
    events::EventBus* bus_;
};

/// Logs total and available memory and the chunk size the advisor would pick.
void log_memory_info(const memory::MemoryStatsProvider& provider, int concurrent_streams = 5);

/// "dir/sub" + "a/b.bin" -> "dir/sub/a/b.bin"; an empty prefix yields the path unchanged.
std::string join_destination(const std::string& prefix, const std::string& relative);

} // namespace chunkflow::api
