#pragma once

#include "chunkflow/archive/archive_builder.hpp"
#include "chunkflow/core/result.hpp"
#include "chunkflow/core/units.hpp"
#include "chunkflow/transfer/scheduler.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkflow::api {

/**
 * @brief Every tunable of a transfer run or archive build
 *
 * Defaults are the process-wide values; entry points override them from a
 * JSON file and then from flags. Components never read this struct
 * directly: they receive the options derived from it.
 */
struct EngineConfig {
    int max_workers = 3;
    int chunk_streams = 5;
    std::uint64_t large_threshold_bytes = 100 * kMiB;
    std::optional<std::uint64_t> chunk_size_bytes;   ///< nullopt is "auto"
    int max_retries = 3;
    double backoff_base_seconds = 1.0;
    bool validate = true;
    bool compress = false;
    int compression_level = -1;
    std::string digest = "md5";
    std::uint64_t archive_in_memory_threshold = 10 * kMiB;
    int archive_entry_attempts = 3;
    double archive_retry_delay_seconds = 1.0;
    int connect_timeout_seconds = 30;
    int read_timeout_seconds = 300;

    Result<transfer::SchedulerOptions> scheduler_options() const;
    archive::ArchiveOptions archive_options() const;
};

/**
 * @brief Overlay a JSON object onto @p base
 *
 * Unknown keys are ignored. A known key with the wrong type or an
 * out-of-range value is an error. "chunk_size_bytes" takes an integer or
 * the string "auto".
 */
Result<EngineConfig> config_from_json(const nlohmann::json& j, const EngineConfig& base = {});

/// Parses @p json_text and applies config_from_json.
Result<EngineConfig> parse_config(const std::string& json_text, const EngineConfig& base = {});

Result<EngineConfig> load_config(const std::filesystem::path& path, const EngineConfig& base = {});

/// Pretty-printed JSON of the effective configuration.
std::string config_to_json(const EngineConfig& config);

} // namespace chunkflow::api
