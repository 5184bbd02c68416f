#include "chunkflow/api/config.hpp"

#include <fstream>
#include <limits>
#include <sstream>

namespace chunkflow::api {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<void> read_int(const json& j, const char* key, int& out, int min_value) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        return Err<void>(std::string(key) + " must be an integer");
    }
    const auto number = value.get<std::int64_t>();
    if (number < min_value || number > std::numeric_limits<int>::max()) {
        return Err<void>(std::string(key) + " must be >= " + std::to_string(min_value));
    }
    out = static_cast<int>(number);
    return Ok();
}

Result<void> read_bytes(const json& j, const char* key, std::uint64_t& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer() || value.get<std::int64_t>() <= 0) {
        return Err<void>(std::string(key) + " must be a positive integer");
    }
    out = value.get<std::uint64_t>();
    return Ok();
}

Result<void> read_seconds(const json& j, const char* key, double& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j.at(key);
    if (!value.is_number() || value.get<double>() < 0.0) {
        return Err<void>(std::string(key) + " must be a non-negative number");
    }
    out = value.get<double>();
    return Ok();
}

Result<void> read_bool(const json& j, const char* key, bool& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j.at(key);
    if (!value.is_boolean()) {
        return Err<void>(std::string(key) + " must be true or false");
    }
    out = value.get<bool>();
    return Ok();
}

Result<void> read_chunk_size(const json& j, std::optional<std::uint64_t>& out) {
    if (!j.contains("chunk_size_bytes")) {
        return Ok();
    }
    const auto& value = j.at("chunk_size_bytes");
    if (value.is_string()) {
        if (value.get<std::string>() != "auto") {
            return Err<void>(std::string("chunk_size_bytes must be an integer or \"auto\""));
        }
        out.reset();
        return Ok();
    }
    std::uint64_t bytes = 0;
    if (auto res = read_bytes(j, "chunk_size_bytes", bytes); res.is_error()) {
        return Err<void>(std::string("chunk_size_bytes must be an integer or \"auto\""));
    }
    out = bytes;
    return Ok();
}

} // namespace

Result<transfer::SchedulerOptions> EngineConfig::scheduler_options() const {
    auto algorithm = transfer::parse_digest_algorithm(digest);
    if (algorithm.is_error()) {
        return Err<transfer::SchedulerOptions>(algorithm.error());
    }

    transfer::SchedulerOptions options;
    options.large_threshold_bytes = large_threshold_bytes;
    options.max_workers = max_workers;
    options.chunk_streams = chunk_streams;
    options.chunk_size_bytes = chunk_size_bytes;
    options.retry.max_retries = max_retries;
    options.retry.backoff_base = std::chrono::duration<double>(backoff_base_seconds);
    options.validate = validate;
    options.digest = algorithm.value();
    return Ok(options);
}

archive::ArchiveOptions EngineConfig::archive_options() const {
    archive::ArchiveOptions options;
    options.compress = compress;
    options.compression_level = compression_level;
    options.validate = validate;
    options.in_memory_threshold = archive_in_memory_threshold;
    options.entry_attempts = archive_entry_attempts;
    options.entry_retry_delay = std::chrono::duration<double>(archive_retry_delay_seconds);
    options.chunk_size_bytes = chunk_size_bytes;
    options.chunk_streams = 1;
    return options;
}

Result<EngineConfig> parse_config(const std::string& json_text, const EngineConfig& base) {
    auto j = json::parse(json_text, nullptr, false);
    if (j.is_discarded()) {
        return Err<EngineConfig>(std::string("Invalid JSON"));
    }
    return config_from_json(j, base);
}

Result<EngineConfig> config_from_json(const json& j, const EngineConfig& base) {
    if (!j.is_object()) {
        return Err<EngineConfig>(std::string("Configuration must be a JSON object"));
    }

    EngineConfig config = base;
    const Result<void> steps[] = {
        read_int(j, "max_workers", config.max_workers, 1),
        read_int(j, "chunk_streams", config.chunk_streams, 1),
        read_bytes(j, "large_threshold_bytes", config.large_threshold_bytes),
        read_chunk_size(j, config.chunk_size_bytes),
        read_int(j, "max_retries", config.max_retries, 1),
        read_seconds(j, "backoff_base_seconds", config.backoff_base_seconds),
        read_bool(j, "validate", config.validate),
        read_bool(j, "compress", config.compress),
        read_int(j, "compression_level", config.compression_level, -1),
        read_bytes(j, "archive_in_memory_threshold", config.archive_in_memory_threshold),
        read_int(j, "archive_entry_attempts", config.archive_entry_attempts, 1),
        read_seconds(j, "archive_retry_delay_seconds", config.archive_retry_delay_seconds),
        read_int(j, "connect_timeout_seconds", config.connect_timeout_seconds, 1),
        read_int(j, "read_timeout_seconds", config.read_timeout_seconds, 1),
    };
    for (const auto& step : steps) {
        if (step.is_error()) {
            return Err<EngineConfig>(step.error());
        }
    }

    if (config.compression_level > 9) {
        return Err<EngineConfig>(std::string("compression_level must be between -1 and 9"));
    }

    if (j.contains("digest")) {
        if (!j.at("digest").is_string()) {
            return Err<EngineConfig>(std::string("digest must be a string"));
        }
        auto algorithm = transfer::parse_digest_algorithm(j.at("digest").get<std::string>());
        if (algorithm.is_error()) {
            return Err<EngineConfig>(algorithm.error());
        }
        config.digest = transfer::to_string(algorithm.value());
    }
    return Ok(config);
}

Result<EngineConfig> load_config(const fs::path& path, const EngineConfig& base) {
    std::ifstream input(path);
    if (!input) {
        return Err<EngineConfig>("Cannot open config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    auto config = parse_config(buffer.str(), base);
    if (config.is_error()) {
        return Err<EngineConfig>(path.string() + ": " + config.error());
    }
    return config;
}

std::string config_to_json(const EngineConfig& config) {
    json j;
    j["max_workers"] = config.max_workers;
    j["chunk_streams"] = config.chunk_streams;
    j["large_threshold_bytes"] = config.large_threshold_bytes;
    if (config.chunk_size_bytes) {
        j["chunk_size_bytes"] = *config.chunk_size_bytes;
    } else {
        j["chunk_size_bytes"] = "auto";
    }
    j["max_retries"] = config.max_retries;
    j["backoff_base_seconds"] = config.backoff_base_seconds;
    j["validate"] = config.validate;
    j["compress"] = config.compress;
    j["compression_level"] = config.compression_level;
    j["digest"] = config.digest;
    j["archive_in_memory_threshold"] = config.archive_in_memory_threshold;
    j["archive_entry_attempts"] = config.archive_entry_attempts;
    j["archive_retry_delay_seconds"] = config.archive_retry_delay_seconds;
    j["connect_timeout_seconds"] = config.connect_timeout_seconds;
    j["read_timeout_seconds"] = config.read_timeout_seconds;
    return j.dump(2);
}

} // namespace chunkflow::api
