#pragma once

#include "chunkflow/core/result.hpp"

#include <filesystem>
#include <string>

namespace chunkflow {

constexpr const char* kDefaultLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct LoggingOptions {
    std::string level = "info";          // trace, debug, info, warn, error, critical, off
    std::filesystem::path log_file;      // Empty: console only
    std::string pattern = kDefaultLogPattern;
};

/**
 * @brief Installs the default spdlog logger: console, plus an append-mode file if requested
 *
 * Components keep calling the free spdlog::info/warn/... functions; only
 * the entry points call this.
 */
Result<void> configure_logging(const LoggingOptions& options);

} // namespace chunkflow
