#pragma once

#include "chunkflow/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chunkflow::archive {

struct ContainerEntry {
    std::string name;
    std::uint64_t size = 0;
    bool compressed = false;
};

/// Regular-file entries of a ZIP container, in directory order.
Result<std::vector<ContainerEntry>> list_container(const std::filesystem::path& container);

/**
 * @brief Whole entry in memory; meant for small entries
 *
 * Fails when the entry is absent or its data does not match the stored
 * CRC-32.
 */
Result<std::string> read_container_entry(const std::filesystem::path& container, const std::string& name);

} // namespace chunkflow::archive
