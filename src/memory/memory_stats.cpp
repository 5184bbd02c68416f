#include "chunkflow/memory/memory_stats.hpp"

#include "chunkflow/core/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>

namespace chunkflow::memory {
namespace fs = std::filesystem;

namespace {

std::optional<std::uint64_t> meminfo_field(const std::string& content, const std::string& key) {
    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.compare(0, key.size(), key) != 0 || line.size() <= key.size() || line[key.size()] != ':') {
            continue;
        }
        std::istringstream fields(line.substr(key.size() + 1));
        std::uint64_t value = 0;
        std::string unit;
        if (!(fields >> value)) {
            return std::nullopt;
        }
        fields >> unit;
        if (unit == "kB" || unit == "KB") {
            value *= 1024ULL;
        }
        return value;
    }
    return std::nullopt;
}

#ifdef CHUNKFLOW_PLATFORM_LINUX
Result<MemoryStats> read_sysinfo() {
    struct sysinfo info {};
    if (::sysinfo(&info) != 0) {
        return Err<MemoryStats>(std::string("sysinfo() failed"));
    }
    MemoryStats stats;
    stats.total_bytes = static_cast<std::uint64_t>(info.totalram) * info.mem_unit;
    stats.available_bytes = (static_cast<std::uint64_t>(info.freeram) + info.bufferram) * info.mem_unit;
    return Ok(stats);
}
#endif

#ifdef CHUNKFLOW_PLATFORM_MACOS
Result<MemoryStats> read_mach() {
    std::uint64_t total = 0;
    std::size_t length = sizeof(total);
    if (::sysctlbyname("hw.memsize", &total, &length, nullptr, 0) != 0) {
        return Err<MemoryStats>(std::string("sysctl hw.memsize failed"));
    }

    vm_statistics64_data_t vm{};
    mach_msg_type_number_t count = HOST_VM_INFO64_COUNT;
    const kern_return_t rc = ::host_statistics64(::mach_host_self(), HOST_VM_INFO64,
                                                 reinterpret_cast<host_info64_t>(&vm), &count);
    if (rc != KERN_SUCCESS) {
        return Err<MemoryStats>("host_statistics64 failed: " + std::to_string(rc));
    }

    const long page_size = ::sysconf(_SC_PAGESIZE);
    if (page_size <= 0) {
        return Err<MemoryStats>(std::string("sysconf(_SC_PAGESIZE) failed"));
    }
    return Ok(from_vm_pages(total, vm.free_count, vm.inactive_count, static_cast<std::uint64_t>(page_size)));
}
#endif

} // namespace

Result<MemoryStats> parse_meminfo(const std::string& content) {
    const auto total = meminfo_field(content, "MemTotal");
    const auto available = meminfo_field(content, "MemAvailable");
    if (!total || !available) {
        return Err<MemoryStats>(std::string("MemTotal/MemAvailable not present in meminfo"));
    }
    MemoryStats stats;
    stats.total_bytes = *total;
    stats.available_bytes = *available;
    return Ok(stats);
}

MemoryStats from_vm_pages(std::uint64_t total_bytes,
                          std::uint64_t free_pages,
                          std::uint64_t inactive_pages,
                          std::uint64_t page_size) {
    MemoryStats stats;
    stats.total_bytes = total_bytes;
    stats.available_bytes = std::min(total_bytes, (free_pages + inactive_pages) * page_size);
    return stats;
}

SystemMemoryStats::SystemMemoryStats(fs::path meminfo_path)
    : meminfo_path_(std::move(meminfo_path)) {}

Result<MemoryStats> SystemMemoryStats::read() const {
#ifdef CHUNKFLOW_PLATFORM_WINDOWS
    MEMORYSTATUSEX status{};
    status.dwLength = sizeof(status);
    if (!GlobalMemoryStatusEx(&status)) {
        return Err<MemoryStats>(std::string("GlobalMemoryStatusEx failed"));
    }
    MemoryStats stats;
    stats.total_bytes = status.ullTotalPhys;
    stats.available_bytes = status.ullAvailPhys;
    return Ok(stats);
#else
    std::ifstream input(meminfo_path_);
    if (input) {
        std::ostringstream buffer;
        buffer << input.rdbuf();
        auto parsed = parse_meminfo(buffer.str());
        if (parsed.is_ok()) {
            return parsed;
        }
        spdlog::debug("Could not parse {}: {}", meminfo_path_.string(), parsed.error());
    }
#if defined(CHUNKFLOW_PLATFORM_LINUX)
    return read_sysinfo();
#elif defined(CHUNKFLOW_PLATFORM_MACOS)
    return read_mach();
#else
    return Err<MemoryStats>(std::string("No memory statistics source on ") + platform_name());
#endif
#endif
}

FixedMemoryStats::FixedMemoryStats(std::uint64_t available_bytes, std::uint64_t total_bytes) {
    stats_.available_bytes = available_bytes;
    stats_.total_bytes = total_bytes;
}

FixedMemoryStats FixedMemoryStats::failing(std::string reason) {
    FixedMemoryStats provider;
    provider.failure_ = reason.empty() ? std::string("memory statistics unavailable") : std::move(reason);
    return provider;
}

Result<MemoryStats> FixedMemoryStats::read() const {
    if (!failure_.empty()) {
        return Err<MemoryStats>(failure_);
    }
    return Ok(stats_);
}

} // namespace chunkflow::memory
