#pragma once

#ifdef _WIN32
    #define CHUNKFLOW_PLATFORM_WINDOWS
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <windows.h>
#elif defined(__linux__)
    #define CHUNKFLOW_PLATFORM_LINUX
    #include <sys/sysinfo.h>
    #include <unistd.h>
#elif defined(__APPLE__)
    #define CHUNKFLOW_PLATFORM_MACOS
    #include <mach/mach.h>
    #include <sys/sysctl.h>
    #include <sys/types.h>
    #include <unistd.h>
#else
    #define CHUNKFLOW_PLATFORM_OTHER
    #include <unistd.h>
#endif

namespace chunkflow {

enum class Platform {
    Windows,
    Linux,
    MacOS,
    Unknown
};

inline Platform get_platform() {
#ifdef CHUNKFLOW_PLATFORM_WINDOWS
    return Platform::Windows;
#elif defined(CHUNKFLOW_PLATFORM_LINUX)
    return Platform::Linux;
#elif defined(CHUNKFLOW_PLATFORM_MACOS)
    return Platform::MacOS;
#else
    return Platform::Unknown;
#endif
}

inline const char* platform_name() {
    switch (get_platform()) {
        case Platform::Windows: return "Windows";
        case Platform::Linux: return "Linux";
        case Platform::MacOS: return "macOS";
        default: return "Unknown";
    }
}

} // namespace chunkflow
