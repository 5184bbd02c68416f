#include "chunkflow/api/config.hpp"
#include "chunkflow/api/engine.hpp"
#include "chunkflow/api/remote.hpp"
#include "chunkflow/core/logging.hpp"
#include "chunkflow/core/units.hpp"
#include "chunkflow/events/components.hpp"
#include "chunkflow/events/event_bus.hpp"
#include "chunkflow/memory/memory_stats.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitInterrupted = 130;

void signal_handler(int signal) {
    if (signal == SIGINT) {
        std::_Exit(kExitInterrupted);
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " --source DIR [options]\n"
              << "\n"
              << "  -s, --source DIR         Directory to archive\n"
              << "  -o, --output PATH        Archive path or directory (default <source>.zip beside it)\n"
              << "      --compress           DEFLATE entries instead of storing them\n"
              << "      --no-validate        Skip the post-build size check\n"
              << "      --chunk-size KB|auto Read size for large files (default auto)\n"
              << "  -c, --config FILE        JSON configuration file\n"
              << "      --log-file FILE      Also log to FILE\n"
              << "  -v, --verbose            Debug logging\n"
              << "\n"
              << "Upload the archive afterwards:\n"
              << "      --upload-url URL     Repository base URL\n"
              << "  -r, --repo NAME          Repository name\n"
              << "      --layout NAME        nexus (default) or artifactory\n"
              << "  -t, --target PATH        Target directory inside the repository\n"
              << "      --username USER      Defaults to $CHUNKFLOW_USERNAME\n"
              << "      --password PASS      Defaults to $CHUNKFLOW_PASSWORD\n"
              << "      --keep-archive       Keep the local archive after a successful upload\n";
}

/**
 * Empty output: "<source>.zip" next to the source. An existing directory
 * gets "<source-name>.zip" inside it. A name without ".zip" gets the suffix.
 */
fs::path resolve_output(const fs::path& source, const std::string& output) {
    const fs::path canonical_source = fs::absolute(source).lexically_normal();
    std::string name = canonical_source.filename().string();
    if (name.empty()) {
        name = canonical_source.parent_path().filename().string();
    }

    if (output.empty()) {
        return fs::path(canonical_source.string() + ".zip");
    }

    fs::path path(output);
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return path / (name + ".zip");
    }
    if (path.extension() != ".zip") {
        path += ".zip";
    }
    return path;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);

    std::string source;
    std::string output;
    std::string config_path;
    std::string log_file;
    std::string target;
    std::string layout = "nexus";
    std::optional<std::string> chunk_size;
    bool compress = false;
    bool no_validate = false;
    bool keep_archive = false;
    bool verbose = false;
    chunkflow::api::RemoteOptions remote;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-s" || arg == "--source") && i + 1 < argc) {
            source = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output = argv[++i];
        } else if (arg == "--compress") {
            compress = true;
        } else if (arg == "--no-validate") {
            no_validate = true;
        } else if (arg == "--chunk-size" && i + 1 < argc) {
            chunk_size = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            log_file = argv[++i];
        } else if (arg == "--upload-url" && i + 1 < argc) {
            remote.url = argv[++i];
        } else if ((arg == "-r" || arg == "--repo") && i + 1 < argc) {
            remote.repository = argv[++i];
        } else if (arg == "--layout" && i + 1 < argc) {
            layout = argv[++i];
        } else if ((arg == "-t" || arg == "--target") && i + 1 < argc) {
            target = argv[++i];
        } else if (arg == "--username" && i + 1 < argc) {
            remote.username = argv[++i];
        } else if (arg == "--password" && i + 1 < argc) {
            remote.password = argv[++i];
        } else if (arg == "--keep-archive") {
            keep_archive = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return kExitOk;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            print_usage(argv[0]);
            return kExitFailed;
        }
    }

    chunkflow::LoggingOptions logging;
    logging.level = verbose ? "debug" : "info";
    logging.log_file = log_file;
    if (auto res = chunkflow::configure_logging(logging); res.is_error()) {
        std::cerr << res.error() << "\n";
        return kExitFailed;
    }

    if (source.empty()) {
        print_usage(argv[0]);
        return kExitFailed;
    }
    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        spdlog::error("Source is not a directory: {}", source);
        return kExitFailed;
    }

    chunkflow::api::EngineConfig config;
    if (!config_path.empty()) {
        auto loaded = chunkflow::api::load_config(config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error());
            return kExitFailed;
        }
        config = loaded.take();
    }
    if (compress) {
        config.compress = true;
    }
    if (no_validate) {
        config.validate = false;
    }
    if (chunk_size) {
        if (*chunk_size == "auto") {
            config.chunk_size_bytes.reset();
        } else {
            try {
                config.chunk_size_bytes = std::stoull(*chunk_size) * chunkflow::kKiB;
            } catch (const std::exception&) {
                spdlog::error("--chunk-size expects a size in KB or 'auto', got '{}'", *chunk_size);
                return kExitFailed;
            }
        }
    }

    chunkflow::memory::SystemMemoryStats memory;
    chunkflow::api::log_memory_info(memory, config.chunk_streams);

    std::unique_ptr<chunkflow::transfer::Transport> transport;
    if (!remote.url.empty()) {
        auto parsed_layout = chunkflow::api::parse_layout(layout);
        if (parsed_layout.is_error()) {
            spdlog::error("{}", parsed_layout.error());
            return kExitFailed;
        }
        remote.layout = parsed_layout.value();
        chunkflow::api::apply_credentials_from_env(remote);
        auto http = chunkflow::api::make_http_transport(remote, config);
        if (http.is_error()) {
            spdlog::error("{}", http.error());
            return kExitFailed;
        }
        transport = http.take();
    }

    chunkflow::events::EventBus event_bus;
    chunkflow::events::LoggerComponent logger(event_bus);
    chunkflow::events::MetricsComponent metrics(event_bus);

    auto engine = chunkflow::api::Engine::create(config, transport.get(), memory, &event_bus);
    if (engine.is_error()) {
        spdlog::error("{}", engine.error());
        return kExitFailed;
    }

    const fs::path archive_path = resolve_output(source, output);
    auto archive = engine.value()->build_archive(source, archive_path);
    if (!archive.succeeded) {
        metrics.print_stats();
        return kExitFailed;
    }

    if (!transport) {
        metrics.print_stats();
        return kExitOk;
    }

    auto items = chunkflow::api::Engine::collect_items(archive.container, target);
    if (items.is_error()) {
        spdlog::error("{}", items.error());
        return kExitFailed;
    }
    auto report = engine.value()->transfer(items.take());
    metrics.print_stats();
    if (!report.all_succeeded()) {
        spdlog::error("Upload failed; keeping {}", archive.container.string());
        return kExitFailed;
    }

    if (!keep_archive) {
        fs::remove(archive.container, ec);
        if (ec) {
            spdlog::warn("Could not delete {}: {}", archive.container.string(), ec.message());
        } else {
            spdlog::info("Deleted local archive {}", archive.container.string());
        }
    }
    return kExitOk;
}
