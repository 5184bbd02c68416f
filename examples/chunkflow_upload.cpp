#include "chunkflow/api/config.hpp"
#include "chunkflow/api/engine.hpp"
#include "chunkflow/api/remote.hpp"
#include "chunkflow/core/logging.hpp"
#include "chunkflow/core/units.hpp"
#include "chunkflow/events/components.hpp"
#include "chunkflow/events/event_bus.hpp"
#include "chunkflow/memory/memory_stats.hpp"
#include "chunkflow/transfer/local_transport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

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
    std::cout << "Usage: " << program << " <file-or-directory> [options]\n"
              << "\n"
              << "Destination (one of):\n"
              << "  -u, --url URL            Repository base URL\n"
              << "  -r, --repo NAME          Repository name\n"
              << "      --layout NAME        nexus (default) or artifactory\n"
              << "      --local-dest DIR     Mirror into a local directory instead\n"
              << "\n"
              << "Options:\n"
              << "  -t, --target PATH        Target path inside the repository\n"
              << "      --username USER      Defaults to $CHUNKFLOW_USERNAME\n"
              << "      --password PASS      Defaults to $CHUNKFLOW_PASSWORD\n"
              << "  -p, --parallel N         Workers for small files (default 3)\n"
              << "      --large-threshold MB Files at or above this go one at a time (default 100)\n"
              << "      --chunk-size KB|auto Chunk size (default auto)\n"
              << "      --retries N          Attempts per file (default 3)\n"
              << "      --no-validate        Skip the post-upload size/checksum check\n"
              << "      --insecure           Do not verify TLS certificates\n"
              << "  -c, --config FILE        JSON configuration file\n"
              << "      --log-file FILE      Also log to FILE\n"
              << "  -v, --verbose            Debug logging\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);

    std::string source_arg;
    std::string target;
    std::string layout = "nexus";
    std::string config_path;
    std::string log_file;
    std::string local_dest;
    bool verbose = false;
    chunkflow::api::RemoteOptions remote;

    std::optional<int> parallel;
    std::optional<int> retries;
    std::optional<std::uint64_t> large_threshold_mb;
    std::optional<std::string> chunk_size;
    bool no_validate = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-u" || arg == "--url") && i + 1 < argc) {
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
            } else if ((arg == "-p" || arg == "--parallel") && i + 1 < argc) {
                parallel = std::stoi(argv[++i]);
            } else if (arg == "--large-threshold" && i + 1 < argc) {
                large_threshold_mb = std::stoull(argv[++i]);
            } else if (arg == "--chunk-size" && i + 1 < argc) {
                chunk_size = argv[++i];
            } else if (arg == "--retries" && i + 1 < argc) {
                retries = std::stoi(argv[++i]);
            } else if (arg == "--no-validate") {
                no_validate = true;
            } else if (arg == "--insecure") {
                remote.verify_tls = false;
            } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                log_file = argv[++i];
            } else if (arg == "--local-dest" && i + 1 < argc) {
                local_dest = argv[++i];
            } else if (arg == "-v" || arg == "--verbose") {
                verbose = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return kExitOk;
            } else if (source_arg.empty() && !arg.empty() && arg[0] != '-') {
                source_arg = arg;
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << "\n";
                print_usage(argv[0]);
                return kExitFailed;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid numeric option: " << e.what() << "\n";
        return kExitFailed;
    }

    chunkflow::LoggingOptions logging;
    logging.level = verbose ? "debug" : "info";
    logging.log_file = log_file;
    if (auto res = chunkflow::configure_logging(logging); res.is_error()) {
        std::cerr << res.error() << "\n";
        return kExitFailed;
    }

    if (source_arg.empty()) {
        print_usage(argv[0]);
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
    if (parallel) {
        config.max_workers = std::max(1, *parallel);
    }
    if (retries) {
        config.max_retries = std::max(1, *retries);
    }
    if (large_threshold_mb) {
        config.large_threshold_bytes = *large_threshold_mb * chunkflow::kMiB;
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
    if (no_validate) {
        config.validate = false;
    }
    spdlog::debug("Effective configuration:\n{}", chunkflow::api::config_to_json(config));

    std::unique_ptr<chunkflow::transfer::Transport> transport;
    if (!local_dest.empty()) {
        transport = std::make_unique<chunkflow::transfer::LocalTransport>(fs::path(local_dest));
    } else {
        auto parsed_layout = chunkflow::api::parse_layout(layout);
        if (parsed_layout.is_error()) {
            spdlog::error("{}", parsed_layout.error());
            return kExitFailed;
        }
        remote.layout = parsed_layout.value();
        chunkflow::api::apply_credentials_from_env(remote);
        if (remote.username.empty() || remote.password.empty()) {
            spdlog::warn("No credentials given; uploading anonymously");
        }
        auto http = chunkflow::api::make_http_transport(remote, config);
        if (http.is_error()) {
            spdlog::error("{}", http.error());
            print_usage(argv[0]);
            return kExitFailed;
        }
        transport = http.take();
    }
    spdlog::info("Uploading to {}", transport->describe());

    chunkflow::memory::SystemMemoryStats memory;
    chunkflow::events::EventBus event_bus;
    chunkflow::events::LoggerComponent logger(event_bus);
    chunkflow::events::MetricsComponent metrics(event_bus);

    auto engine = chunkflow::api::Engine::create(config, transport.get(), memory, &event_bus);
    if (engine.is_error()) {
        spdlog::error("{}", engine.error());
        return kExitFailed;
    }

    auto items = chunkflow::api::Engine::collect_items(fs::path(source_arg), target);
    if (items.is_error()) {
        spdlog::error("{}", items.error());
        return kExitFailed;
    }
    if (items.value().empty()) {
        spdlog::warn("Nothing to upload under {}", source_arg);
        return kExitOk;
    }

    auto report = engine.value()->transfer(items.take());
    metrics.print_stats();

    return report.all_succeeded() ? kExitOk : kExitFailed;
}
