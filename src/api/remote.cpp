#include "chunkflow/api/remote.hpp"

#include "chunkflow/net/http_transport.hpp"

#include <chrono>
#include <cstdlib>

namespace chunkflow::api {

Result<RepositoryLayout> parse_layout(const std::string& name) {
    if (name == "nexus") {
        return Ok(RepositoryLayout::Nexus);
    }
    if (name == "artifactory") {
        return Ok(RepositoryLayout::Artifactory);
    }
    return Err<RepositoryLayout>("Unknown repository layout: " + name + " (expected nexus or artifactory)");
}

std::string repository_prefix(RepositoryLayout layout, const std::string& repository) {
    if (layout == RepositoryLayout::Nexus) {
        return "repository/" + repository;
    }
    return repository;
}

void apply_credentials_from_env(RemoteOptions& remote) {
    if (remote.username.empty()) {
        if (const char* value = std::getenv("CHUNKFLOW_USERNAME")) {
            remote.username = value;
        }
    }
    if (remote.password.empty()) {
        if (const char* value = std::getenv("CHUNKFLOW_PASSWORD")) {
            remote.password = value;
        }
    }
}

Result<std::unique_ptr<transfer::Transport>> make_http_transport(const RemoteOptions& remote,
                                                                 const EngineConfig& config) {
    if (remote.url.empty()) {
        return Err<std::unique_ptr<transfer::Transport>>(std::string("Repository URL is required"));
    }
    if (remote.repository.empty()) {
        return Err<std::unique_ptr<transfer::Transport>>(std::string("Repository name is required"));
    }

    net::HttpTransportOptions options;
    options.base_url = remote.url;
    options.path_prefix = repository_prefix(remote.layout, remote.repository);
    options.username = remote.username;
    options.password = remote.password;
    options.connect_timeout = std::chrono::seconds(config.connect_timeout_seconds);
    options.read_timeout = std::chrono::seconds(config.read_timeout_seconds);
    options.verify_tls = remote.verify_tls;

    auto transport = net::HttpTransport::create(std::move(options));
    if (transport.is_error()) {
        return Err<std::unique_ptr<transfer::Transport>>(transport.error());
    }
    return Ok(std::unique_ptr<transfer::Transport>(transport.take()));
}

} // namespace chunkflow::api
