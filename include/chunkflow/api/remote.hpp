#pragma once

#include "chunkflow/api/config.hpp"
#include "chunkflow/core/result.hpp"
#include "chunkflow/transfer/transport.hpp"

#include <memory>
#include <string>

namespace chunkflow::api {

/// URL layout of the artifact repository being uploaded to.
enum class RepositoryLayout {
    Nexus,        // <url>/repository/<repo>/<path>
    Artifactory   // <url>/<repo>/<path>
};

Result<RepositoryLayout> parse_layout(const std::string& name);

struct RemoteOptions {
    std::string url;
    std::string repository;
    RepositoryLayout layout = RepositoryLayout::Nexus;
    std::string username;
    std::string password;
    bool verify_tls = true;
};

/// Path prefix a repository lives under for the given layout.
std::string repository_prefix(RepositoryLayout layout, const std::string& repository);

/**
 * @brief Fills empty credentials from CHUNKFLOW_USERNAME / CHUNKFLOW_PASSWORD
 *
 * Values already set (from flags) win.
 */
void apply_credentials_from_env(RemoteOptions& remote);

/// HTTP transport for @p remote with the timeouts of @p config.
Result<std::unique_ptr<transfer::Transport>> make_http_transport(const RemoteOptions& remote,
                                                                 const EngineConfig& config);

} // namespace chunkflow::api
