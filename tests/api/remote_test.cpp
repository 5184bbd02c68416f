#include "chunkflow/api/remote.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace chunkflow::api;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name_, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST(RemoteTest, ParsesLayouts) {
    EXPECT_EQ(parse_layout("nexus").value(), RepositoryLayout::Nexus);
    EXPECT_EQ(parse_layout("artifactory").value(), RepositoryLayout::Artifactory);
    EXPECT_TRUE(parse_layout("s3").is_error());
}

TEST(RemoteTest, RepositoryPrefixFollowsLayout) {
    EXPECT_EQ(repository_prefix(RepositoryLayout::Nexus, "releases"), "repository/releases");
    EXPECT_EQ(repository_prefix(RepositoryLayout::Artifactory, "libs-release"), "libs-release");
}

TEST(RemoteTest, EnvironmentFillsMissingCredentialsOnly) {
    ScopedEnv user("CHUNKFLOW_USERNAME", "env-user");
    ScopedEnv pass("CHUNKFLOW_PASSWORD", "env-pass");

    RemoteOptions empty;
    apply_credentials_from_env(empty);
    EXPECT_EQ(empty.username, "env-user");
    EXPECT_EQ(empty.password, "env-pass");

    RemoteOptions given;
    given.username = "flag-user";
    apply_credentials_from_env(given);
    EXPECT_EQ(given.username, "flag-user");
    EXPECT_EQ(given.password, "env-pass");
}

TEST(RemoteTest, HttpTransportNeedsUrlAndRepository) {
    EngineConfig config;
    RemoteOptions remote;
    EXPECT_TRUE(make_http_transport(remote, config).is_error());

    remote.url = "http://repo.example.com:8081";
    EXPECT_TRUE(make_http_transport(remote, config).is_error());

    remote.repository = "releases";
    auto transport = make_http_transport(remote, config);
    ASSERT_TRUE(transport.is_ok()) << transport.error();
    EXPECT_NE(transport.value()->describe().find("repository/releases"), std::string::npos);

    remote.url = "ftp://repo.example.com";
    EXPECT_TRUE(make_http_transport(remote, config).is_error());
}
