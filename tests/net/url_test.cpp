#include "chunkflow/net/url.hpp"

#include <gtest/gtest.h>

using namespace chunkflow::net;

TEST(UrlTest, ParsesSchemeHostPortAndPath) {
    auto url = parse_url("https://nexus.example.com:8443/base/");
    ASSERT_TRUE(url.is_ok()) << url.error();
    EXPECT_EQ(url.value().scheme, "https");
    EXPECT_EQ(url.value().host, "nexus.example.com");
    EXPECT_EQ(url.value().port, 8443);
    EXPECT_EQ(url.value().path, "/base/");
    EXPECT_TRUE(url.value().is_tls());
    EXPECT_EQ(url.value().host_header(), "nexus.example.com:8443");
}

TEST(UrlTest, DefaultPortsAndPath) {
    auto http = parse_url("HTTP://artifacts.local");
    ASSERT_TRUE(http.is_ok());
    EXPECT_EQ(http.value().scheme, "http");
    EXPECT_EQ(http.value().port, 80);
    EXPECT_EQ(http.value().path, "/");
    EXPECT_EQ(http.value().host_header(), "artifacts.local");
    EXPECT_EQ(http.value().to_string(), "http://artifacts.local/");

    auto https = parse_url("https://artifacts.local?x=1");
    ASSERT_TRUE(https.is_ok());
    EXPECT_EQ(https.value().port, 443);
    EXPECT_EQ(https.value().path, "/");
}

TEST(UrlTest, RejectsUnsupportedInput) {
    EXPECT_TRUE(parse_url("nexus.example.com").is_error());
    EXPECT_TRUE(parse_url("ftp://nexus.example.com").is_error());
    EXPECT_TRUE(parse_url("http://user:pw@nexus.example.com").is_error());
    EXPECT_TRUE(parse_url("http://:8080/").is_error());
    EXPECT_TRUE(parse_url("http://host:0/").is_error());
    EXPECT_TRUE(parse_url("http://host:70000/").is_error());
    EXPECT_TRUE(parse_url("http://host:80a/").is_error());
}

TEST(UrlTest, JoinPathUsesSingleSlashes) {
    EXPECT_EQ(join_path("/", "repository/raw"), "/repository/raw");
    EXPECT_EQ(join_path("/base/", "/a/b.bin"), "/base/a/b.bin");
    EXPECT_EQ(join_path("/base", ""), "/base");
    EXPECT_EQ(join_path("", ""), "/");
}

TEST(UrlTest, EncodePathKeepsSlashesAndUnreserved) {
    EXPECT_EQ(encode_path("dir/file-1.0_~x.bin"), "dir/file-1.0_~x.bin");
    EXPECT_EQ(encode_path("my file+v2.bin"), "my%20file%2Bv2.bin");
    EXPECT_EQ(encode_path("caf\xc3\xa9"), "caf%C3%A9");
}
