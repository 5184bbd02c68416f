#include "chunkflow/transfer/local_transport.hpp"

#include "chunkflow/transfer/chunk_stream.hpp"

#include "../support/scripted_transport.hpp"

#include <gtest/gtest.h>

using chunkflow::testing::TempDir;
using chunkflow::testing::pattern;
using chunkflow::testing::read_file;
using chunkflow::testing::write_file;
using chunkflow::transfer::ChunkStream;
using chunkflow::transfer::DigestAlgorithm;
using chunkflow::transfer::LocalTransport;

TEST(LocalTransportTest, PutWritesFileAndHeadDescribesIt) {
    TempDir source;
    TempDir mirror;
    const auto data = pattern(5000);
    write_file(source / "a.bin", data);

    LocalTransport transport(mirror.path());
    ChunkStream stream(source / "a.bin", 1024);
    ASSERT_TRUE(stream.open().is_ok());
    auto put = transport.put_stream("dir/a.bin", stream, {}, data.size());
    ASSERT_TRUE(put.is_ok()) << put.error();
    EXPECT_EQ(put.value().status_code, 201);
    EXPECT_EQ(read_file(mirror / "dir/a.bin"), data);
    EXPECT_FALSE(std::filesystem::exists(mirror / "dir/a.bin.part"));

    auto head = transport.head("dir/a.bin");
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(head.value().status_code, 200);
    EXPECT_EQ(head.value().content_length(), data.size());
    EXPECT_EQ(head.value().header("x-checksum-md5"), chunkflow::testing::md5_of(data));
}

TEST(LocalTransportTest, HeadOfMissingFileIs404) {
    TempDir mirror;
    LocalTransport transport(mirror.path());
    auto head = transport.head("nope.bin");
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(head.value().status_code, 404);
}

TEST(LocalTransportTest, WithoutExposedDigestOnlySizeIsReported) {
    TempDir source;
    TempDir mirror;
    write_file(source / "a.bin", "abc");

    LocalTransport transport(mirror.path(), std::nullopt);
    ChunkStream stream(source / "a.bin", 16);
    ASSERT_TRUE(stream.open().is_ok());
    ASSERT_TRUE(transport.put_stream("a.bin", stream, {}, 3).is_ok());

    auto head = transport.head("a.bin");
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(head.value().content_length(), 3u);
    EXPECT_FALSE(head.value().header("X-Checksum-Md5").has_value());
}

TEST(LocalTransportTest, RejectsPathsEscapingTheRoot) {
    TempDir source;
    TempDir mirror;
    write_file(source / "a.bin", "abc");

    LocalTransport transport(mirror.path());
    EXPECT_FALSE(transport.resolve("../outside.bin").has_value());
    EXPECT_FALSE(transport.resolve("a/../../outside.bin").has_value());
    EXPECT_TRUE(transport.resolve("/absolute/inside.bin").has_value());

    ChunkStream stream(source / "a.bin", 16);
    ASSERT_TRUE(stream.open().is_ok());
    auto put = transport.put_stream("../outside.bin", stream, {}, 3);
    ASSERT_TRUE(put.is_ok());
    EXPECT_EQ(put.value().status_code, 400);
}

TEST(LocalTransportTest, OverwritesExistingFile) {
    TempDir source;
    TempDir mirror;
    write_file(mirror / "a.bin", "old contents that are longer");
    write_file(source / "a.bin", "new");

    LocalTransport transport(mirror.path(), DigestAlgorithm::Sha256);
    ChunkStream stream(source / "a.bin", 16);
    ASSERT_TRUE(stream.open().is_ok());
    ASSERT_TRUE(transport.put_stream("a.bin", stream, {}, 3).is_ok());
    EXPECT_EQ(read_file(mirror / "a.bin"), "new");

    auto head = transport.head("a.bin");
    ASSERT_TRUE(head.is_ok());
    EXPECT_TRUE(head.value().header("X-Checksum-Sha256").has_value());
}
