#include "chunkflow/transfer/chunk_stream.hpp"
#include "chunkflow/transfer/progress.hpp"

#include "../support/scripted_transport.hpp"

#include <gtest/gtest.h>

using chunkflow::testing::TempDir;
using chunkflow::testing::pattern;
using chunkflow::testing::write_file;
using chunkflow::transfer::Chunk;
using chunkflow::transfer::ChunkStream;
using chunkflow::transfer::ProgressTracker;

TEST(ChunkStreamTest, YieldsContiguousChunksThatConcatenateToTheFile) {
    TempDir dir;
    const auto data = pattern(10 * 1024 + 123);
    write_file(dir / "data.bin", data);

    ProgressTracker progress("data.bin", data.size());
    ChunkStream stream(dir / "data.bin", 1024, &progress);
    ASSERT_TRUE(stream.open().is_ok());

    std::string rebuilt;
    std::uint64_t expected_offset = 0;
    Chunk chunk;
    int count = 0;
    while (true) {
        auto more = stream.next(chunk);
        ASSERT_TRUE(more.is_ok()) << more.error();
        if (!more.value()) {
            break;
        }
        EXPECT_LE(chunk.size, 1024u);
        EXPECT_EQ(chunk.offset, expected_offset);
        expected_offset += chunk.size;
        rebuilt.append(reinterpret_cast<const char*>(chunk.data), chunk.size);
        ++count;
    }

    EXPECT_EQ(count, 11);
    EXPECT_EQ(rebuilt, data);
    EXPECT_EQ(stream.bytes_read(), data.size());
    EXPECT_TRUE(stream.exhausted());
    EXPECT_EQ(progress.state().transferred_bytes, data.size());
}

TEST(ChunkStreamTest, ExactMultipleHasNoEmptyTail) {
    TempDir dir;
    write_file(dir / "data.bin", pattern(4096));
    ChunkStream stream(dir / "data.bin", 1024);
    ASSERT_TRUE(stream.open().is_ok());

    Chunk chunk;
    int count = 0;
    while (stream.next(chunk).value()) {
        EXPECT_EQ(chunk.size, 1024u);
        ++count;
    }
    EXPECT_EQ(count, 4);
}

TEST(ChunkStreamTest, EmptyFileYieldsNothing) {
    TempDir dir;
    write_file(dir / "empty.bin", "");
    ChunkStream stream(dir / "empty.bin", 1024);
    ASSERT_TRUE(stream.open().is_ok());

    Chunk chunk;
    auto more = stream.next(chunk);
    ASSERT_TRUE(more.is_ok());
    EXPECT_FALSE(more.value());
    EXPECT_TRUE(stream.exhausted());
}

TEST(ChunkStreamTest, IsNotRestartable) {
    TempDir dir;
    write_file(dir / "data.bin", "abc");
    ChunkStream stream(dir / "data.bin", 2);
    ASSERT_TRUE(stream.open().is_ok());
    EXPECT_TRUE(stream.open().is_error());

    Chunk chunk;
    EXPECT_TRUE(stream.next(chunk).value());
    EXPECT_TRUE(stream.next(chunk).value());
    EXPECT_FALSE(stream.next(chunk).value());
    EXPECT_FALSE(stream.next(chunk).value());
}

TEST(ChunkStreamTest, OpenErrors) {
    TempDir dir;
    ChunkStream missing(dir / "absent.bin", 1024);
    EXPECT_TRUE(missing.open().is_error());

    write_file(dir / "data.bin", "abc");
    ChunkStream zero(dir / "data.bin", 0);
    EXPECT_TRUE(zero.open().is_error());

    ChunkStream unopened(dir / "data.bin", 1024);
    Chunk chunk;
    EXPECT_TRUE(unopened.next(chunk).is_error());
}

TEST(ChunkStreamTest, ReadErrorFromOpenedSourceIsReported) {
    const auto data = pattern(10000);
    ChunkStream stream("data.bin", 4096, nullptr, [&](const std::filesystem::path&) -> std::unique_ptr<std::istream> {
        return std::make_unique<chunkflow::testing::FailingSource>(data, 6000);
    });
    ASSERT_TRUE(stream.open().is_ok());

    Chunk chunk;
    auto first = stream.next(chunk);
    ASSERT_TRUE(first.is_ok()) << first.error();
    EXPECT_EQ(chunk.size, 4096u);

    auto second = stream.next(chunk);
    ASSERT_TRUE(second.is_error());
    EXPECT_NE(second.error().find("offset 4096"), std::string::npos);
    EXPECT_FALSE(stream.next(chunk).value());
}

TEST(ChunkStreamTest, NullSourceIsAnOpenError) {
    ChunkStream stream("data.bin", 1024, nullptr,
                       [](const std::filesystem::path&) { return std::unique_ptr<std::istream>(); });
    EXPECT_TRUE(stream.open().is_error());
}
