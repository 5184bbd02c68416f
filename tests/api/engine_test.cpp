#include "chunkflow/api/engine.hpp"
#include "chunkflow/archive/archive_reader.hpp"
#include "chunkflow/events/components.hpp"
#include "chunkflow/transfer/local_transport.hpp"

#include "../support/scripted_transport.hpp"

#include <gtest/gtest.h>

using namespace chunkflow;
using chunkflow::api::Engine;
using chunkflow::api::EngineConfig;
using chunkflow::api::join_destination;
using chunkflow::memory::FixedMemoryStats;
using chunkflow::testing::TempDir;
using chunkflow::testing::pattern;
using chunkflow::testing::read_file;
using chunkflow::testing::write_file;

namespace fs = std::filesystem;

namespace {

EngineConfig fast_config() {
    EngineConfig config;
    config.backoff_base_seconds = 0.0;
    config.archive_retry_delay_seconds = 0.0;
    return config;
}

} // namespace

TEST(JoinDestinationTest, NormalizesSlashes) {
    EXPECT_EQ(join_destination("releases/1.0", "lib/a.jar"), "releases/1.0/lib/a.jar");
    EXPECT_EQ(join_destination("releases/1.0/", "/lib/a.jar"), "releases/1.0/lib/a.jar");
    EXPECT_EQ(join_destination("", "lib/a.jar"), "lib/a.jar");
    EXPECT_EQ(join_destination("", "//a.jar"), "a.jar");
}

TEST(CollectItemsTest, SingleFileMapsToPrefixAndName) {
    TempDir dir;
    write_file(dir / "app.tar", "payload");

    auto items = Engine::collect_items(dir / "app.tar", "dist/2.1");
    ASSERT_TRUE(items.is_ok()) << items.error();
    ASSERT_EQ(items.value().size(), 1u);
    EXPECT_EQ(items.value()[0].destination_path, "dist/2.1/app.tar");
    EXPECT_EQ(items.value()[0].size_bytes, 7u);
}

TEST(CollectItemsTest, DirectoryIsWalkedRecursively) {
    TempDir dir;
    write_file(dir / "tree" / "b.txt", "bb");
    write_file(dir / "tree" / "a" / "deep" / "c.txt", "ccc");
    write_file(dir / "tree" / "a" / "d.txt", "d");
    fs::create_directories(dir / "tree" / "empty");

    auto items = Engine::collect_items(dir / "tree", "drop/");
    ASSERT_TRUE(items.is_ok()) << items.error();
    ASSERT_EQ(items.value().size(), 3u);
    EXPECT_EQ(items.value()[0].destination_path, "drop/a/d.txt");
    EXPECT_EQ(items.value()[1].destination_path, "drop/a/deep/c.txt");
    EXPECT_EQ(items.value()[2].destination_path, "drop/b.txt");
    EXPECT_EQ(items.value()[1].size_bytes, 3u);
}

TEST(CollectItemsTest, MissingSourceIsAnError) {
    TempDir dir;
    EXPECT_TRUE(Engine::collect_items(dir / "nothing", "x").is_error());
}

TEST(EngineTest, RejectsInvalidConfiguration) {
    EngineConfig config;
    config.digest = "crc";
    FixedMemoryStats memory(kGiB, 2 * kGiB);
    EXPECT_TRUE(Engine::create(config, nullptr, memory).is_error());
}

TEST(EngineTest, TransfersDirectoryToLocalRoot) {
    TempDir dir;
    write_file(dir / "src" / "small.txt", "hello");
    write_file(dir / "src" / "nested" / "blob.bin", pattern(300000, 4));

    transfer::LocalTransport transport(dir / "remote");
    FixedMemoryStats memory(4 * kGiB, 8 * kGiB);
    events::EventBus bus;
    events::MetricsComponent metrics(bus);

    auto engine = Engine::create(fast_config(), &transport, memory, &bus);
    ASSERT_TRUE(engine.is_ok()) << engine.error();

    auto items = Engine::collect_items(dir / "src", "releases/1.0");
    ASSERT_TRUE(items.is_ok()) << items.error();
    auto report = engine.value()->transfer(items.take());

    EXPECT_TRUE(report.all_succeeded());
    EXPECT_EQ(report.outcomes.size(), 2u);
    EXPECT_EQ(read_file(dir / "remote" / "releases" / "1.0" / "small.txt"), "hello");
    EXPECT_EQ(read_file(dir / "remote" / "releases" / "1.0" / "nested" / "blob.bin"), pattern(300000, 4));
    EXPECT_EQ(metrics.get_stats().files_transferred.load(), 2u);

    const auto* outcome = report.find("releases/1.0/small.txt");
    ASSERT_NE(outcome, nullptr);
    EXPECT_EQ(outcome->validation.strength, transfer::ValidationStrength::Full);
}

TEST(EngineTest, WithoutTransportEveryItemIsRejected) {
    TempDir dir;
    write_file(dir / "a.txt", "a");
    write_file(dir / "b.txt", "b");

    FixedMemoryStats memory(kGiB, 2 * kGiB);
    auto engine = Engine::create(fast_config(), nullptr, memory);
    ASSERT_TRUE(engine.is_ok()) << engine.error();

    auto report = engine.value()->transfer({{dir / "a.txt", "a.txt", 1}, {dir / "b.txt", "b.txt", 1}});
    ASSERT_EQ(report.outcomes.size(), 2u);
    EXPECT_EQ(report.failed_count(), 2u);
    for (const auto& outcome : report.outcomes) {
        ASSERT_TRUE(outcome.error_kind.has_value());
        EXPECT_EQ(*outcome.error_kind, ErrorKind::TransportRejected);
        EXPECT_EQ(outcome.attempts, 0);
    }
}

TEST(EngineTest, BuildsArchiveExcludingItsOwnContainer) {
    TempDir dir;
    write_file(dir / "tree" / "a.txt", "alpha");
    write_file(dir / "tree" / "sub" / "b.txt", std::string(5000, 'b'));
    write_file(dir / "tree" / "stale.zip", "old archive");

    auto config = fast_config();
    config.compress = true;
    FixedMemoryStats memory(4 * kGiB, 8 * kGiB);
    events::EventBus bus;
    events::MetricsComponent metrics(bus);
    auto engine = Engine::create(config, nullptr, memory, &bus);
    ASSERT_TRUE(engine.is_ok()) << engine.error();

    // Container inside the tree being archived must not archive itself.
    const auto container = dir / "tree" / "tree.zip";
    auto result = engine.value()->build_archive(dir / "tree", container);

    ASSERT_TRUE(result.succeeded) << result.error;
    EXPECT_EQ(result.entries.size(), 2u);
    EXPECT_TRUE(result.validation.passed());
    EXPECT_EQ(metrics.get_stats().archives_built.load(), 1u);

    auto listed = archive::list_container(container);
    ASSERT_TRUE(listed.is_ok()) << listed.error();
    ASSERT_EQ(listed.value().size(), 2u);
    for (const auto& entry : listed.value()) {
        EXPECT_NE(entry.name, "stale.zip");
    }
    EXPECT_EQ(archive::read_container_entry(container, "sub/b.txt").value(), std::string(5000, 'b'));
}

TEST(EngineTest, ArchiveOfMissingTreeIsNotFound) {
    TempDir dir;
    FixedMemoryStats memory(kGiB, 2 * kGiB);
    auto engine = Engine::create(fast_config(), nullptr, memory);
    ASSERT_TRUE(engine.is_ok()) << engine.error();

    auto result = engine.value()->build_archive(dir / "absent", dir / "absent.zip");
    EXPECT_FALSE(result.succeeded);
    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(*result.error_kind, ErrorKind::NotFound);
}

TEST(EngineTest, LogsMemoryInfoEvenWhenProviderFails) {
    auto failing = FixedMemoryStats::failing("no /proc");
    EXPECT_NO_THROW(api::log_memory_info(failing, 5));
    EXPECT_NO_THROW(api::log_memory_info(FixedMemoryStats(kGiB, 2 * kGiB)));
}
