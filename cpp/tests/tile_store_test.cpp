#include <gtest/gtest.h>
#include "tessera/storage/tile_store.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace tessera::storage;
using namespace tessera::core;

namespace {

std::vector<StoreRecord> make_records(std::initializer_list<i64> keys) {
    std::vector<StoreRecord> out;
    for (i64 k : keys) {
        StoreRecord r;
        r.key = k;
        r.value.assign(static_cast<size_t>(k % 7) + 1, static_cast<u8>(k & 0xff));
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<i64> keys_of(const std::vector<StoreRecord>& rows) {
    std::vector<i64> out;
    for (const StoreRecord& r : rows) {
        out.push_back(r.key);
    }
    return out;
}

// Behaviour every TileStore must share.
void exercise_store(TileStore& store) {
    ASSERT_TRUE(is_ok(store.write("roads/3", make_records({40, 2, 17, 9, 100}))));

    std::vector<StoreRecord> rows;
    ASSERT_TRUE(is_ok(store.scan("roads/3", {0, 1000}, &rows)));
    EXPECT_EQ(keys_of(rows), (std::vector<i64>{2, 9, 17, 40, 100}));
    EXPECT_EQ(rows[2].value, std::vector<u8>(17 % 7 + 1, 17));

    // Inclusive on both ends, appends to out.
    ASSERT_TRUE(is_ok(store.scan("roads/3", {9, 17}, &rows)));
    EXPECT_EQ(rows.size(), 7u);
    EXPECT_EQ(rows[5].key, 9);
    EXPECT_EQ(rows[6].key, 17);

    rows.clear();
    ASSERT_TRUE(is_ok(store.scan("roads/3", {41, 99}, &rows)));
    EXPECT_TRUE(rows.empty());

    // Rewrite replaces the partition.
    ASSERT_TRUE(is_ok(store.write("roads/3", make_records({5}))));
    ASSERT_TRUE(is_ok(store.scan("roads/3", {0, 1000}, &rows)));
    EXPECT_EQ(keys_of(rows), (std::vector<i64>{5}));

    // Partitions are isolated.
    ASSERT_TRUE(is_ok(store.write("roads/4", make_records({5, 6}))));
    rows.clear();
    ASSERT_TRUE(is_ok(store.scan("roads/3", {0, 1000}, &rows)));
    EXPECT_EQ(rows.size(), 1u);

    EXPECT_EQ(store.write("roads/5", make_records({1, 2, 1})).code, StatusCode::Conflict);
    EXPECT_EQ(store.scan("roads/5", {0, 10}, &rows).code, StatusCode::NotFound);
    EXPECT_EQ(store.scan("roads/3", {10, 0}, &rows).code, StatusCode::Invalid);

    ASSERT_TRUE(is_ok(store.remove("roads/3")));
    EXPECT_EQ(store.scan("roads/3", {0, 1000}, &rows).code, StatusCode::NotFound);
    EXPECT_EQ(store.remove("roads/3").code, StatusCode::NotFound);
}

} // namespace

// ============================================================================
// Partition selectors
// ============================================================================

TEST(TileStore, PartitionSelectorValidation) {
    EXPECT_TRUE(partition_valid("layer/0"));
    EXPECT_TRUE(partition_valid("a.b/c..d/12"));
    EXPECT_FALSE(partition_valid(""));
    EXPECT_FALSE(partition_valid("/abs/0"));
    EXPECT_FALSE(partition_valid("layer/"));
    EXPECT_FALSE(partition_valid("a//b"));
    EXPECT_FALSE(partition_valid("../escape"));
    EXPECT_FALSE(partition_valid("a/./b"));
}

// ============================================================================
// MemoryTileStore
// ============================================================================

TEST(MemoryTileStore, BasicOperations) {
    MemoryTileStore store;
    exercise_store(store);
}

TEST(MemoryTileStore, RowCount) {
    MemoryTileStore store;
    EXPECT_EQ(store.row_count("x/1"), 0u);
    ASSERT_TRUE(is_ok(store.write("x/1", make_records({1, 2, 3}))));
    EXPECT_EQ(store.row_count("x/1"), 3u);
}

TEST(MemoryTileStore, EmptyPartitionIsNotMissing) {
    MemoryTileStore store;
    ASSERT_TRUE(is_ok(store.write("x/1", {})));
    std::vector<StoreRecord> rows;
    EXPECT_TRUE(is_ok(store.scan("x/1", {0, 10}, &rows)));
    EXPECT_TRUE(rows.empty());
}

// ============================================================================
// FileTileStore
// ============================================================================

class FileTileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        system("rm -rf /tmp/tessera_test_tiles");
        mkdir("/tmp/tessera_test_tiles", 0755);
        config_.data_root = "/tmp/tessera_test_tiles";
    }

    void TearDown() override {
        system("rm -rf /tmp/tessera_test_tiles");
    }

    FileTileStoreConfig config_;
};

TEST_F(FileTileStoreTest, BasicOperations) {
    FileTileStore store(config_);
    exercise_store(store);
}

TEST_F(FileTileStoreTest, SegmentLivesUnderPartition) {
    FileTileStore store(config_);
    ASSERT_TRUE(is_ok(store.write("elevation/7", make_records({1, 2}))));

    const std::string path = store.segment_path("elevation/7");
    EXPECT_EQ(path, "/tmp/tessera_test_tiles/elevation/7/tiles.seg");
    struct stat st{};
    EXPECT_EQ(stat(path.c_str(), &st), 0);
}

TEST_F(FileTileStoreTest, EmptyPartitionIsNotMissing) {
    FileTileStore store(config_);
    ASSERT_TRUE(is_ok(store.write("x/1", {})));
    std::vector<StoreRecord> rows;
    EXPECT_TRUE(is_ok(store.scan("x/1", {0, 10}, &rows)));
    EXPECT_TRUE(rows.empty());
}

TEST_F(FileTileStoreTest, ManyRecordsBinarySearch) {
    FileTileStore store(config_);
    std::vector<StoreRecord> records;
    for (i64 k = 0; k < 5000; k += 3) {
        StoreRecord r;
        r.key = k;
        r.value = {static_cast<u8>(k), static_cast<u8>(k >> 8)};
        records.push_back(std::move(r));
    }
    ASSERT_TRUE(is_ok(store.write("big/0", records)));

    std::vector<StoreRecord> rows;
    ASSERT_TRUE(is_ok(store.scan("big/0", {1000, 1010}, &rows)));
    EXPECT_EQ(keys_of(rows), (std::vector<i64>{1002, 1005, 1008}));
    EXPECT_EQ(rows[0].value, (std::vector<u8>{static_cast<u8>(1002), static_cast<u8>(1002 >> 8)}));
}

TEST_F(FileTileStoreTest, RejectsBadSelector) {
    FileTileStore store(config_);
    EXPECT_EQ(store.write("../outside", make_records({1})).code, StatusCode::Invalid);
    std::vector<StoreRecord> rows;
    EXPECT_EQ(store.scan("/etc", {0, 1}, &rows).code, StatusCode::Invalid);
}

TEST_F(FileTileStoreTest, VerifyOnReadDetectsFlippedPayload) {
    {
        FileTileStore store(config_);
        ASSERT_TRUE(is_ok(store.write("v/1", make_records({1, 2, 3}))));
    }

    // Last byte of the file belongs to the payload.
    const std::string path = "/tmp/tessera_test_tiles/v/1/tiles.seg";
    FILE* f = std::fopen(path.c_str(), "r+b");
    ASSERT_NE(f, nullptr);
    ASSERT_EQ(std::fseek(f, -1, SEEK_END), 0);
    const int c = std::fgetc(f);
    ASSERT_NE(c, EOF);
    ASSERT_EQ(std::fseek(f, -1, SEEK_END), 0);
    std::fputc(c ^ 0xff, f);
    std::fclose(f);

    std::vector<StoreRecord> rows;
    FileTileStore lax(config_);
    EXPECT_TRUE(is_ok(lax.scan("v/1", {0, 10}, &rows)));

    config_.verify_on_read = true;
    FileTileStore strict(config_);
    rows.clear();
    const Status s = strict.scan("v/1", {0, 10}, &rows);
    EXPECT_EQ(s.code, StatusCode::Corrupt);
    EXPECT_EQ(s.domain, StatusDomain::Storage);
}

TEST_F(FileTileStoreTest, TruncatedSegmentIsCorrupt) {
    FileTileStore store(config_);
    ASSERT_TRUE(is_ok(store.write("t/1", make_records({1, 2, 3}))));
    ASSERT_EQ(truncate("/tmp/tessera_test_tiles/t/1/tiles.seg", 40), 0);

    std::vector<StoreRecord> rows;
    EXPECT_EQ(store.scan("t/1", {0, 10}, &rows).code, StatusCode::Corrupt);
}

TEST_F(FileTileStoreTest, ConcurrentScansDuringRewrite) {
    FileTileStore store(config_);
    ASSERT_TRUE(is_ok(store.write("c/1", make_records({1, 2, 3, 4}))));

    std::vector<std::thread> readers;
    std::vector<int> failures(4, 0);
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&, t] {
            for (int i = 0; i < 200; ++i) {
                std::vector<StoreRecord> rows;
                const Status s = store.scan("c/1", {0, 100}, &rows);
                // Either segment is complete: 4 rows before the rewrite, 2 after.
                if (!is_ok(s) || (rows.size() != 4 && rows.size() != 2)) {
                    ++failures[t];
                }
            }
        });
    }
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(is_ok(store.write("c/1", i % 2 ? make_records({1, 2, 3, 4}) : make_records({7, 8}))));
    }
    for (std::thread& t : readers) {
        t.join();
    }
    for (int f : failures) {
        EXPECT_EQ(f, 0);
    }
}
