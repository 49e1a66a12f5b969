#include <gtest/gtest.h>
#include <memory>
#include "server/storage_manager.hpp"
#include "test_utils.hpp"

using namespace blobdvm;
using namespace blobdvm::server;

class StorageManagerTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        init_logging();
    }

    void SetUp() override {
        now = Clock::time_point(std::chrono::seconds(1700000000));
        config.max_file_size = 100000;
        config.chunk_size = 1000;
        config.retention_seconds = 3600;
    }

    // Manager whose clock reads the fixture's `now`
    std::unique_ptr<StorageManager> make_manager() {
        return std::make_unique<StorageManager>(config, [this] { return now; });
    }

    Clock::time_point now;
    config::StorageConfig config;
};

TEST_F(StorageManagerTest, StoreChunksAndHashesContent) {
    auto storage = make_manager();
    std::string data = make_payload(2500);

    auto record = storage->store(data, std::string("file.bin"));
    EXPECT_EQ(record->content_hash, crypto::sha256(data));
    EXPECT_EQ(record->total_size, 2500u);
    ASSERT_EQ(record->chunks.size(), 3u);
    EXPECT_EQ(record->chunks[2].size, 500u);
    EXPECT_EQ(record->name, std::optional<std::string>("file.bin"));
    EXPECT_EQ(record->created_at, now);
    EXPECT_EQ(record->expires_at, now + std::chrono::seconds(3600));
    EXPECT_EQ(record->expires_at_unix(), 1700003600u);

    EXPECT_TRUE(storage->contains(record->content_hash));
    EXPECT_EQ(storage->record_count(), 1u);
    EXPECT_EQ(storage->stored_bytes(), 2500u);
}

// The record's chunks reassemble to exactly the stored bytes
TEST_F(StorageManagerTest, RetrieveReturnsReassemblableRecord) {
    auto storage = make_manager();
    std::string data = make_payload(4321, 9);
    crypto::Digest hash = storage->store(data)->content_hash;

    auto record = storage->retrieve(hash);
    EXPECT_EQ(chunker::Chunker::reassemble(record->chunks), data);
}

TEST_F(StorageManagerTest, OversizedFileRejected) {
    auto storage = make_manager();
    try {
        storage->store(std::string(config.max_file_size + 1, 'x'));
        FAIL() << "Expected SizeExceeded";
    } catch (const SizeExceeded& e) {
        EXPECT_EQ(e.size(), config.max_file_size + 1);
        EXPECT_EQ(e.limit(), config.max_file_size);
    }
    EXPECT_EQ(storage->record_count(), 0u);
}

TEST_F(StorageManagerTest, FileAtExactLimitAccepted) {
    auto storage = make_manager();
    EXPECT_NO_THROW(storage->store(std::string(config.max_file_size, 'x')));
}

TEST_F(StorageManagerTest, EmptyFileStoresWithNoChunks) {
    auto storage = make_manager();
    auto record = storage->store("");
    EXPECT_TRUE(record->chunks.empty());
    EXPECT_EQ(record->total_size, 0u);
    EXPECT_EQ(storage->retrieve(crypto::sha256(""))->total_size, 0u);
}

TEST_F(StorageManagerTest, RetrieveUnknownThrowsNotFound) {
    auto storage = make_manager();
    EXPECT_THROW(storage->retrieve(crypto::sha256("never stored")), NotFound);
}

// Identical content keeps one record and refreshes its expiry
TEST_F(StorageManagerTest, RestoreRefreshesExpiry) {
    auto storage = make_manager();
    std::string data = make_payload(1500);
    auto first = storage->store(data);

    now += std::chrono::seconds(1000);
    auto second = storage->store(data);

    EXPECT_EQ(storage->record_count(), 1u);
    EXPECT_EQ(storage->stored_bytes(), 1500u);
    EXPECT_EQ(second->content_hash, first->content_hash);
    EXPECT_EQ(second->expires_at, now + std::chrono::seconds(3600));
    EXPECT_GT(second->expires_at, first->expires_at);
}

TEST_F(StorageManagerTest, ExpiredRecordIsPurgedOnRetrieve) {
    auto storage = make_manager();
    crypto::Digest hash = storage->store("short lived")->content_hash;

    now += std::chrono::seconds(3600);
    EXPECT_NO_THROW(storage->retrieve(hash));

    now += std::chrono::seconds(1);
    EXPECT_THROW(storage->retrieve(hash), NotFound);
    EXPECT_FALSE(storage->contains(hash));
    EXPECT_EQ(storage->stored_bytes(), 0u);
}

TEST_F(StorageManagerTest, RemoveDeletesRecord) {
    auto storage = make_manager();
    crypto::Digest hash = storage->store("to delete")->content_hash;

    storage->remove(hash);
    EXPECT_FALSE(storage->contains(hash));
    EXPECT_THROW(storage->retrieve(hash), NotFound);
    EXPECT_THROW(storage->remove(hash), NotFound);
}

// Records handed out earlier stay valid after removal
TEST_F(StorageManagerTest, RecordOutlivesRemoval) {
    auto storage = make_manager();
    std::string data = make_payload(3000);
    auto record = storage->store(data);

    storage->remove(record->content_hash);
    EXPECT_EQ(chunker::Chunker::reassemble(record->chunks), data);
}

TEST_F(StorageManagerTest, SweepRemovesOnlyExpired) {
    auto storage = make_manager();
    crypto::Digest old_hash = storage->store("old")->content_hash;

    now += std::chrono::seconds(1800);
    crypto::Digest new_hash = storage->store("new")->content_hash;

    now += std::chrono::seconds(1801);
    EXPECT_EQ(storage->sweep(), 1u);
    EXPECT_FALSE(storage->contains(old_hash));
    EXPECT_TRUE(storage->contains(new_hash));

    EXPECT_EQ(storage->sweep(now + std::chrono::hours(2)), 1u);
    EXPECT_EQ(storage->record_count(), 0u);
}

TEST_F(StorageManagerTest, SweepOnEmptyStoreIsNoop) {
    auto storage = make_manager();
    EXPECT_EQ(storage->sweep(), 0u);
}

TEST_F(StorageManagerTest, CapacityLimitRaisesStorageFull) {
    config.max_storage_bytes = config.max_file_size;
    auto storage = make_manager();

    storage->store(std::string(60000, 'a'));
    EXPECT_THROW(storage->store(std::string(60000, 'b')), StorageFull);
    EXPECT_EQ(storage->record_count(), 1u);
}

// A full store reclaims expired records before refusing
TEST_F(StorageManagerTest, CapacityReclaimedFromExpiredRecords) {
    config.max_storage_bytes = config.max_file_size;
    auto storage = make_manager();

    storage->store(std::string(60000, 'a'));
    now += std::chrono::seconds(3601);
    EXPECT_NO_THROW(storage->store(std::string(60000, 'b')));
    EXPECT_EQ(storage->record_count(), 1u);
    EXPECT_EQ(storage->stored_bytes(), 60000u);
}

TEST_F(StorageManagerTest, RestoreDoesNotCountAgainstCapacity) {
    config.max_storage_bytes = config.max_file_size;
    auto storage = make_manager();

    std::string data(60000, 'a');
    storage->store(data);
    EXPECT_NO_THROW(storage->store(data));
}
