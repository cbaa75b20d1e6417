/**
 * @file test_status_tracker.cpp
 * @brief Snapshot reads under concurrent publishing
 */

#include <gtest/gtest.h>
#include "MockStores.h"
#include "SQLiteMetadataStore.h"
#include "TransferStatusTracker.h"
#include <thread>

using namespace ChunkVault;

class TransferStatusTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scratch_ = std::make_unique<ScratchDir>("chunkvault_tracker");
        auto opened = SQLiteMetadataStore::open(scratch_->file("meta.db"));
        ASSERT_TRUE(opened.isOk());
        store_ = opened.value();
        tracker_ = std::make_unique<TransferStatusTracker>(store_);
    }

    void TearDown() override {
        tracker_.reset();
        store_.reset();
        scratch_.reset();
    }

    std::unique_ptr<ScratchDir> scratch_;
    std::shared_ptr<SQLiteMetadataStore> store_;
    std::unique_ptr<TransferStatusTracker> tracker_;
};

TEST_F(TransferStatusTrackerTest, RepeatedQueriesReturnIdenticalSnapshots) {
    tracker_->publish({7, TransferStatus::Initializing, 0, 5});
    tracker_->publish({7, TransferStatus::Uploading, 2, 5});

    auto first = tracker_->query(7);
    auto second = tracker_->query(7);
    ASSERT_TRUE(first.isOk());
    ASSERT_TRUE(second.isOk());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(first.value().uploadedCount, 2u);
}

TEST_F(TransferStatusTrackerTest, FallsBackToStoreForUntrackedTransfers) {
    auto id = store_->createFile("old.bin", 10, 1);
    ASSERT_TRUE(id.isOk());
    ASSERT_TRUE(store_->updateStatus(id.value(), TransferStatus::Chunking).isOk());

    auto status = tracker_->query(id.value());
    ASSERT_TRUE(status.isOk());
    EXPECT_EQ(status.value().status, TransferStatus::Chunking);
    EXPECT_EQ(status.value().chunkCount, 1u);
    EXPECT_EQ(tracker_->trackedCount(), 0u);
}

TEST_F(TransferStatusTrackerTest, UnknownTransferIsNotFound) {
    auto status = tracker_->query(4242);
    ASSERT_TRUE(status.isError());
    EXPECT_TRUE(status.error().is(Core::ErrorCode::FILE_NOT_FOUND));
}

TEST_F(TransferStatusTrackerTest, StalePublishCannotMoveBackwards) {
    tracker_->publish({1, TransferStatus::Initializing, 0, 5});
    tracker_->publish({1, TransferStatus::Uploading, 3, 5});
    tracker_->publish({1, TransferStatus::Uploading, 2, 5});
    tracker_->publish({1, TransferStatus::Chunking, 0, 5});
    EXPECT_EQ(tracker_->query(1).value().uploadedCount, 3u);
    EXPECT_EQ(tracker_->query(1).value().status, TransferStatus::Uploading);
}

TEST_F(TransferStatusTrackerTest, UntrackedTransferOnlyStartsAtInitializing) {
    tracker_->publish({3, TransferStatus::Uploading, 1, 5});
    tracker_->publish({3, TransferStatus::Failed, 1, 5});
    EXPECT_EQ(tracker_->trackedCount(), 0u);
    EXPECT_TRUE(tracker_->query(3).error().is(Core::ErrorCode::FILE_NOT_FOUND));
}

TEST_F(TransferStatusTrackerTest, TerminalSnapshotHandsOverToStore) {
    auto id = store_->createFile("done.bin", 0, 0);
    ASSERT_TRUE(id.isOk());
    tracker_->publish({id.value(), TransferStatus::Initializing, 0, 0});
    ASSERT_TRUE(store_->updateStatus(id.value(), TransferStatus::Chunking).isOk());
    tracker_->publish({id.value(), TransferStatus::Chunking, 0, 0});
    EXPECT_EQ(tracker_->trackedCount(), 1u);

    ASSERT_TRUE(store_->updateStatus(id.value(), TransferStatus::Completed).isOk());
    tracker_->publish({id.value(), TransferStatus::Completed, 0, 0});
    EXPECT_EQ(tracker_->trackedCount(), 0u);
    EXPECT_EQ(tracker_->query(id.value()).value().status, TransferStatus::Completed);

    // A late writer does not bring the entry back
    tracker_->publish({id.value(), TransferStatus::Uploading, 1, 0});
    EXPECT_EQ(tracker_->trackedCount(), 0u);
    EXPECT_EQ(tracker_->query(id.value()).value().status, TransferStatus::Completed);
}

TEST_F(TransferStatusTrackerTest, UnrecordedFailureIsHeldUntilForgotten) {
    auto id = store_->createFile("stuck.bin", 10, 1);
    ASSERT_TRUE(id.isOk());
    tracker_->publish({id.value(), TransferStatus::Initializing, 0, 1});
    tracker_->publishUnrecorded({id.value(), TransferStatus::Failed, 0, 1});

    EXPECT_EQ(tracker_->query(id.value()).value().status, TransferStatus::Failed);
    ASSERT_TRUE(tracker_->tracked(id.value()).has_value());
    EXPECT_EQ(tracker_->tracked(id.value())->status, TransferStatus::Failed);

    tracker_->publish({id.value(), TransferStatus::Uploading, 1, 1});
    EXPECT_EQ(tracker_->query(id.value()).value().status, TransferStatus::Failed);

    tracker_->forget(id.value());
    EXPECT_FALSE(tracker_->tracked(id.value()).has_value());
    EXPECT_EQ(tracker_->query(id.value()).value().status, TransferStatus::Initializing);
}

TEST_F(TransferStatusTrackerTest, ForgetDropsCachedSnapshot) {
    auto id = store_->createFile("gone.bin", 10, 1);
    ASSERT_TRUE(id.isOk());
    tracker_->publish({id.value(), TransferStatus::Initializing, 0, 1});
    tracker_->publish({id.value(), TransferStatus::Uploading, 1, 1});
    EXPECT_EQ(tracker_->query(id.value()).value().status, TransferStatus::Uploading);
    tracker_->forget(id.value());

    auto status = tracker_->query(id.value());
    ASSERT_TRUE(status.isOk());
    EXPECT_EQ(status.value().status, TransferStatus::Initializing);
}

TEST_F(TransferStatusTrackerTest, ReadersNeverSeeTornSnapshots) {
    const uint64_t total = 2000;
    std::atomic<bool> done{false};
    std::atomic<int> violations{0};

    std::thread writer([&]() {
        tracker_->publish({9, TransferStatus::Initializing, 0, total});
        tracker_->publish({9, TransferStatus::Chunking, 0, total});
        for (uint64_t i = 1; i <= total; ++i) {
            tracker_->publish({9, TransferStatus::Uploading, i, total});
        }
        tracker_->publish({9, TransferStatus::Completed, total, total});
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            uint64_t lastSeen = 0;
            while (!done) {
                auto status = tracker_->query(9);
                if (!status.isOk()) {
                    continue;   // not published yet, or settled and not in the store
                }
                const StatusSnapshot& s = status.value();
                if (s.chunkCount != total || s.uploadedCount < lastSeen ||
                    (s.status == TransferStatus::Completed && s.uploadedCount != total) ||
                    (s.status == TransferStatus::Chunking && s.uploadedCount != 0)) {
                    ++violations;
                }
                lastSeen = s.uploadedCount;
            }
        });
    }

    writer.join();
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_EQ(violations.load(), 0);
    EXPECT_EQ(tracker_->trackedCount(), 0u);
}
