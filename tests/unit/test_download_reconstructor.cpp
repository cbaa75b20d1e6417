/**
 * @file test_download_reconstructor.cpp
 * @brief Snapshot preparation and verified streaming
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include "DownloadReconstructor.h"
#include "MockStores.h"
#include "SQLiteMetadataStore.h"
#include "TransferStatusTracker.h"
#include "UploadOrchestrator.h"

using namespace ChunkVault;

namespace {

class VectorSink : public ByteSink {
public:
    bool write(const uint8_t* data, std::size_t length) override {
        ++writes;
        largestWrite = std::max(largestWrite, length);
        bytes.insert(bytes.end(), data, data + length);
        if (onWrite) {
            return onWrite();
        }
        return true;
    }

    std::vector<uint8_t> bytes;
    std::size_t writes{0};
    std::size_t largestWrite{0};
    std::function<bool()> onWrite;
};

} // namespace

class DownloadReconstructorTest : public ::testing::Test {
protected:
    static constexpr uint64_t CHUNK = 1024;

    void SetUp() override {
        scratch_ = std::make_unique<ScratchDir>("chunkvault_download");
        auto opened = SQLiteMetadataStore::open(scratch_->file("meta.db"));
        ASSERT_TRUE(opened.isOk());
        store_ = std::make_shared<RecordingMetadataStore>(opened.value());
        remote_ = std::make_shared<RemoteState>();
        tracker_ = std::make_unique<TransferStatusTracker>(store_);

        UploadOptions upload;
        upload.chunkSize = CHUNK;
        upload.retry.baseDelay = std::chrono::milliseconds(1);
        upload.retry.maxDelay = std::chrono::milliseconds(2);
        orchestrator_ = std::make_unique<UploadOrchestrator>(store_, InMemoryRemoteStore::factory(remote_),
                                                             *tracker_, upload);
        reconstructor_ = std::make_unique<DownloadReconstructor>(store_);

        streamOptions_.blockSize = 300;
        streamOptions_.retry.baseDelay = std::chrono::milliseconds(1);
        streamOptions_.retry.maxDelay = std::chrono::milliseconds(2);
    }

    void TearDown() override {
        orchestrator_.reset();
        reconstructor_.reset();
        tracker_.reset();
        store_.reset();
        scratch_.reset();
    }

    int64_t upload(const std::vector<uint8_t>& data) {
        auto started = orchestrator_->initiate(std::make_unique<MemoryByteSource>(data), "data.bin");
        EXPECT_TRUE(started.isOk());
        if (!started.isOk()) {
            return 0;
        }
        EXPECT_TRUE(orchestrator_->wait(started.value(), std::chrono::seconds(30)));
        return started.value();
    }

    DownloadSnapshot prepared(int64_t fileId) {
        auto snapshot = reconstructor_->prepare(fileId);
        EXPECT_TRUE(snapshot.isOk());
        return snapshot.isOk() ? snapshot.value() : DownloadSnapshot{};
    }

    DownloadStream streamOf(DownloadSnapshot snapshot) {
        return DownloadReconstructor::stream(std::move(snapshot), InMemoryRemoteStore::factory(remote_),
                                             streamOptions_);
    }

    std::unique_ptr<ScratchDir> scratch_;
    std::shared_ptr<RecordingMetadataStore> store_;
    std::shared_ptr<RemoteState> remote_;
    std::unique_ptr<TransferStatusTracker> tracker_;
    std::unique_ptr<UploadOrchestrator> orchestrator_;
    std::unique_ptr<DownloadReconstructor> reconstructor_;
    StreamOptions streamOptions_;
};

TEST_F(DownloadReconstructorTest, RoundTripIsByteIdentical) {
    auto data = makePayload(5 * CHUNK + 77);
    int64_t id = upload(data);

    DownloadSnapshot snapshot = prepared(id);
    EXPECT_EQ(snapshot.totalSize, data.size());
    EXPECT_EQ(snapshot.chunks.size(), 6u);
    EXPECT_EQ(snapshot.filename, "data.bin");

    VectorSink sink;
    DownloadStream stream = streamOf(snapshot);
    auto written = stream.pipeTo(sink);

    ASSERT_TRUE(written.isOk()) << written.error().toString();
    EXPECT_EQ(written.value(), data.size());
    EXPECT_EQ(sink.bytes, data);
    EXPECT_LE(sink.largestWrite, 300u);
    EXPECT_EQ(remote_->pullCount(), 6);
    EXPECT_TRUE(stream.finished());
}

TEST_F(DownloadReconstructorTest, CorruptSecondChunkEndsStreamAfterFirst) {
    auto data = makePayload(3 * CHUNK);
    int64_t id = upload(data);
    DownloadSnapshot snapshot = prepared(id);
    ASSERT_EQ(snapshot.chunks.size(), 3u);
    remote_->corrupt(snapshot.chunks[1].remoteHandle);

    VectorSink sink;
    DownloadStream stream = streamOf(snapshot);
    auto written = stream.pipeTo(sink);

    ASSERT_TRUE(written.isError());
    EXPECT_TRUE(written.error().is(Core::ErrorCode::INTEGRITY_ERROR));
    ASSERT_EQ(sink.bytes.size(), CHUNK);
    EXPECT_TRUE(std::equal(sink.bytes.begin(), sink.bytes.end(), data.begin()));
    EXPECT_LT(stream.bytesEmitted(), snapshot.totalSize);
    EXPECT_EQ(remote_->pullCount(), 2);

    // The failure is final
    auto again = stream.next();
    ASSERT_TRUE(again.isError());
    EXPECT_TRUE(again.error().is(Core::ErrorCode::INTEGRITY_ERROR));
    EXPECT_EQ(remote_->pullCount(), 2);
}

TEST_F(DownloadReconstructorTest, PrepareRejectsIncompleteTransfer) {
    auto data = makePayload(3 * CHUNK);
    remote_->failPushes(chunkHash(data, CHUNK, CHUNK), -1, Core::ErrorCode::REMOTE_REJECTED);
    int64_t id = upload(data);

    auto snapshot = reconstructor_->prepare(id);
    ASSERT_TRUE(snapshot.isError());
    EXPECT_TRUE(snapshot.error().is(Core::ErrorCode::METADATA_INCONSISTENCY));
}

TEST_F(DownloadReconstructorTest, PrepareUnknownFileIsNotFound) {
    auto snapshot = reconstructor_->prepare(999);
    ASSERT_TRUE(snapshot.isError());
    EXPECT_TRUE(snapshot.error().is(Core::ErrorCode::FILE_NOT_FOUND));
}

TEST_F(DownloadReconstructorTest, SinkClosingStopsRemotePulls) {
    streamOptions_.blockSize = CHUNK;
    int64_t id = upload(makePayload(4 * CHUNK));

    VectorSink sink;
    sink.onWrite = []() { return false; };
    DownloadStream stream = streamOf(prepared(id));
    auto written = stream.pipeTo(sink);

    ASSERT_TRUE(written.isError());
    EXPECT_TRUE(written.error().is(Core::ErrorCode::STREAM_CANCELLED));
    EXPECT_EQ(sink.writes, 1u);
    EXPECT_EQ(remote_->pullCount(), 1);
}

TEST_F(DownloadReconstructorTest, CancellationTokenStopsRemotePulls) {
    streamOptions_.blockSize = CHUNK;
    int64_t id = upload(makePayload(4 * CHUNK));

    CancellationToken token;
    VectorSink sink;
    sink.onWrite = [&token]() {
        token.cancel();
        return true;
    };
    DownloadStream stream = streamOf(prepared(id));
    auto written = stream.pipeTo(sink, token);

    ASSERT_TRUE(written.isError());
    EXPECT_TRUE(written.error().is(Core::ErrorCode::STREAM_CANCELLED));
    EXPECT_EQ(sink.bytes.size(), CHUNK);
    EXPECT_EQ(remote_->pullCount(), 1);
}

TEST_F(DownloadReconstructorTest, SnapshotSurvivesRecordDeletionMidStream) {
    auto data = makePayload(3 * CHUNK + 5);
    int64_t id = upload(data);
    DownloadStream stream = streamOf(prepared(id));

    auto first = stream.next();
    ASSERT_TRUE(first.isOk());
    ASSERT_TRUE(first.value().has_value());
    std::vector<uint8_t> received = *first.value();

    // Metadata and every request-scoped object go away; remote chunks stay
    ASSERT_TRUE(store_->removeFile(id).isOk());
    orchestrator_.reset();
    reconstructor_.reset();

    VectorSink sink;
    auto rest = stream.pipeTo(sink);
    ASSERT_TRUE(rest.isOk()) << rest.error().toString();
    received.insert(received.end(), sink.bytes.begin(), sink.bytes.end());
    EXPECT_EQ(received, data);
}

TEST_F(DownloadReconstructorTest, IndependentStreamsOverOneSnapshot) {
    auto data = makePayload(4 * CHUNK + 9);
    DownloadSnapshot snapshot = prepared(upload(data));

    DownloadStream a = streamOf(snapshot);
    DownloadStream b = streamOf(snapshot);
    std::vector<uint8_t> fromA;
    std::vector<uint8_t> fromB;

    bool aDone = false;
    bool bDone = false;
    while (!aDone || !bDone) {
        if (!aDone) {
            auto block = a.next();
            ASSERT_TRUE(block.isOk());
            if (block.value()) {
                fromA.insert(fromA.end(), block.value()->begin(), block.value()->end());
            } else {
                aDone = true;
            }
        }
        if (!bDone) {
            auto block = b.next();
            ASSERT_TRUE(block.isOk());
            if (block.value()) {
                fromB.insert(fromB.end(), block.value()->begin(), block.value()->end());
            } else {
                bDone = true;
            }
        }
    }

    EXPECT_EQ(fromA, data);
    EXPECT_EQ(fromB, data);
}

TEST_F(DownloadReconstructorTest, EmptyFileStreamsNothing) {
    int64_t id = upload(std::vector<uint8_t>{});
    DownloadSnapshot snapshot = prepared(id);
    EXPECT_TRUE(snapshot.chunks.empty());

    VectorSink sink;
    DownloadStream stream = streamOf(snapshot);
    auto written = stream.pipeTo(sink);
    ASSERT_TRUE(written.isOk());
    EXPECT_EQ(written.value(), 0u);
    EXPECT_EQ(remote_->pullCount(), 0);
}

TEST_F(DownloadReconstructorTest, MissingRemoteObjectIsNotRetried) {
    int64_t id = upload(makePayload(2 * CHUNK));
    DownloadSnapshot snapshot = prepared(id);
    ASSERT_TRUE(remote_->remove(snapshot.chunks[0].remoteHandle).isOk());

    VectorSink sink;
    DownloadStream stream = streamOf(snapshot);
    auto written = stream.pipeTo(sink);

    ASSERT_TRUE(written.isError());
    EXPECT_TRUE(written.error().is(Core::ErrorCode::REMOTE_NOT_FOUND));
    EXPECT_TRUE(sink.bytes.empty());
    EXPECT_EQ(remote_->pullCount(), 1);
}

TEST_F(DownloadReconstructorTest, UnavailableRemoteIsRetriedThenFails) {
    int64_t id = upload(makePayload(2 * CHUNK));
    DownloadSnapshot snapshot = prepared(id);
    remote_->failPullsWith(Core::ErrorCode::REMOTE_UNAVAILABLE);

    VectorSink sink;
    DownloadStream stream = streamOf(snapshot);
    auto written = stream.pipeTo(sink);

    ASSERT_TRUE(written.isError());
    EXPECT_TRUE(written.error().is(Core::ErrorCode::REMOTE_UNAVAILABLE));
    EXPECT_EQ(remote_->pullCount(), 3);
}

TEST_F(DownloadReconstructorTest, WholeFileHashMismatchFailsAtTheEnd) {
    auto data = makePayload(2 * CHUNK);
    DownloadSnapshot snapshot = prepared(upload(data));
    snapshot.fileHash = SHA256::hash("something else");

    VectorSink sink;
    DownloadStream stream = streamOf(snapshot);
    auto written = stream.pipeTo(sink);
    ASSERT_TRUE(written.isError());
    EXPECT_TRUE(written.error().is(Core::ErrorCode::INTEGRITY_ERROR));
    EXPECT_EQ(stream.bytesEmitted(), data.size());

    streamOptions_.verifyFileHash = false;
    VectorSink lenient;
    DownloadStream unchecked = streamOf(snapshot);
    EXPECT_TRUE(unchecked.pipeTo(lenient).isOk());
}

TEST_F(DownloadReconstructorTest, SlowPullTimesOutWithoutLeavingWorkers) {
    auto data = makePayload(2 * CHUNK);
    DownloadSnapshot snapshot = prepared(upload(data));
    streamOptions_.remoteTimeout = std::chrono::milliseconds(30);
    remote_->setPullDelay(std::chrono::milliseconds(300));

    {
        VectorSink sink;
        DownloadStream stream = streamOf(snapshot);
        auto started = std::chrono::steady_clock::now();
        auto written = stream.pipeTo(sink);
        auto elapsed = std::chrono::steady_clock::now() - started;

        ASSERT_TRUE(written.isError());
        EXPECT_TRUE(written.error().is(Core::ErrorCode::REMOTE_TIMEOUT));
        EXPECT_TRUE(sink.bytes.empty());
        // Three attempts, each cut short well before the remote answers
        EXPECT_GE(elapsed, std::chrono::milliseconds(90));
        EXPECT_LT(elapsed, std::chrono::milliseconds(280));
    }

    // The stream joined its worker: the first pull returned, the queued retries never ran
    EXPECT_EQ(remote_->pullCount(), 1);
}
