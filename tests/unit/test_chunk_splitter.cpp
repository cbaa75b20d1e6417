/**
 * @file test_chunk_splitter.cpp
 * @brief Chunk boundaries, hashing and source failures
 */

#include <gtest/gtest.h>
#include "ChunkSplitter.h"
#include "MockStores.h"
#include "TransferTypes.h"
#include <algorithm>

using namespace ChunkVault;

namespace {

// Serves data but reports an I/O error once `failAfter` bytes were read
class FailingByteSource : public ByteSource {
public:
    FailingByteSource(std::vector<uint8_t> data, std::size_t failAfter)
        : data_(std::move(data)), failAfter_(failAfter) {}

    uint64_t size() const override { return data_.size(); }

    Result<std::size_t> read(uint8_t* buffer, std::size_t length) override {
        if (offset_ >= failAfter_) {
            return Err(Core::ErrorCode::SOURCE_READ_ERROR, "device went away", "FailingByteSource");
        }
        std::size_t count = std::min({length, failAfter_ - offset_, data_.size() - offset_});
        std::copy(data_.begin() + offset_, data_.begin() + offset_ + count, buffer);
        offset_ += count;
        return count;
    }

    void discard() override {}
    std::string name() const override { return "failing"; }

private:
    std::vector<uint8_t> data_;
    std::size_t failAfter_;
    std::size_t offset_{0};
};

// Hands out at most 3 bytes per read
class TrickleByteSource : public MemoryByteSource {
public:
    using MemoryByteSource::MemoryByteSource;

    Result<std::size_t> read(uint8_t* buffer, std::size_t length) override {
        return MemoryByteSource::read(buffer, std::min<std::size_t>(length, 3));
    }
};

std::vector<Chunk> drain(ChunkSplitter& splitter) {
    std::vector<Chunk> chunks;
    while (true) {
        auto next = splitter.next();
        EXPECT_TRUE(next.isOk());
        if (!next.isOk() || !next.value()) {
            break;
        }
        chunks.push_back(std::move(*next.value()));
    }
    return chunks;
}

} // namespace

class ChunkSplitterTest : public ::testing::Test {
protected:
    static constexpr uint64_t CHUNK = 1024;
};

TEST_F(ChunkSplitterTest, EmptySourceYieldsNoChunks) {
    MemoryByteSource source(std::vector<uint8_t>{});
    ChunkSplitter splitter(source, 0, CHUNK);

    EXPECT_EQ(splitter.chunkCount(), 0u);
    EXPECT_TRUE(splitter.exhausted());

    auto next = splitter.next();
    ASSERT_TRUE(next.isOk());
    EXPECT_FALSE(next.value().has_value());
    EXPECT_EQ(splitter.fileHash(), SHA256::hash(""));
}

TEST_F(ChunkSplitterTest, SourceSmallerThanOneChunk) {
    auto data = makePayload(100);
    MemoryByteSource source(data);
    ChunkSplitter splitter(source, data.size(), CHUNK);

    auto chunks = drain(splitter);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].sequenceIndex, 0u);
    EXPECT_EQ(chunks[0].bytes, data);
}

TEST_F(ChunkSplitterTest, ExactMultipleEndsWithFullChunk) {
    auto data = makePayload(3 * CHUNK);
    MemoryByteSource source(data);
    ChunkSplitter splitter(source, data.size(), CHUNK);

    auto chunks = drain(splitter);
    ASSERT_EQ(chunks.size(), 3u);
    for (const auto& chunk : chunks) {
        EXPECT_EQ(chunk.bytes.size(), CHUNK);
    }
}

TEST_F(ChunkSplitterTest, RemainderGoesToLastChunk) {
    auto data = makePayload(2 * CHUNK + 17);
    MemoryByteSource source(data);
    ChunkSplitter splitter(source, data.size(), CHUNK);
    EXPECT_EQ(splitter.chunkCount(), 3u);

    auto chunks = drain(splitter);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].bytes.size(), CHUNK);
    EXPECT_EQ(chunks[1].bytes.size(), CHUNK);
    EXPECT_EQ(chunks[2].bytes.size(), 17u);

    uint64_t total = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].sequenceIndex, i);
        EXPECT_EQ(chunks[i].contentHash, chunkHash(data, i * CHUNK, chunks[i].bytes.size()));
        total += chunks[i].bytes.size();
    }
    EXPECT_EQ(total, data.size());
}

TEST_F(ChunkSplitterTest, SequenceIsNotRestartable) {
    auto data = makePayload(CHUNK + 1);
    MemoryByteSource source(data);
    ChunkSplitter splitter(source, data.size(), CHUNK);

    EXPECT_EQ(drain(splitter).size(), 2u);
    auto again = splitter.next();
    ASSERT_TRUE(again.isOk());
    EXPECT_FALSE(again.value().has_value());
}

TEST_F(ChunkSplitterTest, FillsChunksFromShortReads) {
    auto data = makePayload(CHUNK + 10);
    TrickleByteSource source(data);
    ChunkSplitter splitter(source, data.size(), CHUNK);

    auto chunks = drain(splitter);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].bytes.size(), CHUNK);
    EXPECT_EQ(chunks[1].bytes.size(), 10u);
}

TEST_F(ChunkSplitterTest, WholeFileHashCoversAllChunks) {
    auto data = makePayload(5 * CHUNK + 3);
    MemoryByteSource source(data);
    ChunkSplitter splitter(source, data.size(), CHUNK);

    EXPECT_TRUE(splitter.fileHash().empty());
    drain(splitter);
    EXPECT_EQ(splitter.fileHash(), SHA256::hashBytes(data));
}

TEST_F(ChunkSplitterTest, ReadErrorMidSplitIsSticky) {
    auto data = makePayload(3 * CHUNK);
    FailingByteSource source(data, CHUNK + 5);
    ChunkSplitter splitter(source, data.size(), CHUNK);

    auto first = splitter.next();
    ASSERT_TRUE(first.isOk());
    ASSERT_TRUE(first.value().has_value());

    auto second = splitter.next();
    ASSERT_TRUE(second.isError());
    EXPECT_TRUE(second.error().is(Core::ErrorCode::SOURCE_READ_ERROR));

    auto third = splitter.next();
    ASSERT_TRUE(third.isError());
    EXPECT_TRUE(third.error().is(Core::ErrorCode::SOURCE_READ_ERROR));
    EXPECT_TRUE(splitter.fileHash().empty());
}

TEST_F(ChunkSplitterTest, SourceEndingEarlyIsReadError) {
    // Declared size is larger than what the source can deliver
    auto data = makePayload(CHUNK / 2);
    MemoryByteSource source(data);
    ChunkSplitter splitter(source, CHUNK * 2, CHUNK);

    auto next = splitter.next();
    ASSERT_TRUE(next.isError());
    EXPECT_TRUE(next.error().is(Core::ErrorCode::SOURCE_READ_ERROR));
}

TEST(ChunkMathTest, CountAndSizes) {
    const uint64_t MiB = 1024 * 1024;
    EXPECT_EQ(chunkCountFor(0, 20 * MiB), 0u);
    EXPECT_EQ(chunkCountFor(1, 20 * MiB), 1u);
    EXPECT_EQ(chunkCountFor(40 * MiB, 20 * MiB), 2u);
    EXPECT_EQ(chunkCountFor(45 * MiB, 20 * MiB), 3u);

    EXPECT_EQ(expectedChunkSize(45 * MiB, 20 * MiB, 0), 20 * MiB);
    EXPECT_EQ(expectedChunkSize(45 * MiB, 20 * MiB, 2), 5 * MiB);
    EXPECT_EQ(expectedChunkSize(40 * MiB, 20 * MiB, 1), 20 * MiB);
}
