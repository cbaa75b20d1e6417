#pragma once

#include "ByteSource.h"
#include "SHA256.h"
#include <optional>

namespace ChunkVault {

    struct Chunk {
        uint64_t sequenceIndex{0};
        std::vector<uint8_t> bytes;
        std::string contentHash;
    };

    /**
     * @brief Cuts a ByteSource into an ordered sequence of hashed chunks.
     *
     * Forward-only and single pass: each next() reads exactly one chunk
     * from the source. All chunks are chunkSize bytes except the last,
     * which holds the remainder; an empty source yields none. A source
     * that ends early or fails to read yields SOURCE_READ_ERROR, and every
     * later next() repeats it.
     */
    class ChunkSplitter {
    public:
        static constexpr uint64_t DEFAULT_CHUNK_SIZE = 20ULL * 1024 * 1024;

        ChunkSplitter(ByteSource& source, uint64_t totalSize, uint64_t chunkSize = DEFAULT_CHUNK_SIZE);

        ChunkSplitter(const ChunkSplitter&) = delete;
        ChunkSplitter& operator=(const ChunkSplitter&) = delete;

        /**
         * @return the next chunk, or an empty optional after the last one
         */
        Result<std::optional<Chunk>> next();

        uint64_t chunkCount() const { return chunkCount_; }
        uint64_t chunkSize() const { return chunkSize_; }
        bool exhausted() const { return nextIndex_ >= chunkCount_; }

        /**
         * @brief SHA-256 over every byte produced; valid once exhausted.
         */
        std::string fileHash();

    private:
        ByteSource& source_;
        uint64_t totalSize_;
        uint64_t chunkSize_;
        uint64_t chunkCount_;
        uint64_t nextIndex_{0};
        std::optional<Error> failure_;

        SHA256::Hasher fileHasher_;
        std::string fileHash_;
    };

} // namespace ChunkVault
