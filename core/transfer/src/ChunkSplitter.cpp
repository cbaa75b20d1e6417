#include "ChunkSplitter.h"
#include "TransferTypes.h"
#include "LoggerMacros.h"

namespace ChunkVault {

    namespace {
        const char* COMPONENT = "ChunkSplitter";
    }

    ChunkSplitter::ChunkSplitter(ByteSource& source, uint64_t totalSize, uint64_t chunkSize)
        : source_(source),
          totalSize_(totalSize),
          chunkSize_(chunkSize == 0 ? DEFAULT_CHUNK_SIZE : chunkSize),
          chunkCount_(chunkCountFor(totalSize, chunkSize_)) {}

    Result<std::optional<Chunk>> ChunkSplitter::next() {
        if (failure_) {
            return *failure_;
        }
        if (exhausted()) {
            return std::optional<Chunk>{};
        }

        Chunk chunk;
        chunk.sequenceIndex = nextIndex_;
        uint64_t expected = expectedChunkSize(totalSize_, chunkSize_, nextIndex_);
        chunk.bytes.resize(static_cast<std::size_t>(expected));

        std::size_t filled = 0;
        while (filled < chunk.bytes.size()) {
            auto read = source_.read(chunk.bytes.data() + filled, chunk.bytes.size() - filled);
            if (read.isError()) {
                failure_ = read.error();
                LOG_ERROR_COMP("Source read failed at chunk " + std::to_string(nextIndex_) + ": " +
                               failure_->message, COMPONENT);
                return *failure_;
            }
            if (read.value() == 0) {
                failure_ = Err(Core::ErrorCode::SOURCE_READ_ERROR,
                               source_.name() + " ended after " +
                               std::to_string(nextIndex_ * chunkSize_ + filled) + " of " +
                               std::to_string(totalSize_) + " bytes", COMPONENT);
                LOG_ERROR_COMP(failure_->message, COMPONENT);
                return *failure_;
            }
            filled += read.value();
        }

        chunk.contentHash = SHA256::hashBytes(chunk.bytes);
        if (!fileHasher_.update(chunk.bytes)) {
            failure_ = Err(Core::ErrorCode::INTERNAL_ERROR, "Whole-file digest failed", COMPONENT);
            LOG_ERROR_COMP(failure_->message, COMPONENT);
            return *failure_;
        }
        ++nextIndex_;

        LOG_DEBUG_COMP_IF("Chunk " + std::to_string(chunk.sequenceIndex) + " (" +
                          std::to_string(chunk.bytes.size()) + " bytes) " + chunk.contentHash, COMPONENT);
        return std::optional<Chunk>(std::move(chunk));
    }

    std::string ChunkSplitter::fileHash() {
        if (fileHash_.empty() && exhausted() && !failure_) {
            fileHash_ = fileHasher_.finalize();
        }
        return fileHash_;
    }

} // namespace ChunkVault
