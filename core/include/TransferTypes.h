#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ChunkVault {

    /**
     * @brief FileRecord state machine.
     *
     * Initializing -> Chunking -> Uploading -> Completed | Failed.
     * Completed and Failed are terminal. Chunking may go straight to
     * Completed for an empty source, and any live state may go to Failed.
     */
    enum class TransferStatus {
        Initializing,
        Chunking,
        Uploading,
        Completed,
        Failed
    };

    const char* toString(TransferStatus status);
    std::optional<TransferStatus> transferStatusFromString(const std::string& value);
    bool isTerminal(TransferStatus status);
    bool canTransition(TransferStatus from, TransferStatus to);

    struct FileRecord {
        int64_t id{0};
        std::string filename;
        uint64_t totalSize{0};
        TransferStatus status{TransferStatus::Initializing};
        uint64_t chunkCount{0};
        uint64_t uploadedCount{0};
        std::string fileHash;   // SHA-256 of the whole file, set on completion
        int64_t createdAt{0};   // Unix seconds
    };

    // Immutable once persisted.
    struct ChunkRef {
        int64_t fileId{0};
        uint64_t sequenceIndex{0};
        std::string remoteHandle;
        std::string contentHash;
        uint64_t byteSize{0};
    };

    struct StatusSnapshot {
        int64_t fileId{0};
        TransferStatus status{TransferStatus::Initializing};
        uint64_t uploadedCount{0};
        uint64_t chunkCount{0};

        bool operator==(const StatusSnapshot& other) const {
            return fileId == other.fileId && status == other.status &&
                   uploadedCount == other.uploadedCount && chunkCount == other.chunkCount;
        }
        bool operator!=(const StatusSnapshot& other) const { return !(*this == other); }
    };

    /**
     * @brief A Completed record plus its full, gap-free chunk list.
     */
    struct FileManifest {
        FileRecord record;
        std::vector<ChunkRef> chunks;
    };

    struct HealthSummary {
        uint64_t totalFiles{0};
        uint64_t totalBytes{0};
        uint64_t completedFiles{0};
        uint64_t failedFiles{0};
    };

    /**
     * @brief ceil(totalSize / chunkSize); zero for an empty file.
     */
    uint64_t chunkCountFor(uint64_t totalSize, uint64_t chunkSize);

    /**
     * @brief Size of chunk `index` for a file of totalSize split at chunkSize.
     */
    uint64_t expectedChunkSize(uint64_t totalSize, uint64_t chunkSize, uint64_t index);

} // namespace ChunkVault
