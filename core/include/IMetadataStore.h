#pragma once

#include "Result.h"
#include "TransferTypes.h"
#include <cstdint>
#include <string>
#include <vector>

namespace ChunkVault {

    /**
     * @brief Transactional persistence for FileRecords and ChunkRefs.
     *
     * Implementations must be safe to call from several upload workers at
     * once; each call is its own transaction.
     */
    class IMetadataStore {
    public:
        virtual ~IMetadataStore() = default;

        // --- FileRecord ---

        /**
         * @brief Register a new transfer in state Initializing.
         * @return the new file id
         */
        virtual Result<int64_t> createFile(const std::string& filename, uint64_t totalSize, uint64_t chunkCount) = 0;

        /**
         * @brief Move a record forward in its state machine.
         *
         * Rejects transitions out of a terminal state and backwards moves.
         * A non-empty fileHash is stored in the same write.
         */
        virtual VoidResult updateStatus(int64_t fileId, TransferStatus status, const std::string& fileHash = "") = 0;

        virtual Result<FileRecord> getFile(int64_t fileId) = 0;

        /**
         * @brief status, uploadedCount and chunkCount read in one statement.
         */
        virtual Result<StatusSnapshot> getStatus(int64_t fileId) = 0;

        virtual Result<std::vector<FileRecord>> listFiles() = 0;

        /**
         * @brief Delete the record and cascade its ChunkRefs.
         */
        virtual VoidResult removeFile(int64_t fileId) = 0;

        /**
         * @brief Mark every record that is not terminal as Failed.
         *
         * For records whose run ended without a terminal write, such as
         * an earlier process that died mid-upload. Only safe while no
         * upload is running against the same database.
         * @return number of records changed
         */
        virtual Result<std::size_t> failUnfinished() = 0;

        // --- ChunkRef ---

        /**
         * @brief Insert a ChunkRef and bump uploadedCount as one unit.
         */
        virtual VoidResult recordChunk(const ChunkRef& chunk) = 0;

        /**
         * @brief ChunkRefs in sequence order, whatever the record's state.
         */
        virtual Result<std::vector<ChunkRef>> listChunks(int64_t fileId) = 0;

        /**
         * @brief A complete, consistent manifest or METADATA_INCONSISTENCY.
         *
         * Never returns a partial chunk list: a record that is not Completed,
         * or whose ChunkRefs are fewer than chunkCount, or have a gap, or do
         * not add up to totalSize, is reported as inconsistent.
         */
        virtual Result<FileManifest> loadManifest(int64_t fileId) = 0;
    };

} // namespace ChunkVault
