#pragma once

#include "IMetadataStore.h"
#include "DatabaseManager.h"
#include <memory>

namespace ChunkVault {

    /**
     * @brief IMetadataStore on a local SQLite database.
     *
     * Every operation holds the connection lock and runs in its own
     * savepoint, so readers never observe a ChunkRef without the matching
     * uploadedCount bump.
     */
    class SQLiteMetadataStore : public IMetadataStore {
    public:
        explicit SQLiteMetadataStore(std::shared_ptr<DatabaseManager> db);

        /**
         * @brief Open (or create) the database at path and migrate it.
         */
        static Result<std::shared_ptr<SQLiteMetadataStore>> open(const std::string& path);

        Result<int64_t> createFile(const std::string& filename, uint64_t totalSize, uint64_t chunkCount) override;
        VoidResult updateStatus(int64_t fileId, TransferStatus status, const std::string& fileHash = "") override;
        Result<FileRecord> getFile(int64_t fileId) override;
        Result<StatusSnapshot> getStatus(int64_t fileId) override;
        Result<std::vector<FileRecord>> listFiles() override;
        VoidResult removeFile(int64_t fileId) override;
        Result<std::size_t> failUnfinished() override;

        VoidResult recordChunk(const ChunkRef& chunk) override;
        Result<std::vector<ChunkRef>> listChunks(int64_t fileId) override;
        Result<FileManifest> loadManifest(int64_t fileId) override;

        DatabaseManager& database() { return *db_; }

    private:
        std::shared_ptr<DatabaseManager> db_;

        Result<FileRecord> readFile(int64_t fileId);
        Result<std::vector<ChunkRef>> readChunks(int64_t fileId);
        Error storageError(const std::string& what) const;
    };

} // namespace ChunkVault
