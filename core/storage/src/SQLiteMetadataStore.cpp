#include "SQLiteMetadataStore.h"
#include "DatabaseMigrations.h"
#include "Logger.h"
#include <chrono>

namespace ChunkVault {

    namespace {
        const char* COMPONENT = "SQLiteMetadataStore";

        const char* SELECT_FILE_COLUMNS =
            "SELECT id, filename, total_size, status, chunk_count, uploaded_count, file_hash, created_at FROM files";

        bool readRecord(PreparedStatement& stmt, FileRecord& record) {
            record.id = stmt.getColumnInt64(0);
            record.filename = stmt.getColumnString(1);
            record.totalSize = static_cast<uint64_t>(stmt.getColumnInt64(2));
            auto status = transferStatusFromString(stmt.getColumnString(3));
            if (!status) {
                return false;
            }
            record.status = *status;
            record.chunkCount = static_cast<uint64_t>(stmt.getColumnInt64(4));
            record.uploadedCount = static_cast<uint64_t>(stmt.getColumnInt64(5));
            record.fileHash = stmt.isColumnNull(6) ? std::string() : stmt.getColumnString(6);
            record.createdAt = stmt.getColumnInt64(7);
            return true;
        }

        Error notFound(int64_t fileId) {
            return Err(Core::ErrorCode::FILE_NOT_FOUND, "No transfer with id " + std::to_string(fileId), COMPONENT);
        }

        Error inconsistent(int64_t fileId, const std::string& why) {
            return Err(Core::ErrorCode::METADATA_INCONSISTENCY,
                       "Transfer " + std::to_string(fileId) + ": " + why, COMPONENT);
        }
    }

    SQLiteMetadataStore::SQLiteMetadataStore(std::shared_ptr<DatabaseManager> db)
        : db_(std::move(db)) {}

    Result<std::shared_ptr<SQLiteMetadataStore>> SQLiteMetadataStore::open(const std::string& path) {
        auto db = std::make_shared<DatabaseManager>(path);
        if (!db->initialize(DatabaseMigrations::getAllMigrations())) {
            return Err(Core::ErrorCode::STORAGE_ERROR, "Failed to open metadata database at " + path, COMPONENT);
        }
        return std::make_shared<SQLiteMetadataStore>(std::move(db));
    }

    Error SQLiteMetadataStore::storageError(const std::string& what) const {
        std::string message = what + ": " + db_->getLastError();
        Logger::instance().error(message, COMPONENT);
        return Err(Core::ErrorCode::STORAGE_ERROR, message, COMPONENT);
    }

    Result<int64_t> SQLiteMetadataStore::createFile(const std::string& filename, uint64_t totalSize, uint64_t chunkCount) {
        auto lock = db_->acquire();
        try {
            auto stmt = db_->prepare(
                "INSERT INTO files (filename, total_size, status, chunk_count, uploaded_count, created_at) "
                "VALUES (?, ?, ?, ?, 0, ?)");
            if (!stmt) {
                return storageError("Failed to prepare file insert");
            }

            int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();

            stmt->bind(1, filename)
                 .bind(2, static_cast<int64_t>(totalSize))
                 .bind(3, std::string(toString(TransferStatus::Initializing)))
                 .bind(4, static_cast<int64_t>(chunkCount))
                 .bind(5, now);
            if (!stmt->execute()) {
                return storageError("Failed to insert file record");
            }

            int64_t id = db_->lastInsertRowId();
            Logger::instance().debug("Created transfer " + std::to_string(id) + " for " + filename +
                                     " (" + std::to_string(chunkCount) + " chunks)", COMPONENT);
            return id;
        } catch (const std::exception& e) {
            return storageError(std::string("createFile failed: ") + e.what());
        }
    }

    VoidResult SQLiteMetadataStore::updateStatus(int64_t fileId, TransferStatus status, const std::string& fileHash) {
        auto lock = db_->acquire();
        try {
            auto txn = db_->beginTransaction();

            auto current = db_->prepare("SELECT status FROM files WHERE id = ?");
            if (!current) {
                return storageError("Failed to prepare status read");
            }
            current->bind(1, fileId);
            if (!current->step()) {
                if (current->lastResultCode() != SQLITE_DONE) {
                    return storageError("Failed to read status before update");
                }
                return notFound(fileId);
            }
            auto from = transferStatusFromString(current->getColumnString(0));
            current->reset();
            if (!from) {
                return inconsistent(fileId, "unknown stored status");
            }
            if (!canTransition(*from, status)) {
                return inconsistent(fileId, std::string("illegal transition ") + toString(*from) +
                                            " -> " + toString(status));
            }

            std::shared_ptr<PreparedStatement> update;
            if (fileHash.empty()) {
                update = db_->prepare(
                    "UPDATE files SET status = ? WHERE id = ? AND status NOT IN ('completed', 'failed')");
            } else {
                update = db_->prepare(
                    "UPDATE files SET status = ?, file_hash = ? WHERE id = ? AND status NOT IN ('completed', 'failed')");
            }
            if (!update) {
                return storageError("Failed to prepare status update");
            }

            int index = 1;
            update->bind(index++, std::string(toString(status)));
            if (!fileHash.empty()) {
                update->bind(index++, fileHash);
            }
            update->bind(index, fileId);

            if (!update->execute()) {
                return storageError("Failed to update status");
            }
            if (db_->changes() == 0) {
                return inconsistent(fileId, "record is already terminal");
            }

            txn->commit();
            return Ok();
        } catch (const std::exception& e) {
            return storageError(std::string("updateStatus failed: ") + e.what());
        }
    }

    Result<FileRecord> SQLiteMetadataStore::readFile(int64_t fileId) {
        auto stmt = db_->prepare(std::string(SELECT_FILE_COLUMNS) + " WHERE id = ?");
        if (!stmt) {
            return storageError("Failed to prepare file read");
        }
        stmt->bind(1, fileId);
        if (!stmt->step()) {
            if (stmt->lastResultCode() != SQLITE_DONE) {
                return storageError("Failed to read file record");
            }
            return notFound(fileId);
        }

        FileRecord record;
        bool valid = readRecord(*stmt, record);
        stmt->reset();
        if (!valid) {
            return inconsistent(fileId, "unknown stored status");
        }
        return record;
    }

    Result<std::vector<ChunkRef>> SQLiteMetadataStore::readChunks(int64_t fileId) {
        auto stmt = db_->prepare(
            "SELECT sequence_index, remote_handle, content_hash, byte_size FROM chunks "
            "WHERE file_id = ? ORDER BY sequence_index");
        if (!stmt) {
            return storageError("Failed to prepare chunk read");
        }
        stmt->bind(1, fileId);

        std::vector<ChunkRef> chunks;
        while (stmt->step()) {
            ChunkRef ref;
            ref.fileId = fileId;
            ref.sequenceIndex = static_cast<uint64_t>(stmt->getColumnInt64(0));
            ref.remoteHandle = stmt->getColumnString(1);
            ref.contentHash = stmt->getColumnString(2);
            ref.byteSize = static_cast<uint64_t>(stmt->getColumnInt64(3));
            chunks.push_back(std::move(ref));
        }
        if (stmt->lastResultCode() != SQLITE_DONE) {
            return storageError("Failed to read chunk list");
        }
        return chunks;
    }

    Result<FileRecord> SQLiteMetadataStore::getFile(int64_t fileId) {
        auto lock = db_->acquire();
        try {
            return readFile(fileId);
        } catch (const std::exception& e) {
            return storageError(std::string("getFile failed: ") + e.what());
        }
    }

    Result<StatusSnapshot> SQLiteMetadataStore::getStatus(int64_t fileId) {
        auto lock = db_->acquire();
        try {
            auto stmt = db_->prepare("SELECT status, uploaded_count, chunk_count FROM files WHERE id = ?");
            if (!stmt) {
                return storageError("Failed to prepare status read");
            }
            stmt->bind(1, fileId);
            if (!stmt->step()) {
                if (stmt->lastResultCode() != SQLITE_DONE) {
                    return storageError("Failed to read status");
                }
                return notFound(fileId);
            }

            auto status = transferStatusFromString(stmt->getColumnString(0));
            StatusSnapshot snapshot;
            snapshot.fileId = fileId;
            snapshot.uploadedCount = static_cast<uint64_t>(stmt->getColumnInt64(1));
            snapshot.chunkCount = static_cast<uint64_t>(stmt->getColumnInt64(2));
            stmt->reset();
            if (!status) {
                return inconsistent(fileId, "unknown stored status");
            }
            snapshot.status = *status;
            return snapshot;
        } catch (const std::exception& e) {
            return storageError(std::string("getStatus failed: ") + e.what());
        }
    }

    Result<std::vector<FileRecord>> SQLiteMetadataStore::listFiles() {
        auto lock = db_->acquire();
        try {
            auto stmt = db_->prepare(std::string(SELECT_FILE_COLUMNS) + " ORDER BY created_at DESC, id DESC");
            if (!stmt) {
                return storageError("Failed to prepare file listing");
            }

            std::vector<FileRecord> records;
            while (stmt->step()) {
                FileRecord record;
                if (!readRecord(*stmt, record)) {
                    Logger::instance().warn("Skipping transfer " + std::to_string(record.id) +
                                            " with unknown status", COMPONENT);
                    continue;
                }
                records.push_back(std::move(record));
            }
            if (stmt->lastResultCode() != SQLITE_DONE) {
                return storageError("Failed to list files");
            }
            return records;
        } catch (const std::exception& e) {
            return storageError(std::string("listFiles failed: ") + e.what());
        }
    }

    VoidResult SQLiteMetadataStore::removeFile(int64_t fileId) {
        auto lock = db_->acquire();
        try {
            auto txn = db_->beginTransaction();

            // Explicit delete so the cascade does not depend on the pragma
            auto chunks = db_->prepare("DELETE FROM chunks WHERE file_id = ?");
            auto file = db_->prepare("DELETE FROM files WHERE id = ?");
            if (!chunks || !file) {
                return storageError("Failed to prepare delete");
            }

            chunks->bind(1, fileId);
            if (!chunks->execute()) {
                return storageError("Failed to delete chunk refs");
            }
            file->bind(1, fileId);
            if (!file->execute()) {
                return storageError("Failed to delete file record");
            }
            if (db_->changes() == 0) {
                return notFound(fileId);
            }

            txn->commit();
            Logger::instance().info("Removed transfer " + std::to_string(fileId), COMPONENT);
            return Ok();
        } catch (const std::exception& e) {
            return storageError(std::string("removeFile failed: ") + e.what());
        }
    }

    Result<std::size_t> SQLiteMetadataStore::failUnfinished() {
        auto lock = db_->acquire();
        try {
            auto stmt = db_->prepare("UPDATE files SET status = ? WHERE status NOT IN ('completed', 'failed')");
            if (!stmt) {
                return storageError("Failed to prepare recovery update");
            }
            stmt->bind(1, std::string(toString(TransferStatus::Failed)));
            if (!stmt->execute()) {
                return storageError("Failed to fail unfinished transfers");
            }

            auto changed = static_cast<std::size_t>(db_->changes());
            if (changed > 0) {
                Logger::instance().warn("Marked " + std::to_string(changed) + " unfinished transfers failed",
                                        COMPONENT);
            }
            return changed;
        } catch (const std::exception& e) {
            return storageError(std::string("failUnfinished failed: ") + e.what());
        }
    }

    VoidResult SQLiteMetadataStore::recordChunk(const ChunkRef& chunk) {
        auto lock = db_->acquire();
        try {
            auto txn = db_->beginTransaction();

            auto insert = db_->prepare(
                "INSERT INTO chunks (file_id, sequence_index, remote_handle, content_hash, byte_size) "
                "VALUES (?, ?, ?, ?, ?)");
            auto bump = db_->prepare(
                "UPDATE files SET uploaded_count = uploaded_count + 1 "
                "WHERE id = ? AND status NOT IN ('completed', 'failed')");
            if (!insert || !bump) {
                return storageError("Failed to prepare chunk insert");
            }

            insert->bind(1, chunk.fileId)
                   .bind(2, static_cast<int64_t>(chunk.sequenceIndex))
                   .bind(3, chunk.remoteHandle)
                   .bind(4, chunk.contentHash)
                   .bind(5, static_cast<int64_t>(chunk.byteSize));
            if (!insert->execute()) {
                if (insert->lastResultCode() == SQLITE_CONSTRAINT) {
                    return inconsistent(chunk.fileId, "chunk " + std::to_string(chunk.sequenceIndex) +
                                                      " already recorded or record missing");
                }
                return storageError("Failed to insert chunk ref");
            }

            bump->bind(1, chunk.fileId);
            if (!bump->execute()) {
                return storageError("Failed to update uploaded count");
            }
            if (db_->changes() == 0) {
                // Rolled back by the transaction destructor
                return inconsistent(chunk.fileId, "record is missing or terminal");
            }

            txn->commit();
            return Ok();
        } catch (const std::exception& e) {
            return storageError(std::string("recordChunk failed: ") + e.what());
        }
    }

    Result<std::vector<ChunkRef>> SQLiteMetadataStore::listChunks(int64_t fileId) {
        auto lock = db_->acquire();
        try {
            return readChunks(fileId);
        } catch (const std::exception& e) {
            return storageError(std::string("listChunks failed: ") + e.what());
        }
    }

    Result<FileManifest> SQLiteMetadataStore::loadManifest(int64_t fileId) {
        auto lock = db_->acquire();
        try {
            auto txn = db_->beginTransaction();

            auto record = readFile(fileId);
            if (record.isError()) {
                return record.error();
            }
            auto chunks = readChunks(fileId);
            if (chunks.isError()) {
                return chunks.error();
            }
            txn->commit();

            FileManifest manifest{std::move(record.value()), std::move(chunks.value())};
            const FileRecord& file = manifest.record;

            if (file.status != TransferStatus::Completed) {
                return inconsistent(fileId, std::string("status is ") + toString(file.status));
            }
            if (manifest.chunks.size() != file.chunkCount) {
                return inconsistent(fileId, std::to_string(manifest.chunks.size()) + " of " +
                                            std::to_string(file.chunkCount) + " chunk refs present");
            }

            uint64_t total = 0;
            for (size_t i = 0; i < manifest.chunks.size(); ++i) {
                if (manifest.chunks[i].sequenceIndex != i) {
                    return inconsistent(fileId, "missing chunk " + std::to_string(i));
                }
                total += manifest.chunks[i].byteSize;
            }
            if (total != file.totalSize) {
                return inconsistent(fileId, "chunk sizes add up to " + std::to_string(total) +
                                            " instead of " + std::to_string(file.totalSize));
            }

            return manifest;
        } catch (const std::exception& e) {
            return storageError(std::string("loadManifest failed: ") + e.what());
        }
    }

} // namespace ChunkVault
