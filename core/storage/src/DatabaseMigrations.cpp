#include "DatabaseMigrations.h"

namespace ChunkVault {

std::vector<DatabaseManager::Migration> DatabaseMigrations::getAllMigrations() {
    return {
        migration_v1(),
        migration_v2()
    };
}

std::string DatabaseMigrations::getInitialSchema() {
    return R"(
-- One row per transfer
CREATE TABLE IF NOT EXISTS files (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    filename TEXT NOT NULL,
    total_size INTEGER NOT NULL,
    status TEXT NOT NULL,          -- initializing, chunking, uploading, completed, failed
    chunk_count INTEGER NOT NULL,
    uploaded_count INTEGER NOT NULL DEFAULT 0,
    file_hash TEXT,
    created_at INTEGER NOT NULL
);

-- Remote location of each uploaded chunk
CREATE TABLE IF NOT EXISTS chunks (
    file_id INTEGER NOT NULL,
    sequence_index INTEGER NOT NULL,
    remote_handle TEXT NOT NULL,
    content_hash TEXT NOT NULL,
    byte_size INTEGER NOT NULL,
    PRIMARY KEY (file_id, sequence_index),
    FOREIGN KEY (file_id) REFERENCES files(id) ON DELETE CASCADE
);
)";
}

DatabaseManager::Migration DatabaseMigrations::migration_v1() {
    return {
        1,
        "Initial schema",
        getInitialSchema()
    };
}

DatabaseManager::Migration DatabaseMigrations::migration_v2() {
    return {
        2,
        "Index files by status for health queries",
        "CREATE INDEX IF NOT EXISTS idx_files_status ON files(status);"
    };
}

} // namespace ChunkVault
