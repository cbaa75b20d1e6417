#pragma once

#include "DatabaseManager.h"
#include <vector>

namespace ChunkVault {

/**
 * @brief Schema migrations for the transfer metadata database
 */
class DatabaseMigrations {
public:
    /**
     * @brief All migrations in ascending version order
     */
    static std::vector<DatabaseManager::Migration> getAllMigrations();

    /**
     * @brief Initial schema (version 1): files and chunks
     */
    static std::string getInitialSchema();

private:
    static DatabaseManager::Migration migration_v1();
    static DatabaseManager::Migration migration_v2();
};

} // namespace ChunkVault
