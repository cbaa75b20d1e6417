#pragma once

#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>

namespace ChunkVault {

/**
 * @brief RAII savepoint transaction; rolls back unless commit() was called
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();

    void commit();
    void rollback();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    sqlite3* db_;
    bool finished_;
    std::string savepoint_;
};

/**
 * @brief Prepared statement wrapper for type-safe parameter binding
 */
class PreparedStatement {
public:
    PreparedStatement(sqlite3* db, const std::string& sql);
    ~PreparedStatement();

    PreparedStatement& bind(int index, int value);
    PreparedStatement& bind(int index, int64_t value);
    PreparedStatement& bind(int index, const std::string& value);

    /**
     * @brief Advance to the next row.
     * @return true while a row is available; false once done or on error
     */
    bool step();

    /**
     * @brief Run a statement that returns no rows.
     * @return true if it ran to completion
     */
    bool execute();

    void reset();
    void clearBindings();

    int lastResultCode() const { return lastResult_; }

    int getColumnInt(int index) const;
    int64_t getColumnInt64(int index) const;
    std::string getColumnString(int index) const;
    bool isColumnNull(int index) const;

    PreparedStatement(const PreparedStatement&) = delete;
    PreparedStatement& operator=(const PreparedStatement&) = delete;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
    int lastResult_{SQLITE_OK};
};

/**
 * @brief SQLite connection with prepared statement cache
 *
 * Features:
 * - Single connection serialized by a recursive mutex
 * - Prepared statement cache
 * - WAL mode
 * - Versioned migrations
 * - RAII transactions
 *
 * prepare() and beginTransaction() do not lock on their own: callers hold
 * acquire() for the whole unit of work so statements and savepoints from
 * different threads never interleave on the shared connection.
 */
class DatabaseManager {
public:
    struct Migration {
        int version;
        std::string description;
        std::string upSql;
    };

    struct Stats {
        int cacheHits;
        int cacheMisses;
        int totalQueries;
        int transactions;
    };

    explicit DatabaseManager(const std::string& dbPath);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    /**
     * @brief Open the database, enable WAL and foreign keys, run migrations
     * @return true on success
     */
    bool initialize(const std::vector<Migration>& migrations = {});

    /**
     * @brief Lock the connection for a multi-statement unit of work
     */
    std::unique_lock<std::recursive_mutex> acquire() const;

    /**
     * @brief Get or create a cached prepared statement (reset before return)
     * @return nullptr if the SQL fails to prepare
     */
    std::shared_ptr<PreparedStatement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (DDL, pragmas)
     */
    bool execute(const std::string& sql);

    std::unique_ptr<Transaction> beginTransaction();

    int64_t lastInsertRowId() const;
    int changes() const;
    std::string getLastError() const;

    int getCurrentVersion();
    const std::string& path() const { return dbPath_; }

    Stats getStats() const;

private:
    sqlite3* db_;
    std::string dbPath_;
    mutable std::recursive_mutex mutex_;

    std::unordered_map<std::string, std::shared_ptr<PreparedStatement>> statementCache_;
    Stats stats_{};

    bool enableWALMode();
    bool runMigrations(const std::vector<Migration>& migrations);
    bool executeInternal(const std::string& sql);
    int getCurrentVersionInternal();
    bool setVersionInternal(int version, const std::string& description);
};

} // namespace ChunkVault
