#include "DatabaseManager.h"
#include "Logger.h"
#include <atomic>
#include <cstring>
#include <stdexcept>

namespace ChunkVault {

namespace {
    std::atomic<uint64_t> savepointCounter{0};
}

// Transaction Implementation
Transaction::Transaction(sqlite3* db) : db_(db), finished_(false) {
    savepoint_ = "txn_" + std::to_string(savepointCounter.fetch_add(1));
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, ("SAVEPOINT " + savepoint_).c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string message = errMsg ? errMsg : "";
        if (errMsg) sqlite3_free(errMsg);
        Logger::instance().error("Failed to create transaction savepoint: " + message, "DatabaseManager");
        throw std::runtime_error("Failed to create transaction: " + message);
    }
}

Transaction::~Transaction() {
    if (!finished_) {
        rollback();
    }
}

void Transaction::commit() {
    if (finished_) {
        return;
    }
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, ("RELEASE " + savepoint_).c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string message = errMsg ? errMsg : "";
        if (errMsg) sqlite3_free(errMsg);
        Logger::instance().error("Failed to commit transaction: " + message, "DatabaseManager");
        throw std::runtime_error("Failed to commit transaction: " + message);
    }
    finished_ = true;
}

void Transaction::rollback() {
    if (finished_) {
        return;
    }
    finished_ = true;
    if (sqlite3_exec(db_, ("ROLLBACK TO " + savepoint_).c_str(), nullptr, nullptr, nullptr) != SQLITE_OK ||
        sqlite3_exec(db_, ("RELEASE " + savepoint_).c_str(), nullptr, nullptr, nullptr) != SQLITE_OK) {
        Logger::instance().error("Rollback of " + savepoint_ + " failed: " + sqlite3_errmsg(db_), "DatabaseManager");
    }
}

// PreparedStatement Implementation
PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + sql + " - " + sqlite3_errmsg(db_));
    }
}

PreparedStatement::~PreparedStatement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

PreparedStatement& PreparedStatement::bind(int index, int value) {
    sqlite3_bind_int(stmt_, index, value);
    return *this;
}

PreparedStatement& PreparedStatement::bind(int index, int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
    return *this;
}

PreparedStatement& PreparedStatement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
}

bool PreparedStatement::step() {
    lastResult_ = sqlite3_step(stmt_);
    return lastResult_ == SQLITE_ROW;
}

bool PreparedStatement::execute() {
    do {
        lastResult_ = sqlite3_step(stmt_);
    } while (lastResult_ == SQLITE_ROW);
    return lastResult_ == SQLITE_DONE;
}

void PreparedStatement::reset() {
    sqlite3_reset(stmt_);
    lastResult_ = SQLITE_OK;
}

void PreparedStatement::clearBindings() {
    sqlite3_clear_bindings(stmt_);
}

int PreparedStatement::getColumnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

int64_t PreparedStatement::getColumnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

std::string PreparedStatement::getColumnString(int index) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? std::string(text) : std::string();
}

bool PreparedStatement::isColumnNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

// DatabaseManager Implementation
DatabaseManager::DatabaseManager(const std::string& dbPath)
    : db_(nullptr), dbPath_(dbPath) {
    std::memset(&stats_, 0, sizeof(stats_));
}

DatabaseManager::~DatabaseManager() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    // Statements must be finalized before the connection closes
    statementCache_.clear();
    if (db_) {
        sqlite3_close(db_);
    }
}

bool DatabaseManager::initialize(const std::vector<Migration>& migrations) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Logger::instance().info("Opening database: " + dbPath_, "DatabaseManager");

    // FULLMUTEX: the connection is shared by upload workers
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(dbPath_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        Logger::instance().error("Failed to open database: " + dbPath_ +
                                 (db_ ? std::string(" - ") + sqlite3_errmsg(db_) : ""), "DatabaseManager");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    if (!enableWALMode()) {
        Logger::instance().warn("Failed to enable WAL mode", "DatabaseManager");
    }

    if (!executeInternal("PRAGMA foreign_keys=ON")) {
        return false;
    }
    sqlite3_busy_timeout(db_, 5000);

    if (!runMigrations(migrations)) {
        Logger::instance().error("Failed to run migrations", "DatabaseManager");
        return false;
    }

    Logger::instance().info("Database initialized at schema version " +
                            std::to_string(getCurrentVersionInternal()), "DatabaseManager");
    return true;
}

std::unique_lock<std::recursive_mutex> DatabaseManager::acquire() const {
    return std::unique_lock<std::recursive_mutex>(mutex_);
}

bool DatabaseManager::enableWALMode() {
    char* errMsg = nullptr;
    int result = sqlite3_exec(db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, &errMsg);
    if (result != SQLITE_OK) {
        if (errMsg) {
            Logger::instance().error("Failed to enable WAL mode: " + std::string(errMsg), "DatabaseManager");
            sqlite3_free(errMsg);
        }
        return false;
    }

    executeInternal("PRAGMA synchronous=NORMAL");
    executeInternal("PRAGMA temp_store=MEMORY");
    return true;
}

bool DatabaseManager::runMigrations(const std::vector<Migration>& migrations) {
    if (!executeInternal("CREATE TABLE IF NOT EXISTS schema_version (version INTEGER PRIMARY KEY, description TEXT)")) {
        return false;
    }

    int currentVersion = getCurrentVersionInternal();

    for (const auto& migration : migrations) {
        if (migration.version <= currentVersion) {
            continue;
        }
        Logger::instance().info("Running migration " + std::to_string(migration.version) + ": " +
                                migration.description, "DatabaseManager");
        try {
            Transaction txn(db_);
            if (!executeInternal(migration.upSql)) {
                Logger::instance().error("Migration failed: " + migration.description, "DatabaseManager");
                return false;
            }
            if (!setVersionInternal(migration.version, migration.description)) {
                return false;
            }
            txn.commit();
        } catch (const std::exception& e) {
            Logger::instance().error("Migration " + std::to_string(migration.version) + " aborted: " + e.what(),
                                     "DatabaseManager");
            return false;
        }
    }

    return true;
}

int DatabaseManager::getCurrentVersion() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return getCurrentVersionInternal();
}

int DatabaseManager::getCurrentVersionInternal() {
    auto stmt = prepare("SELECT version FROM schema_version ORDER BY version DESC LIMIT 1");
    if (!stmt) {
        return 0;
    }
    int version = stmt->step() ? stmt->getColumnInt(0) : 0;
    stmt->reset();   // do not hold a read snapshot open
    return version;
}

bool DatabaseManager::setVersionInternal(int version, const std::string& description) {
    auto stmt = prepare("INSERT OR REPLACE INTO schema_version (version, description) VALUES (?, ?)");
    if (!stmt) {
        return false;
    }
    stmt->bind(1, version).bind(2, description);
    bool result = stmt->execute();
    if (!result) {
        Logger::instance().error("Failed to record schema version: " + std::string(sqlite3_errmsg(db_)), "DatabaseManager");
    }
    return result;
}

std::shared_ptr<PreparedStatement> DatabaseManager::prepare(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    stats_.totalQueries++;
    auto it = statementCache_.find(sql);
    if (it != statementCache_.end()) {
        stats_.cacheHits++;
        it->second->reset();
        it->second->clearBindings();
        return it->second;
    }

    stats_.cacheMisses++;

    try {
        auto stmt = std::make_shared<PreparedStatement>(db_, sql);
        statementCache_[sql] = stmt;
        return stmt;
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to prepare statement: " + std::string(e.what()), "DatabaseManager");
        return nullptr;
    }
}

bool DatabaseManager::executeInternal(const std::string& sql) {
    char* errMsg = nullptr;
    int result = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);

    if (result != SQLITE_OK) {
        Logger::instance().error("Failed to execute SQL: " + sql + " - " + std::string(errMsg ? errMsg : ""), "DatabaseManager");
        if (errMsg) sqlite3_free(errMsg);
        return false;
    }

    return true;
}

bool DatabaseManager::execute(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return executeInternal(sql);
}

std::unique_ptr<Transaction> DatabaseManager::beginTransaction() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    stats_.transactions++;
    return std::make_unique<Transaction>(db_);
}

int64_t DatabaseManager::lastInsertRowId() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return sqlite3_last_insert_rowid(db_);
}

int DatabaseManager::changes() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return sqlite3_changes(db_);
}

std::string DatabaseManager::getLastError() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

DatabaseManager::Stats DatabaseManager::getStats() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return stats_;
}

} // namespace ChunkVault
