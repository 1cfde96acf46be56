#ifndef ROLLCALL_DATABASE_H
#define ROLLCALL_DATABASE_H

#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace rollcall {

class Database;

/**
 * Prepared statement (RAII). Parameters are 1-based, columns 0-based.
 * All failures throw StoreError carrying sqlite's message.
 */
class Statement {
public:
    Statement(Database& db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const std::optional<std::string>& value);  // nullopt binds NULL
    Statement& bind(int index, const char* value) { return bind(index, std::string(value)); }
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, int value) { return bind(index, static_cast<int64_t>(value)); }
    Statement& bind(int index, double value);
    Statement& bindBlob(int index, const void* data, size_t size);

    // Advance; true while a row is available
    bool step();

    // Run to completion (INSERT / UPDATE / DELETE)
    void run();

    void reset();

    std::string columnText(int col) const;
    std::optional<std::string> columnOptionalText(int col) const;
    int64_t columnInt(int col) const;
    double columnDouble(int col) const;
    std::vector<uint8_t> columnBlob(int col) const;

private:
    void check(int rc, const char* what);

    Database& db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

/**
 * Owns the single SQLite connection of the process.
 *
 * - Opened in serialized mode with WAL journaling, a busy timeout and
 *   foreign keys enabled; the schema is created on open
 * - Writers hold writeLock() for the length of their Transaction, readers
 *   hold readLock() so they never observe a half-applied write
 */
class Database {
public:
    explicit Database(const std::string& path, int busy_timeout_ms = 5000);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void execute(const std::string& sql);

    std::unique_lock<std::shared_mutex> writeLock() { return std::unique_lock<std::shared_mutex>(rw_mutex_); }
    std::shared_lock<std::shared_mutex> readLock() { return std::shared_lock<std::shared_mutex>(rw_mutex_); }

    // Key/value metadata (schema version, pinned embedding dimension)
    std::optional<std::string> getMeta(const std::string& key);
    void setMeta(const std::string& key, const std::string& value);
    void deleteMeta(const std::string& key);

    int changes() const { return sqlite3_changes(db_); }
    std::string errorMessage() const { return sqlite3_errmsg(db_); }
    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

private:
    void createTables();

    sqlite3* db_ = nullptr;
    std::string path_;
    std::shared_mutex rw_mutex_;
};

/**
 * BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
 * The caller must already hold Database::writeLock().
 */
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_ = false;
};

} // namespace rollcall

#endif // ROLLCALL_DATABASE_H
