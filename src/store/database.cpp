#include "database.h"
#include "../errors.h"
#include "../logger.h"

namespace rollcall {

namespace {

constexpr const char* SCHEMA_VERSION = "1";

} // namespace

// ========== Statement ==========

Statement::Statement(Database& db, const std::string& sql) : db_(db), sql_(sql) {
    int rc = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_.errorMessage();
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw StoreError("failed to prepare statement: " + msg + " (SQL: " + sql + ")");
    }
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

void Statement::check(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        throw StoreError(std::string(what) + " failed: " + db_.errorMessage() + " (SQL: " + sql_ + ")");
    }
}

Statement& Statement::bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
          "bind text");
    return *this;
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    if (!value) {
        check(sqlite3_bind_null(stmt_, index), "bind null");
        return *this;
    }
    return bind(index, *value);
}

Statement& Statement::bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, value), "bind int");
    return *this;
}

Statement& Statement::bind(int index, double value) {
    check(sqlite3_bind_double(stmt_, index, value), "bind double");
    return *this;
}

Statement& Statement::bindBlob(int index, const void* data, size_t size) {
    check(sqlite3_bind_blob(stmt_, index, data, static_cast<int>(size), SQLITE_TRANSIENT), "bind blob");
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw StoreError("step failed: " + db_.errorMessage() + " (SQL: " + sql_ + ")");
}

void Statement::run() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string Statement::columnText(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(text), sqlite3_column_bytes(stmt_, col));
}

std::optional<std::string> Statement::columnOptionalText(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return columnText(col);
}

int64_t Statement::columnInt(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

double Statement::columnDouble(int col) const {
    return sqlite3_column_double(stmt_, col);
}

std::vector<uint8_t> Statement::columnBlob(int col) const {
    const void* data = sqlite3_column_blob(stmt_, col);
    int size = sqlite3_column_bytes(stmt_, col);
    if (!data || size <= 0) {
        return {};
    }
    const auto* bytes = static_cast<const uint8_t*>(data);
    return std::vector<uint8_t>(bytes, bytes + size);
}

// ========== Database ==========

Database::Database(const std::string& path, int busy_timeout_ms) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("cannot open database " + path + ": " + msg);
    }

    try {
        sqlite3_busy_timeout(db_, busy_timeout_ms);
        execute("PRAGMA journal_mode = WAL;");
        execute("PRAGMA foreign_keys = ON;");
        createTables();
    } catch (const StoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    Logger::getInstance().debug("Opened database " + path);
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void Database::execute(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errmsg(db_);
        sqlite3_free(err_msg);
        throw StoreError("SQL error: " + msg + " (SQL: " + sql + ")");
    }
}

void Database::createTables() {
    const char* sql_meta =
        "CREATE TABLE IF NOT EXISTS meta ("
        "key TEXT PRIMARY KEY,"
        "value TEXT NOT NULL"
        ");";

    const char* sql_identities =
        "CREATE TABLE IF NOT EXISTS identities ("
        "roll_no TEXT PRIMARY KEY,"
        "name TEXT NOT NULL,"
        "class_name TEXT NOT NULL,"
        "section TEXT NOT NULL,"
        "subject TEXT,"
        "embedding BLOB NOT NULL,"
        "dimension INTEGER NOT NULL,"
        "sample_count INTEGER NOT NULL,"
        "enrolled_at TEXT NOT NULL"
        ");";

    const char* sql_attendance =
        "CREATE TABLE IF NOT EXISTS attendance ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "roll_no TEXT NOT NULL,"
        "name TEXT NOT NULL,"
        "class_name TEXT NOT NULL,"
        "section TEXT NOT NULL,"
        "subject TEXT,"
        "similarity REAL NOT NULL,"
        "date TEXT NOT NULL,"
        "time TEXT NOT NULL,"
        "crop_path TEXT NOT NULL,"
        "FOREIGN KEY(roll_no) REFERENCES identities(roll_no) ON DELETE CASCADE"
        ");";

    const char* sql_idx_scope = "CREATE INDEX IF NOT EXISTS idx_identities_scope ON identities(class_name, section, subject);";
    const char* sql_idx_roll = "CREATE INDEX IF NOT EXISTS idx_attendance_roll ON attendance(roll_no);";
    const char* sql_idx_class = "CREATE INDEX IF NOT EXISTS idx_attendance_class ON attendance(class_name, section, date);";

    execute(sql_meta);
    execute(sql_identities);
    execute(sql_attendance);
    execute(sql_idx_scope);
    execute(sql_idx_roll);
    execute(sql_idx_class);

    if (!getMeta("schema_version")) {
        setMeta("schema_version", SCHEMA_VERSION);
    }
}

std::optional<std::string> Database::getMeta(const std::string& key) {
    Statement stmt(*this, "SELECT value FROM meta WHERE key = ?;");
    stmt.bind(1, key);
    if (stmt.step()) {
        return stmt.columnText(0);
    }
    return std::nullopt;
}

void Database::setMeta(const std::string& key, const std::string& value) {
    Statement stmt(*this, "INSERT INTO meta(key, value) VALUES(?, ?) "
                          "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
    stmt.bind(1, key).bind(2, value);
    stmt.run();
}

void Database::deleteMeta(const std::string& key) {
    Statement stmt(*this, "DELETE FROM meta WHERE key = ?;");
    stmt.bind(1, key);
    stmt.run();
}

// ========== Transaction ==========

Transaction::Transaction(Database& db) : db_(db) {
    db_.execute("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (done_) {
        return;
    }
    char* err_msg = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
        Logger::getInstance().error(std::string("Rollback failed: ") + (err_msg ? err_msg : "unknown"));
    }
    sqlite3_free(err_msg);
}

void Transaction::commit() {
    db_.execute("COMMIT;");
    done_ = true;
}

} // namespace rollcall
