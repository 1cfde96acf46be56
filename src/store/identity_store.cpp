#include "identity_store.h"
#include "../errors.h"
#include "../logger.h"
#include <chrono>
#include <cstring>
#include <ctime>

namespace rollcall {

namespace {

constexpr const char* DIMENSION_KEY = "embedding_dim";

constexpr const char* IDENTITY_COLUMNS =
    "roll_no, name, class_name, section, subject, embedding, dimension, sample_count, enrolled_at";

std::string nowString() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

void validateFilter(const IdentityFilter& filter) {
    if (filter.subject && !filter.section) {
        throw ValidationError("subject filter requires a section");
    }
    if (filter.section && !filter.class_name) {
        throw ValidationError("section filter requires a class");
    }
}

// WHERE clause for the filter's narrowing level, parameters bound in order
std::string whereClause(const IdentityFilter& filter) {
    if (!filter.class_name) return "";
    std::string clause = " WHERE class_name = ?";
    if (filter.section) clause += " AND section = ?";
    if (filter.subject) clause += " AND subject = ?";
    return clause;
}

int bindFilter(Statement& stmt, const IdentityFilter& filter, int index = 1) {
    if (filter.class_name) stmt.bind(index++, *filter.class_name);
    if (filter.section) stmt.bind(index++, *filter.section);
    if (filter.subject) stmt.bind(index++, *filter.subject);
    return index;
}

EnrolledIdentity readIdentity(const Statement& stmt) {
    EnrolledIdentity identity;
    identity.roll_no = stmt.columnText(0);
    identity.name = stmt.columnText(1);
    identity.class_name = stmt.columnText(2);
    identity.section = stmt.columnText(3);
    identity.subject = stmt.columnOptionalText(4);
    identity.embedding = unpackEncoding(stmt.columnBlob(5));
    size_t dim = static_cast<size_t>(stmt.columnInt(6));
    if (identity.embedding.size() != dim) {
        throw StoreError("corrupt embedding for roll number " + identity.roll_no +
                         ": expected " + std::to_string(dim) + " values, found " +
                         std::to_string(identity.embedding.size()));
    }
    identity.sample_count = static_cast<size_t>(stmt.columnInt(7));
    identity.enrolled_at = stmt.columnText(8);
    return identity;
}

} // namespace

std::string IdentityFilter::toString() const {
    if (!class_name) return "all";
    std::string s = *class_name;
    if (section) s += "/" + *section;
    if (subject) s += "/" + *subject;
    return s;
}

std::vector<uint8_t> packEncoding(const FaceEncoding& encoding) {
    std::vector<uint8_t> blob(encoding.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), encoding.data(), blob.size());
    }
    return blob;
}

FaceEncoding unpackEncoding(const std::vector<uint8_t>& blob) {
    if (blob.size() % sizeof(float) != 0) {
        throw StoreError("embedding blob size " + std::to_string(blob.size()) +
                         " is not a multiple of " + std::to_string(sizeof(float)));
    }
    FaceEncoding encoding(blob.size() / sizeof(float));
    if (!blob.empty()) {
        std::memcpy(encoding.data(), blob.data(), blob.size());
    }
    return encoding;
}

void IdentityStore::upsert(const EnrolledIdentity& identity) {
    if (!isValidRollCode(identity.roll_no)) {
        throw ValidationError("invalid roll number '" + identity.roll_no + "'");
    }
    if (trimWhitespace(identity.name).empty()) {
        throw ValidationError("identity " + identity.roll_no + " has an empty name");
    }
    validateScope({identity.class_name, identity.section, identity.subject});
    if (identity.embedding.empty()) {
        throw ValidationError("identity " + identity.roll_no + " has an empty embedding");
    }

    auto lock = db_.writeLock();
    Transaction txn(db_);

    auto pinned = dimensionLocked();
    if (pinned && *pinned != identity.embedding.size()) {
        throw DimensionMismatchError(*pinned, identity.embedding.size(),
                                     "enrolling " + identity.roll_no);
    }
    if (!pinned) {
        db_.setMeta(DIMENSION_KEY, std::to_string(identity.embedding.size()));
    }

    // ON CONFLICT ... DO UPDATE rather than INSERT OR REPLACE: REPLACE deletes
    // the old row first, which would cascade into attendance history
    Statement stmt(db_,
        "INSERT INTO identities(" + std::string(IDENTITY_COLUMNS) + ") "
        "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(roll_no) DO UPDATE SET "
        "name = excluded.name, class_name = excluded.class_name, section = excluded.section, "
        "subject = excluded.subject, embedding = excluded.embedding, dimension = excluded.dimension, "
        "sample_count = excluded.sample_count, enrolled_at = excluded.enrolled_at;");

    std::vector<uint8_t> blob = packEncoding(identity.embedding);
    stmt.bind(1, identity.roll_no)
        .bind(2, identity.name)
        .bind(3, identity.class_name)
        .bind(4, identity.section)
        .bind(5, identity.subject)
        .bindBlob(6, blob.data(), blob.size())
        .bind(7, static_cast<int64_t>(identity.embedding.size()))
        .bind(8, static_cast<int64_t>(identity.sample_count))
        .bind(9, identity.enrolled_at.empty() ? nowString() : identity.enrolled_at);
    stmt.run();

    txn.commit();
}

std::optional<EnrolledIdentity> IdentityStore::get(const std::string& roll_no) {
    auto lock = db_.readLock();
    Statement stmt(db_, "SELECT " + std::string(IDENTITY_COLUMNS) + " FROM identities WHERE roll_no = ?;");
    stmt.bind(1, roll_no);
    if (stmt.step()) {
        return readIdentity(stmt);
    }
    return std::nullopt;
}

std::vector<EnrolledIdentity> IdentityStore::query(const IdentityFilter& filter) {
    Statement stmt(db_, "SELECT " + std::string(IDENTITY_COLUMNS) + " FROM identities" +
                        whereClause(filter) + " ORDER BY roll_no;");
    bindFilter(stmt, filter);

    std::vector<EnrolledIdentity> out;
    while (stmt.step()) {
        out.push_back(readIdentity(stmt));
    }
    return out;
}

std::vector<EnrolledIdentity> IdentityStore::list(const IdentityFilter& filter) {
    validateFilter(filter);
    auto lock = db_.readLock();
    return query(filter);
}

std::vector<EnrolledIdentity> IdentityStore::snapshot(const Scope& scope) {
    validateScope(scope);
    auto lock = db_.readLock();
    return query(IdentityFilter::forScope(scope));
}

size_t IdentityStore::count() {
    auto lock = db_.readLock();
    Statement stmt(db_, "SELECT COUNT(*) FROM identities;");
    stmt.step();
    return static_cast<size_t>(stmt.columnInt(0));
}

std::optional<size_t> IdentityStore::dimension() {
    auto lock = db_.readLock();
    return dimensionLocked();
}

std::optional<size_t> IdentityStore::dimensionLocked() {
    auto value = db_.getMeta(DIMENSION_KEY);
    if (!value) {
        return std::nullopt;
    }
    try {
        return static_cast<size_t>(std::stoul(*value));
    } catch (const std::logic_error&) {
        throw StoreError("corrupt " + std::string(DIMENSION_KEY) + " value '" + *value + "'");
    }
}

DeleteResult IdentityStore::deleteIdentity(const std::string& roll_no) {
    DeleteResult result;

    auto lock = db_.writeLock();
    Transaction txn(db_);

    Statement count_stmt(db_, "SELECT COUNT(*) FROM attendance WHERE roll_no = ?;");
    count_stmt.bind(1, roll_no);
    count_stmt.step();
    size_t records = static_cast<size_t>(count_stmt.columnInt(0));
    count_stmt.reset();

    Statement stmt(db_, "DELETE FROM identities WHERE roll_no = ?;");
    stmt.bind(1, roll_no);
    stmt.run();

    if (db_.changes() == 0) {
        return result;  // NotFound; txn rolls back
    }

    txn.commit();

    result.status = DeleteStatus::Deleted;
    result.identities_removed = 1;
    result.records_removed = records;
    Logger::getInstance().auditDeletion("roll_no=" + roll_no, 1, records);
    return result;
}

DeleteResult IdentityStore::deleteScope(const std::string& class_name,
                                        const std::optional<std::string>& section,
                                        const std::optional<std::string>& subject) {
    if (trimWhitespace(class_name).empty()) {
        throw ValidationError("class name must not be empty");
    }
    IdentityFilter filter{class_name, section, subject};
    validateFilter(filter);

    DeleteResult result;
    const std::string where = whereClause(filter);

    auto lock = db_.writeLock();
    Transaction txn(db_);

    // Rows recorded under the scope plus rows that cascade from identities in it
    Statement count_records(db_,
        "SELECT COUNT(*) FROM attendance" + where +
        " OR roll_no IN (SELECT roll_no FROM identities" + where + ");");
    bindFilter(count_records, filter, bindFilter(count_records, filter));
    count_records.step();
    size_t records = static_cast<size_t>(count_records.columnInt(0));
    count_records.reset();

    Statement delete_records(db_, "DELETE FROM attendance" + where + ";");
    bindFilter(delete_records, filter);
    delete_records.run();

    Statement delete_identities(db_, "DELETE FROM identities" + where + ";");
    bindFilter(delete_identities, filter);
    delete_identities.run();
    size_t identities = static_cast<size_t>(db_.changes());

    if (identities == 0 && records == 0) {
        return result;  // NotFound
    }

    txn.commit();

    result.status = DeleteStatus::Deleted;
    result.identities_removed = identities;
    result.records_removed = records;
    Logger::getInstance().auditDeletion("scope=" + filter.toString(), identities, records);
    return result;
}

DeleteResult IdentityStore::clear() {
    DeleteResult result;

    auto lock = db_.writeLock();
    Transaction txn(db_);

    db_.execute("DELETE FROM attendance;");
    result.records_removed = static_cast<size_t>(db_.changes());
    db_.execute("DELETE FROM identities;");
    result.identities_removed = static_cast<size_t>(db_.changes());
    db_.execute("DELETE FROM sqlite_sequence WHERE name = 'attendance';");
    db_.deleteMeta(DIMENSION_KEY);

    txn.commit();

    result.status = DeleteStatus::Deleted;
    Logger::getInstance().auditDeletion("all", result.identities_removed, result.records_removed);
    return result;
}

} // namespace rollcall
