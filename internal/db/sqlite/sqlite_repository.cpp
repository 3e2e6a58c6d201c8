#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/api/subjects.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace typelog::db::sqlite {

using typelog::db::ErrorCode;
using typelog::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    return b ? std::string(static_cast<const char*>(b), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static model::AttributeRecord ColRecord(sqlite3_stmt* st) {
    model::AttributeRecord r;
    r.subject = ColText(st, 0);
    r.attribute = ColText(st, 1);
    r.value = ColBlob(st, 2);
    r.timestamp_us = ColU64(st, 3);
    return r;
}

// Read paths have no Result channel; a failed prepare is a broken store.
static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw util::StoreError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    return st;
}

static void ThrowIfStepFailed(sqlite3* db, sqlite3_stmt* st, int rc) {
    if (rc != SQLITE_DONE) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        throw util::StoreError("sqlite step: " + msg);
    }
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Point operations
// ------------------------------------------------------------------

Result SqliteRepository::SetAttribute(Transaction& t, const model::AttributeRecord& r) {
    auto* db = TX(t).Handle();

    if (r.subject.empty() || r.attribute.empty())
        return Result::Err(ErrorCode::ConstraintViolation, "subject and attribute must be non-empty");

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_ATTRIBUTE, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.subject);
    BindText(st, 2, r.attribute);
    BindBlob(st, 3, r.value);
    BindU64(st, 4, r.timestamp_us);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<model::AttributeRecord>
SqliteRepository::ResolveRow(Transaction& t, const std::string& subject) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareOrThrow(db, sql::SELECT_ROW);

    BindText(st, 1, subject);

    std::vector<model::AttributeRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ColRecord(st));
    }
    ThrowIfStepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteSubject(Transaction& t, const std::string& subject) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_ROW, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, subject);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Ranged operations
// ------------------------------------------------------------------

std::vector<model::AttributeRecord> SqliteRepository::ScanAttribute(
    Transaction& t, const std::string& subject_prefix, const std::string& attribute,
    const std::optional<std::string>& after_subject, std::optional<uint64_t> max_records) {
    std::vector<model::AttributeRecord> out;
    if (max_records.has_value() && *max_records == 0)
        return out;

    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareOrThrow(db, sql::SCAN_ATTRIBUTE);

    auto lower = ChildLowerBound(subject_prefix);
    if (after_subject.has_value() && *after_subject > lower) {
        lower = *after_subject;
    }

    BindText(st, 1, attribute);
    BindText(st, 2, lower);
    BindText(st, 3, ChildUpperBound(subject_prefix));
    // negative LIMIT means unbounded in sqlite
    sqlite3_bind_int64(st, 4, max_records.has_value() ? static_cast<sqlite3_int64>(*max_records) : -1);

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ColRecord(st));
    }
    ThrowIfStepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

uint64_t SqliteRepository::CountAttribute(Transaction& t, const std::string& subject_prefix, const std::string& attribute) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareOrThrow(db, sql::COUNT_ATTRIBUTE);

    BindText(st, 1, attribute);
    BindText(st, 2, ChildLowerBound(subject_prefix));
    BindText(st, 3, ChildUpperBound(subject_prefix));

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        throw util::StoreError("sqlite count: " + msg);
    }

    uint64_t count = ColU64(st, 0);
    sqlite3_finalize(st);
    return count;
}

Result SqliteRepository::DeleteSubjectsWithPrefix(Transaction& t, const std::string& subject_prefix) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_ROWS_IN_RANGE, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, ChildLowerBound(subject_prefix));
    BindText(st, 2, ChildUpperBound(subject_prefix));

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

} // namespace typelog::db::sqlite
