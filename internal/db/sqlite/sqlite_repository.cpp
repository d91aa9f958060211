#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <chrono>

#include "internal/util/errors.hpp"

namespace gigbook::db::sqlite {

using gigbook::db::ErrorCode;
using gigbook::db::Result;
using gigbook::model::Collection;
using gigbook::model::TableName;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static int64_t NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// Reads have no Result channel; a statement that cannot be prepared is a storage failure.
static sqlite3_stmt* PrepareRead(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        throw util::StorageUnavailable(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    return st;
}

static void ThrowIfStepFailed(sqlite3* db, sqlite3_stmt* st, int rc) {
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        throw util::StorageUnavailable("sqlite read: " + msg);
    }
}

static model::EntityRecord ReadEntity(sqlite3_stmt* st, Collection collection) {
    model::EntityRecord r;
    r.collection    = collection;
    r.id            = ColText(st, 0);
    r.json          = ColText(st, 1);
    r.created_at_ms = ColI64(st, 2);
    r.updated_at_ms = ColI64(st, 3);
    return r;
}

static model::SyncOperationRecord ReadSyncOperation(sqlite3_stmt* st) {
    model::SyncOperationRecord r;
    r.seq     = static_cast<uint64_t>(ColI64(st, 0));
    r.id      = ColText(st, 1);
    r.type    = ColText(st, 2);
    r.table   = ColText(st, 3);
    r.item_id = ColText(st, 4);
    if (sqlite3_column_type(st, 5) != SQLITE_NULL)
        r.data_json = ColText(st, 5);
    r.timestamp_ms = ColI64(st, 6);
    return r;
}

static model::BlobRecord ReadBlob(sqlite3_stmt* st) {
    model::BlobRecord r;
    r.key           = ColText(st, 0);
    r.mime_type     = ColText(st, 1);
    r.size_bytes    = static_cast<uint64_t>(ColI64(st, 2));
    r.created_at_ms = ColI64(st, 3);
    return r;
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

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY ||
                sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Entity rows
// ------------------------------------------------------------------

Result SqliteRepository::InsertRow(Transaction& t, const model::EntityRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = "INSERT INTO " + std::string(TableName(r.collection)) +
                            "(id,json,created_at_ms,updated_at_ms) VALUES(?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.json);
    BindI64(st, 3, r.created_at_ms);
    BindI64(st, 4, r.updated_at_ms);

    int rc = sqlite3_step(st);
    Result result = Translate(db, rc);
    sqlite3_finalize(st);

    return result;
}

std::optional<model::EntityRecord>
SqliteRepository::GetRow(Transaction& t, Collection collection, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = "SELECT id,json,created_at_ms,updated_at_ms FROM " +
                            std::string(TableName(collection)) + " WHERE id=?;";

    sqlite3_stmt* st = PrepareRead(db, sql);
    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    ThrowIfStepFailed(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadEntity(st, collection);
    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpdateRow(Transaction& t, const model::EntityRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = "UPDATE " + std::string(TableName(r.collection)) +
                            " SET json=?,created_at_ms=?,updated_at_ms=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.json);
    BindI64(st, 2, r.created_at_ms);
    BindI64(st, 3, r.updated_at_ms);
    BindText(st, 4, r.id);

    int rc = sqlite3_step(st);
    Result result = Translate(db, rc);
    sqlite3_finalize(st);

    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, r.id);
    return result;
}

Result SqliteRepository::DeleteRow(Transaction& t, Collection collection, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = "DELETE FROM " + std::string(TableName(collection)) + " WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);
    int rc = sqlite3_step(st);
    Result result = Translate(db, rc);
    sqlite3_finalize(st);

    return result;
}

std::vector<model::EntityRecord> SqliteRepository::ScanRows(Transaction& t, Collection collection) {
    auto* db = TX(t).Handle();

    const std::string sql = "SELECT id,json,created_at_ms,updated_at_ms FROM " +
                            std::string(TableName(collection)) + " ORDER BY rowid ASC;";

    sqlite3_stmt* st = PrepareRead(db, sql);

    std::vector<model::EntityRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadEntity(st, collection));
    }
    ThrowIfStepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

uint64_t SqliteRepository::CountRows(Transaction& t, Collection collection) {
    auto* db = TX(t).Handle();

    const std::string sql = "SELECT COUNT(*) FROM " + std::string(TableName(collection)) + ";";
    sqlite3_stmt* st = PrepareRead(db, sql);

    int rc = sqlite3_step(st);
    ThrowIfStepFailed(db, st, rc);
    uint64_t count = rc == SQLITE_ROW ? static_cast<uint64_t>(ColI64(st, 0)) : 0;

    sqlite3_finalize(st);
    return count;
}

Result SqliteRepository::ClearRows(Transaction& t, Collection collection) {
    auto* db = TX(t).Handle();

    const std::string sql = "DELETE FROM " + std::string(TableName(collection)) + ";";
    return Translate(db, sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr));
}

// ------------------------------------------------------------------
// Schema versions
// ------------------------------------------------------------------

std::optional<int> SqliteRepository::GetSchemaVersion(Transaction& t, Collection collection) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(db, "SELECT version FROM schema_versions WHERE collection=?;");
    BindText(st, 1, std::string(TableName(collection)));

    int rc = sqlite3_step(st);
    ThrowIfStepFailed(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    int version = sqlite3_column_int(st, 0);
    sqlite3_finalize(st);
    return version;
}

Result SqliteRepository::SetSchemaVersion(Transaction& t, Collection collection, int version) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO schema_versions(collection,version,updated_at_ms) VALUES(?,?,?) "
        "ON CONFLICT(collection) DO UPDATE SET version=excluded.version, updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, std::string(TableName(collection)));
    sqlite3_bind_int(st, 2, version);
    BindI64(st, 3, NowMs());

    int rc = sqlite3_step(st);
    Result result = Translate(db, rc);
    sqlite3_finalize(st);

    return result;
}

std::vector<model::SchemaVersionRecord> SqliteRepository::ListSchemaVersions(Transaction& t) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(db, "SELECT collection,version,updated_at_ms FROM schema_versions;");

    std::vector<model::SchemaVersionRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        auto collection = gigbook::model::CollectionFromTable(ColText(st, 0));
        if (!collection) continue; // table from a newer build

        model::SchemaVersionRecord r;
        r.collection    = *collection;
        r.version       = sqlite3_column_int(st, 1);
        r.updated_at_ms = ColI64(st, 2);
        out.push_back(r);
    }
    ThrowIfStepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Sync outbox
// ------------------------------------------------------------------

Result SqliteRepository::AppendSyncOperations(Transaction& t, std::vector<model::SyncOperationRecord>& operations) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO sync_queue(id,type,table_name,item_id,data,timestamp_ms) VALUES(?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (auto& op : operations) {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);

        BindText(st, 1, op.id);
        BindText(st, 2, op.type);
        BindText(st, 3, op.table);
        BindText(st, 4, op.item_id);
        if (op.data_json)
            BindText(st, 5, *op.data_json);
        else
            sqlite3_bind_null(st, 5);
        BindI64(st, 6, op.timestamp_ms);

        int rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            Result result = Translate(db, rc);
            sqlite3_finalize(st);
            return result;
        }
        op.seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    }

    sqlite3_finalize(st);
    return Result::Ok();
}

std::vector<model::SyncOperationRecord> SqliteRepository::ListSyncOperations(Transaction& t) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(
        db, "SELECT seq,id,type,table_name,item_id,data,timestamp_ms FROM sync_queue ORDER BY timestamp_ms ASC, seq ASC;");

    std::vector<model::SyncOperationRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadSyncOperation(st));
    }
    ThrowIfStepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteSyncOperation(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM sync_queue WHERE id=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);
    int rc = sqlite3_step(st);
    Result result = Translate(db, rc);
    sqlite3_finalize(st);

    return result;
}

Result SqliteRepository::ClearSyncOperations(Transaction& t) {
    auto* db = TX(t).Handle();
    return Translate(db, sqlite3_exec(db, "DELETE FROM sync_queue;", nullptr, nullptr, nullptr));
}

// ------------------------------------------------------------------
// Blob index
// ------------------------------------------------------------------

Result SqliteRepository::UpsertBlob(Transaction& t, const model::BlobRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO blobs(key,mime_type,size_bytes,created_at_ms) VALUES(?,?,?,?) "
        "ON CONFLICT(key) DO UPDATE SET mime_type=excluded.mime_type, size_bytes=excluded.size_bytes, created_at_ms=excluded.created_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.key);
    BindText(st, 2, r.mime_type);
    BindI64(st, 3, static_cast<int64_t>(r.size_bytes));
    BindI64(st, 4, r.created_at_ms);

    int rc = sqlite3_step(st);
    Result result = Translate(db, rc);
    sqlite3_finalize(st);

    return result;
}

std::optional<model::BlobRecord> SqliteRepository::GetBlob(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(db, "SELECT key,mime_type,size_bytes,created_at_ms FROM blobs WHERE key=?;");
    BindText(st, 1, key);

    int rc = sqlite3_step(st);
    ThrowIfStepFailed(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadBlob(st);
    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::DeleteBlob(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM blobs WHERE key=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, key);
    int rc = sqlite3_step(st);
    Result result = Translate(db, rc);
    sqlite3_finalize(st);

    return result;
}

std::vector<model::BlobRecord> SqliteRepository::ListBlobs(Transaction& t) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(db, "SELECT key,mime_type,size_bytes,created_at_ms FROM blobs ORDER BY key ASC;");

    std::vector<model::BlobRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadBlob(st));
    }
    ThrowIfStepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::ClearBlobs(Transaction& t) {
    auto* db = TX(t).Handle();
    return Translate(db, sqlite3_exec(db, "DELETE FROM blobs;", nullptr, nullptr, nullptr));
}

} // namespace gigbook::db::sqlite
