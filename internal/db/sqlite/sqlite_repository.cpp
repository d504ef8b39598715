#include "sqlite_repository.hpp"

#include <map>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace retest::db::sqlite {

using retest::db::ErrorCode;
using retest::db::Result;

namespace {

using Stmt = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Stmt PrepareOrNull(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        return Stmt(nullptr, &sqlite3_finalize);
    }
    return Stmt(st, &sqlite3_finalize);
}

// Reads must not silently return partial data: a stale or missing
// checksum would make the stability computation unsafe.
Stmt PrepareForRead(sqlite3* db, const char* sql) {
    auto st = PrepareOrNull(db, sql);
    if (!st) {
        const int rc = sqlite3_errcode(db);
        if (rc == SQLITE_CORRUPT || rc == SQLITE_NOTADB)
            throw util::CorruptState(sqlite3_errmsg(db));
        throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return st;
}

void ThrowIfReadFailed(sqlite3* db, int rc) {
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) return;
    if (rc == SQLITE_CORRUPT || rc == SQLITE_NOTADB)
        throw util::CorruptState(sqlite3_errmsg(db));
    throw util::StorageError(std::string("sqlite read: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

retest::model::Outcome ColOutcome(sqlite3_stmt* st, int col) {
    const int v = sqlite3_column_int(st, col);
    switch (v) {
        case static_cast<int>(retest::model::Outcome::kPassed):
            return retest::model::Outcome::kPassed;
        case static_cast<int>(retest::model::Outcome::kFailed):
            return retest::model::Outcome::kFailed;
        case static_cast<int>(retest::model::Outcome::kOther):
            return retest::model::Outcome::kOther;
        default:
            throw util::CorruptState("unknown outcome value " + std::to_string(v));
    }
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::BeginTx(TxMode mode) {
    return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Test nodes
// ------------------------------------------------------------------

Result SqliteRepository::UpsertNode(Transaction& t, const model::NodeRecord& r) {
    auto* db = TX(t).Handle();

    if (t.ReadOnly())
        return Result::Err(ErrorCode::ReadOnly, "upsert node");
    if (r.node_id.empty())
        return Result::Err(ErrorCode::ConstraintViolation, "empty node id");

    auto node = PrepareOrNull(db, sql::UPSERT_NODE);
    if (!node) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(node.get(), 1, r.environment);
    BindText(node.get(), 2, r.node_id);
    BindI32(node.get(), 3, static_cast<int>(r.outcome));
    BindDouble(node.get(), 4, r.duration_ms);

    int rc = sqlite3_step(node.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    // full replace: stale entries from removed code paths must not survive
    auto clear = PrepareOrNull(db, sql::DELETE_FINGERPRINT);
    if (!clear) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(clear.get(), 1, r.environment);
    BindText(clear.get(), 2, r.node_id);
    rc = sqlite3_step(clear.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    auto ins = PrepareOrNull(db, sql::INSERT_FINGERPRINT_ENTRY);
    if (!ins) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& entry : retest::model::Normalize(r.fingerprint)) {
        sqlite3_reset(ins.get());
        sqlite3_clear_bindings(ins.get());

        BindText(ins.get(), 1, r.environment);
        BindText(ins.get(), 2, r.node_id);
        BindText(ins.get(), 3, entry.path);
        BindText(ins.get(), 4, entry.checksum);

        rc = sqlite3_step(ins.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    return Result::Ok();
}

std::optional<model::NodeRecord>
SqliteRepository::GetNode(Transaction& t, const std::string& environment, const std::string& node_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareForRead(db, sql::SELECT_NODE);
    BindText(st.get(), 1, environment);
    BindText(st.get(), 2, node_id);

    int rc = sqlite3_step(st.get());
    ThrowIfReadFailed(db, rc);
    if (rc != SQLITE_ROW) return std::nullopt;

    model::NodeRecord r;
    r.environment = environment;
    r.node_id = ColText(st.get(), 0);
    r.outcome = ColOutcome(st.get(), 1);
    r.duration_ms = sqlite3_column_double(st.get(), 2);

    auto fp = PrepareForRead(db, sql::SELECT_FINGERPRINT);
    BindText(fp.get(), 1, environment);
    BindText(fp.get(), 2, node_id);

    while ((rc = sqlite3_step(fp.get())) == SQLITE_ROW) {
        r.fingerprint.push_back({ColText(fp.get(), 0), ColText(fp.get(), 1)});
    }
    ThrowIfReadFailed(db, rc);

    return r;
}

std::vector<model::NodeRecord>
SqliteRepository::ListNodes(Transaction& t, const std::string& environment) {
    auto* db = TX(t).Handle();

    std::map<std::string, model::NodeRecord> by_id;

    auto st = PrepareForRead(db, sql::SELECT_NODES);
    BindText(st.get(), 1, environment);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::NodeRecord r;
        r.environment = environment;
        r.node_id = ColText(st.get(), 0);
        r.outcome = ColOutcome(st.get(), 1);
        r.duration_ms = sqlite3_column_double(st.get(), 2);
        by_id.emplace(r.node_id, std::move(r));
    }
    ThrowIfReadFailed(db, rc);

    auto fp = PrepareForRead(db, sql::SELECT_FINGERPRINTS);
    BindText(fp.get(), 1, environment);

    while ((rc = sqlite3_step(fp.get())) == SQLITE_ROW) {
        auto it = by_id.find(ColText(fp.get(), 0));
        if (it == by_id.end())
            throw util::CorruptState("fingerprint row without node in environment '" + environment + "'");
        it->second.fingerprint.push_back({ColText(fp.get(), 1), ColText(fp.get(), 2)});
    }
    ThrowIfReadFailed(db, rc);

    std::vector<model::NodeRecord> out;
    out.reserve(by_id.size());
    for (auto& [_, record] : by_id) out.push_back(std::move(record));
    return out;
}

Result SqliteRepository::DeleteNodesExcept(Transaction& t, const std::string& environment,
                                           const std::set<std::string>& retained, uint64_t* removed) {
    if (t.ReadOnly())
        return Result::Err(ErrorCode::ReadOnly, "delete nodes");
    auto* db = TX(t).Handle();

    auto ids = PrepareOrNull(db, sql::SELECT_NODE_IDS);
    if (!ids) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(ids.get(), 1, environment);

    std::vector<std::string> stale;
    int rc;
    while ((rc = sqlite3_step(ids.get())) == SQLITE_ROW) {
        auto id = ColText(ids.get(), 0);
        if (!retained.contains(id)) stale.push_back(std::move(id));
    }
    if (rc != SQLITE_DONE) return Translate(db, rc);

    auto del = PrepareOrNull(db, sql::DELETE_NODE);
    if (!del) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& id : stale) {
        sqlite3_reset(del.get());
        sqlite3_clear_bindings(del.get());
        BindText(del.get(), 1, environment);
        BindText(del.get(), 2, id);

        rc = sqlite3_step(del.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    if (removed) *removed = stale.size();
    return Result::Ok();
}

// ------------------------------------------------------------------
// Checksum store
// ------------------------------------------------------------------

Result SqliteRepository::UpsertFile(Transaction& t, const model::FileRecord& r) {
    auto* db = TX(t).Handle();

    if (t.ReadOnly())
        return Result::Err(ErrorCode::ReadOnly, "upsert file");
    if (r.path.empty())
        return Result::Err(ErrorCode::ConstraintViolation, "empty file path");

    auto st = PrepareOrNull(db, sql::UPSERT_FILE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.environment);
    BindText(st.get(), 2, r.path);
    BindText(st.get(), 3, r.checksum);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::FileRecord>
SqliteRepository::ListFiles(Transaction& t, const std::string& environment) {
    auto* db = TX(t).Handle();

    auto st = PrepareForRead(db, sql::SELECT_FILES);
    BindText(st.get(), 1, environment);

    std::vector<model::FileRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::FileRecord r;
        r.environment = environment;
        r.path = ColText(st.get(), 0);
        r.checksum = ColText(st.get(), 1);
        out.push_back(std::move(r));
    }
    ThrowIfReadFailed(db, rc);
    return out;
}

Result SqliteRepository::DeleteUnreferencedFiles(Transaction& t, const std::string& environment, uint64_t* removed) {
    if (t.ReadOnly())
        return Result::Err(ErrorCode::ReadOnly, "delete files");
    auto* db = TX(t).Handle();

    auto st = PrepareOrNull(db, sql::DELETE_UNREFERENCED_FILES);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, environment);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (removed) *removed = static_cast<uint64_t>(sqlite3_changes(db));
    return Result::Ok();
}

// ------------------------------------------------------------------
// Attributes
// ------------------------------------------------------------------

Result SqliteRepository::SetAttribute(Transaction& t, const model::AttributeRecord& r) {
    auto* db = TX(t).Handle();

    if (t.ReadOnly())
        return Result::Err(ErrorCode::ReadOnly, "set attribute");
    if (r.key.empty())
        return Result::Err(ErrorCode::ConstraintViolation, "empty attribute key");

    auto st = PrepareOrNull(db, sql::UPSERT_ATTRIBUTE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.environment);
    BindText(st.get(), 2, r.key);
    BindText(st.get(), 3, r.value);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<std::string>
SqliteRepository::GetAttribute(Transaction& t, const std::string& environment, const std::string& key) {
    auto* db = TX(t).Handle();

    auto st = PrepareForRead(db, sql::SELECT_ATTRIBUTE);
    BindText(st.get(), 1, environment);
    BindText(st.get(), 2, key);

    int rc = sqlite3_step(st.get());
    ThrowIfReadFailed(db, rc);
    if (rc != SQLITE_ROW) return std::nullopt;

    return ColText(st.get(), 0);
}

}
