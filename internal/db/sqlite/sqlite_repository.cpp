#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "internal/codec/entity_codec.hpp"

namespace ledgersync::db::sqlite {

using ledgersync::db::ErrorCode;
using ledgersync::db::Result;
using ledgersync::model::Entity;
using ledgersync::model::EntityKind;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;
using Param   = std::variant<std::string, int64_t>;

constexpr const char* kEntityColumns =
    "kind,id,owner_id,sync_status,soft_deleted,deleted_at_ms,deleted_by,created_at_ms,updated_at_ms,body";

StmtPtr Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    return StmtPtr(nullptr, &sqlite3_finalize);
  }
  return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s.has_value()) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindParams(sqlite3_stmt* st, const std::vector<Param>& params) {
  for (size_t i = 0; i < params.size(); ++i) {
    const int idx = static_cast<int>(i) + 1;
    if (const auto* text = std::get_if<std::string>(&params[i])) {
      BindText(st, idx, *text);
    } else {
      BindI64(st, idx, std::get<int64_t>(params[i]));
    }
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

Entity ReadEntity(sqlite3_stmt* st) {
  Entity e;
  e.kind     = static_cast<EntityKind>(sqlite3_column_int(st, 0));
  e.id       = ColText(st, 1);
  e.owner_id = ColText(st, 2);

  e.sync.status       = ledgersync::model::ParseSyncStatus(ColText(st, 3));
  e.sync.soft_deleted = sqlite3_column_int(st, 4) != 0;
  if (!ColIsNull(st, 5)) {
    e.sync.deleted_at_ms = ColU64(st, 5);
  }
  e.sync.deleted_by    = ColText(st, 6);
  e.sync.created_at_ms = ColU64(st, 7);
  e.sync.updated_at_ms = ColU64(st, 8);

  e.fields = codec::FieldsFromJson(e.kind, ColText(st, 9));
  return e;
}

std::optional<std::string> DateColumn(const Entity& e) {
  if (auto date = ledgersync::model::OccurrenceDate(e.fields)) {
    return util::FormatDate(*date);
  }
  return std::nullopt;
}

// Binds every column after (kind, id) starting at `first`; returns next index.
int BindEntityColumns(sqlite3_stmt* st, int first, const Entity& e) {
  int idx = first;
  BindText(st, idx++, e.owner_id);
  BindText(st, idx++, std::string(ledgersync::model::ToString(e.sync.status)));
  sqlite3_bind_int(st, idx++, e.sync.soft_deleted ? 1 : 0);
  if (e.sync.deleted_at_ms.has_value()) {
    BindU64(st, idx++, *e.sync.deleted_at_ms);
  } else {
    sqlite3_bind_null(st, idx++);
  }
  BindText(st, idx++, e.sync.deleted_by);
  BindU64(st, idx++, e.sync.created_at_ms);
  BindU64(st, idx++, e.sync.updated_at_ms);
  BindOptionalText(st, idx++, ledgersync::model::CategoryRef(e.fields));
  BindOptionalText(st, idx++, ledgersync::model::RuleRef(e.fields));
  BindOptionalText(st, idx++, DateColumn(e));
  BindText(st, idx++, codec::FieldsToJson(e.fields));
  return idx;
}

// WHERE clause for the indexed members of the query.
std::string BuildWhere(const EntityQuery& q, std::vector<Param>& params) {
  std::string where = " WHERE kind=? AND owner_id=?";
  params.emplace_back(static_cast<int64_t>(q.kind));
  params.emplace_back(q.owner_id);

  if (q.soft_deleted.has_value()) {
    where += " AND soft_deleted=?";
    params.emplace_back(static_cast<int64_t>(*q.soft_deleted ? 1 : 0));
  }
  if (!q.statuses.empty()) {
    where += " AND sync_status IN (";
    for (size_t i = 0; i < q.statuses.size(); ++i) {
      where += i == 0 ? "?" : ",?";
      params.emplace_back(std::string(ledgersync::model::ToString(q.statuses[i])));
    }
    where += ")";
  }
  if (q.category_id.has_value()) {
    where += " AND category_id=?";
    params.emplace_back(*q.category_id);
  }
  if (q.recurring_rule_id.has_value()) {
    where += " AND recurring_rule_id=?";
    params.emplace_back(*q.recurring_rule_id);
  }
  if (q.deleted_before_ms.has_value()) {
    where += " AND deleted_at_ms IS NOT NULL AND deleted_at_ms<?";
    params.emplace_back(static_cast<int64_t>(*q.deleted_before_ms));
  }
  if (q.deleted_after_ms.has_value()) {
    where += " AND deleted_at_ms IS NOT NULL AND deleted_at_ms>?";
    params.emplace_back(static_cast<int64_t>(*q.deleted_after_ms));
  }
  if (q.occurrence_date.has_value()) {
    where += " AND occurrence_date=?";
    params.emplace_back(util::FormatDate(*q.occurrence_date));
  }
  return where;
}

} // namespace

// 1: checkpoints held client timestamps
// 2: checkpoints hold the remote write sequence
constexpr int kSchemaVersion = 2;

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS entities (kind INTEGER NOT NULL, id TEXT NOT NULL, owner_id TEXT NOT NULL, sync_status TEXT NOT NULL, "
      "soft_deleted INTEGER NOT NULL DEFAULT 0, deleted_at_ms INTEGER, deleted_by TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL, category_id TEXT, recurring_rule_id TEXT, occurrence_date TEXT, body TEXT NOT NULL, "
      "PRIMARY KEY (kind, id));",
      "CREATE INDEX IF NOT EXISTS entities_owner_kind ON entities(owner_id, kind, soft_deleted, sync_status);",
      "CREATE INDEX IF NOT EXISTS entities_rule_date ON entities(kind, recurring_rule_id, occurrence_date);",
      "CREATE INDEX IF NOT EXISTS entities_category ON entities(kind, category_id);",
      "CREATE TABLE IF NOT EXISTS sync_checkpoints (owner_id TEXT NOT NULL, kind INTEGER NOT NULL, last_remote_seq INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL, PRIMARY KEY (owner_id, kind));"};

  const auto version = db.UserVersion();
  if (version > kSchemaVersion) {
    throw std::runtime_error("ledger database " + db.Path() + " has schema version " + std::to_string(version) + ", newer than supported " +
                             std::to_string(kSchemaVersion));
  }

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
  if (version == 1) {
    // old checkpoints are not sequences; the next pull starts over and last-writer-wins absorbs the replay
    db.Exec("ALTER TABLE sync_checkpoints RENAME COLUMN last_remote_updated_at_ms TO last_remote_seq;");
    db.Exec("UPDATE sync_checkpoints SET last_remote_seq = 0;");
  }
  if (version < kSchemaVersion) {
    db.SetUserVersion(kSchemaVersion);
  }

  db.Exec(std::string("SELECT ") + kEntityColumns + " FROM entities LIMIT 1;");
  db.Exec("SELECT owner_id,kind,last_remote_seq,updated_at_ms FROM sync_checkpoints LIMIT 1;");
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

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
// Entities
// ------------------------------------------------------------------

Result SqliteRepository::InsertEntity(Transaction& t, const Entity& e) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO entities(kind,id,owner_id,sync_status,soft_deleted,deleted_at_ms,deleted_by,created_at_ms,updated_at_ms,"
                    "category_id,recurring_rule_id,occurrence_date,body) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  sqlite3_bind_int(st.get(), 1, static_cast<int>(e.kind));
  BindText(st.get(), 2, e.id);
  BindEntityColumns(st.get(), 3, e);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_CONSTRAINT && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
    return Result::Err(ErrorCode::AlreadyExists, "entity " + e.id + " already exists");
  }
  return Translate(db, rc);
}

Result SqliteRepository::UpdateEntity(Transaction& t, const Entity& e) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE entities SET owner_id=?,sync_status=?,soft_deleted=?,deleted_at_ms=?,deleted_by=?,created_at_ms=?,updated_at_ms=?,"
                    "category_id=?,recurring_rule_id=?,occurrence_date=?,body=? WHERE kind=? AND id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  int idx = BindEntityColumns(st.get(), 1, e);
  sqlite3_bind_int(st.get(), idx++, static_cast<int>(e.kind));
  BindText(st.get(), idx, e.id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "entity " + e.id + " not found");
  return Result::Ok();
}

std::optional<Entity> SqliteRepository::GetEntity(Transaction& t, EntityKind kind, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kEntityColumns + " FROM entities WHERE kind=? AND id=?;");
  if (!st) return std::nullopt;

  sqlite3_bind_int(st.get(), 1, static_cast<int>(kind));
  BindText(st.get(), 2, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadEntity(st.get());
}

std::vector<Entity> SqliteRepository::QueryEntities(Transaction& t, const EntityQuery& query) {
  auto* db = TX(t).Handle();

  std::vector<Param> params;
  const auto         sql = std::string("SELECT ") + kEntityColumns + " FROM entities" + BuildWhere(query, params) + ";";

  std::vector<Entity> out;
  auto                st = Prepare(db, sql);
  if (!st) return out;
  BindParams(st.get(), params);

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    auto entity = ReadEntity(st.get());
    if (Matches(query, entity)) out.push_back(std::move(entity));
  }
  Finalize(query, out);
  return out;
}

std::size_t SqliteRepository::CountEntities(Transaction& t, const EntityQuery& query) {
  if (query.predicate) {
    return QueryEntities(t, query).size();
  }

  auto* db = TX(t).Handle();

  std::vector<Param> params;
  auto               st = Prepare(db, "SELECT COUNT(*) FROM entities" + BuildWhere(query, params) + ";");
  if (!st) return 0;
  BindParams(st.get(), params);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return static_cast<std::size_t>(sqlite3_column_int64(st.get(), 0));
}

Result SqliteRepository::DeleteEntity(Transaction& t, EntityKind kind, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM entities WHERE kind=? AND id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  sqlite3_bind_int(st.get(), 1, static_cast<int>(kind));
  BindText(st.get(), 2, id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "entity " + id + " not found");
  return Result::Ok();
}

// ------------------------------------------------------------------
// Checkpoints
// ------------------------------------------------------------------

Result SqliteRepository::PutCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO sync_checkpoints(owner_id,kind,last_remote_seq,updated_at_ms) VALUES(?,?,?,?) "
                    "ON CONFLICT(owner_id,kind) DO UPDATE SET last_remote_seq=excluded.last_remote_seq,"
                    "updated_at_ms=excluded.updated_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.owner_id);
  sqlite3_bind_int(st.get(), 2, static_cast<int>(r.kind));
  BindU64(st.get(), 3, r.last_remote_seq);
  BindU64(st.get(), 4, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CheckpointRecord> SqliteRepository::GetCheckpoint(Transaction& t, const std::string& owner_id, EntityKind kind) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT last_remote_seq,updated_at_ms FROM sync_checkpoints WHERE owner_id=? AND kind=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, owner_id);
  sqlite3_bind_int(st.get(), 2, static_cast<int>(kind));

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::CheckpointRecord r;
  r.owner_id        = owner_id;
  r.kind            = kind;
  r.last_remote_seq = ColU64(st.get(), 0);
  r.updated_at_ms   = ColU64(st.get(), 1);
  return r;
}

} // namespace ledgersync::db::sqlite
