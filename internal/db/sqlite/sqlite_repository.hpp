#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ledgersync::db::sqlite {

/*
  Entities live in one table keyed by (kind, id). Sync metadata and the
  foreign keys used by queries are columns; domain fields are a JSON body.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEntity(Transaction&, const ledgersync::model::Entity&) override;
  Result UpdateEntity(Transaction&, const ledgersync::model::Entity&) override;
  std::optional<ledgersync::model::Entity> GetEntity(Transaction&, ledgersync::model::EntityKind, const std::string&) override;
  std::vector<ledgersync::model::Entity> QueryEntities(Transaction&, const EntityQuery&) override;
  std::size_t CountEntities(Transaction&, const EntityQuery&) override;
  Result DeleteEntity(Transaction&, ledgersync::model::EntityKind, const std::string&) override;

  Result PutCheckpoint(Transaction&, const model::CheckpointRecord&) override;
  std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string&, ledgersync::model::EntityKind) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

// CREATE TABLE IF NOT EXISTS for every table this repository uses.
void BootstrapSchema(SqliteDB& db);

}
