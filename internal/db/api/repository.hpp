#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/query.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/checkpoint_record.hpp"
#include "internal/model/entity.hpp"

namespace ledgersync::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Transactions are serialized (single writer)
  - Entities are keyed by (kind, id); the stored row is returned verbatim,
    sync metadata included

  The local store is the source of truth for:
    entities and their sync metadata
    per-collection pull checkpoints
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Entities
  // ---------------------------------------------------------------------

  // AlreadyExists when (kind, id) is taken.
  virtual Result InsertEntity(Transaction&, const ledgersync::model::Entity&) = 0;

  // NotFound when (kind, id) is absent.
  virtual Result UpdateEntity(Transaction&, const ledgersync::model::Entity&) = 0;

  virtual std::optional<ledgersync::model::Entity> GetEntity(Transaction&, ledgersync::model::EntityKind kind, const std::string& id) = 0;

  virtual std::vector<ledgersync::model::Entity> QueryEntities(Transaction&, const EntityQuery& query) = 0;

  virtual std::size_t CountEntities(Transaction&, const EntityQuery& query) = 0;

  // NotFound when (kind, id) is absent.
  virtual Result DeleteEntity(Transaction&, ledgersync::model::EntityKind kind, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Sync checkpoints
  // ---------------------------------------------------------------------

  virtual Result PutCheckpoint(Transaction&, const model::CheckpointRecord&) = 0;

  virtual std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string& owner_id, ledgersync::model::EntityKind kind) = 0;
};

} // namespace ledgersync::db
