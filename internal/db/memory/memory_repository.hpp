#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace ledgersync::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    // key: "<kind>#<id>"
    std::unordered_map<std::string, ledgersync::model::Entity> entities;
    // key: "<owner>#<kind>"
    std::unordered_map<std::string, model::CheckpointRecord> checkpoints;
  };

  // held by the open transaction for its whole lifetime
  std::mutex writer_mutex_;

  std::mutex mutex_;
  State committed_;
};

}
