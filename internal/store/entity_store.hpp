#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/events/change_bus.hpp"
#include "internal/model/entity.hpp"
#include "internal/util/time.hpp"

namespace ledgersync::store {

enum class ApplyOutcome : std::uint8_t {
  kInserted,
  kOverwritten,
  kSkippedOlder,
  kSkippedRemoteTombstone,
};

/*
  Owner-scoped entity storage on top of a Repository.

  Every write runs inside Run(owner, ...): the owner's writer section is held
  and a single repository transaction spans the callback, so read-modify-write
  sequences are atomic. Change events are published after commit.

  Sync metadata rules enforced here:
    - create:   status=created, createdAt=updatedAt=now
    - mutate:   status collapses to updated unless still created,
                updatedAt strictly increases
    - mutators see domain fields only; id, owner, kind and sync metadata
      cannot be changed through them
    - only MarkSynced/ApplyRemote set synced
*/
class EntityStore {
 public:
  using Mutator   = std::function<void(ledgersync::model::EntityFields&)>;
  using Predicate = std::function<bool(const ledgersync::model::Entity&)>;

  class Batch {
   public:
    const std::string& owner_id() const {
      return owner_id_;
    }

    std::optional<ledgersync::model::Entity> Find(ledgersync::model::EntityKind kind, const std::string& id);
    ledgersync::model::Entity                Get(ledgersync::model::EntityKind kind, const std::string& id);
    std::vector<ledgersync::model::Entity>   Query(db::EntityQuery query);
    std::size_t                              Count(db::EntityQuery query);

    ledgersync::model::Entity Insert(ledgersync::model::Entity entity);
    ledgersync::model::Entity Mutate(ledgersync::model::EntityKind kind, const std::string& id, const Mutator& mutator);
    void                      Erase(ledgersync::model::EntityKind kind, const std::string& id);

    // Tombstone transitions (TombstoneManager).
    ledgersync::model::Entity Tombstone(ledgersync::model::EntityKind kind, const std::string& id, const std::string& actor);
    ledgersync::model::Entity Untombstone(ledgersync::model::EntityKind kind, const std::string& id, const Mutator& fixup);

    // Sync transitions (SyncEngine).
    bool         MarkSynced(ledgersync::model::EntityKind kind, const std::string& id, uint64_t expected_updated_at_ms);
    ApplyOutcome ApplyRemote(const ledgersync::model::Entity& remote);

    std::optional<uint64_t> Checkpoint(ledgersync::model::EntityKind kind);
    void                    PutCheckpoint(ledgersync::model::EntityKind kind, uint64_t last_remote_seq);

   private:
    friend class EntityStore;

    Batch(EntityStore& store, db::Transaction& tx, std::string owner_id, bool read_only);

    void     RequireWritable(const char* operation) const;
    void     Record(const ledgersync::model::Entity& entity, events::ChangeType type);
    uint64_t NextUpdatedAt(uint64_t previous) const;

    EntityStore&                     store_;
    db::Transaction&                 tx_;
    std::string                      owner_id_;
    bool                             read_only_;
    std::vector<events::ChangeEvent> events_;
  };

  EntityStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::ChangeBus> bus, util::NowFn now = util::Now);

  // Serialized read-write unit of work for one owner.
  void Run(const std::string& owner_id, const std::function<void(Batch&)>& work);

  // Read-only view; mutating Batch calls throw InvalidState.
  void Read(const std::string& owner_id, const std::function<void(Batch&)>& work);

  // ---------------------------------------------------------------------
  // Entity operations
  // ---------------------------------------------------------------------

  // Assigns an id when empty. Throws InvalidValue if fields do not match kind.
  ledgersync::model::Entity Create(ledgersync::model::Entity entity);

  std::optional<ledgersync::model::Entity> FetchById(const std::string& owner_id, ledgersync::model::EntityKind kind, const std::string& id);

  // Active (not soft-deleted) entities of one kind.
  std::vector<ledgersync::model::Entity> FetchByOwner(const std::string& owner_id, ledgersync::model::EntityKind kind, Predicate predicate = {},
                                                      db::SortKey sort = db::SortKey::kNone, bool descending = false);

  std::vector<ledgersync::model::Entity> Query(const db::EntityQuery& query);
  std::size_t                            Count(const db::EntityQuery& query);

  ledgersync::model::Entity Update(const std::string& owner_id, ledgersync::model::EntityKind kind, const std::string& id, const Mutator& mutator);

  // Unconditional hard delete. Dependency checks belong to TombstoneManager.
  void Delete(const std::string& owner_id, ledgersync::model::EntityKind kind, const std::string& id);

  // Inserts unless `existing` matches something; returns the inserted entity.
  std::optional<ledgersync::model::Entity> CreateIfAbsent(ledgersync::model::Entity entity, db::EntityQuery existing);

  // ---------------------------------------------------------------------
  // Sync engine paths
  // ---------------------------------------------------------------------

  // false when the row changed (or vanished) since the pushed snapshot
  bool         MarkSynced(const std::string& owner_id, ledgersync::model::EntityKind kind, const std::string& id, uint64_t expected_updated_at_ms);
  ApplyOutcome ApplyRemote(const ledgersync::model::Entity& remote);

  uint64_t CheckpointOf(const std::string& owner_id, ledgersync::model::EntityKind kind);
  void     AdvanceCheckpoint(const std::string& owner_id, ledgersync::model::EntityKind kind, uint64_t last_remote_seq);

  uint64_t NowMs() const;

 private:
  std::shared_ptr<std::mutex> OwnerMutex(const std::string& owner_id);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<events::ChangeBus> bus_;
  util::NowFn                        now_;

  std::mutex                                                   owner_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> owner_mutexes_;
};

} // namespace ledgersync::store
