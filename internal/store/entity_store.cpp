#include "entity_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace ledgersync::store {

using ledgersync::model::Entity;
using ledgersync::model::EntityKind;
using ledgersync::model::SyncStatus;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

std::string Describe(EntityKind kind, const std::string& id) {
  return std::string(ledgersync::model::KindName(kind)) + " " + id;
}

void Transition(Entity& entity, SyncStatus to) {
  if (!ledgersync::model::CanTransition(entity.sync.status, to)) {
    throw util::InvalidState(Describe(entity.kind, entity.id) + ": sync status cannot go from " +
                             std::string(ledgersync::model::ToString(entity.sync.status)) + " to " + std::string(ledgersync::model::ToString(to)));
  }
  entity.sync.status = to;
}

} // namespace

// ---------------------------------------------------------------------
// Batch
// ---------------------------------------------------------------------

EntityStore::Batch::Batch(EntityStore& store, db::Transaction& tx, std::string owner_id, bool read_only)
    : store_(store), tx_(tx), owner_id_(std::move(owner_id)), read_only_(read_only) {
}

void EntityStore::Batch::RequireWritable(const char* operation) const {
  if (read_only_) {
    throw util::InvalidState(std::string(operation) + ": not allowed in a read-only batch");
  }
}

void EntityStore::Batch::Record(const Entity& entity, events::ChangeType type) {
  events_.push_back(events::ChangeEvent{owner_id_, entity.kind, entity.id, type, entity.sync.updated_at_ms});
}

uint64_t EntityStore::Batch::NextUpdatedAt(uint64_t previous) const {
  return std::max(store_.NowMs(), previous + 1);
}

std::optional<Entity> EntityStore::Batch::Find(EntityKind kind, const std::string& id) {
  auto entity = store_.repository_->GetEntity(tx_, kind, id);
  if (!entity.has_value() || entity->owner_id != owner_id_) {
    return std::nullopt;
  }
  return entity;
}

Entity EntityStore::Batch::Get(EntityKind kind, const std::string& id) {
  auto entity = Find(kind, id);
  if (!entity.has_value()) {
    throw util::NotFound(Describe(kind, id) + " not found");
  }
  return std::move(*entity);
}

std::vector<Entity> EntityStore::Batch::Query(db::EntityQuery query) {
  query.owner_id = owner_id_;
  return store_.repository_->QueryEntities(tx_, query);
}

std::size_t EntityStore::Batch::Count(db::EntityQuery query) {
  query.owner_id = owner_id_;
  return store_.repository_->CountEntities(tx_, query);
}

Entity EntityStore::Batch::Insert(Entity entity) {
  RequireWritable("insert");
  if (entity.owner_id.empty()) {
    entity.owner_id = owner_id_;
  }
  if (entity.owner_id != owner_id_) {
    throw util::InvalidValue("insert " + Describe(entity.kind, entity.id) + ": owner mismatch");
  }
  if (!ledgersync::model::FieldsMatchKind(entity.kind, entity.fields)) {
    throw util::InvalidValue("insert: fields do not match kind " + std::string(ledgersync::model::KindName(entity.kind)));
  }
  if (entity.id.empty()) {
    entity.id = util::NewId();
  }

  const auto now = store_.NowMs();
  entity.sync    = ledgersync::model::SyncMetadata{};
  entity.sync.status        = SyncStatus::kCreated;
  entity.sync.created_at_ms = now;
  entity.sync.updated_at_ms = now;

  ThrowIfDbError(store_.repository_->InsertEntity(tx_, entity), "insert " + Describe(entity.kind, entity.id));
  Record(entity, events::ChangeType::kCreated);
  return entity;
}

Entity EntityStore::Batch::Mutate(EntityKind kind, const std::string& id, const Mutator& mutator) {
  RequireWritable("update");
  auto entity = Get(kind, id);
  if (entity.sync.soft_deleted) {
    throw util::InvalidState("update " + Describe(kind, id) + ": entity is deleted; restore it first");
  }

  auto fields = entity.fields;
  mutator(fields);
  if (!ledgersync::model::FieldsMatchKind(kind, fields)) {
    throw util::InvalidValue("update " + Describe(kind, id) + ": mutator changed the field set");
  }

  entity.fields             = std::move(fields);
  Transition(entity, ledgersync::model::StatusAfterMutation(entity.sync.status));
  entity.sync.updated_at_ms = NextUpdatedAt(entity.sync.updated_at_ms);

  ThrowIfDbError(store_.repository_->UpdateEntity(tx_, entity), "update " + Describe(kind, id));
  Record(entity, events::ChangeType::kUpdated);
  return entity;
}

void EntityStore::Batch::Erase(EntityKind kind, const std::string& id) {
  RequireWritable("delete");
  auto entity = Get(kind, id);
  ThrowIfDbError(store_.repository_->DeleteEntity(tx_, kind, id), "delete " + Describe(kind, id));
  entity.sync.updated_at_ms = store_.NowMs();
  Record(entity, events::ChangeType::kHardDeleted);
}

Entity EntityStore::Batch::Tombstone(EntityKind kind, const std::string& id, const std::string& actor) {
  RequireWritable("soft delete");
  auto entity = Get(kind, id);
  if (entity.sync.soft_deleted) {
    return entity;
  }

  Transition(entity, SyncStatus::kDeleted);
  entity.sync.soft_deleted  = true;
  entity.sync.updated_at_ms = NextUpdatedAt(entity.sync.updated_at_ms);
  entity.sync.deleted_at_ms = entity.sync.updated_at_ms;
  entity.sync.deleted_by    = actor;

  ThrowIfDbError(store_.repository_->UpdateEntity(tx_, entity), "soft delete " + Describe(kind, id));
  Record(entity, events::ChangeType::kSoftDeleted);
  return entity;
}

Entity EntityStore::Batch::Untombstone(EntityKind kind, const std::string& id, const Mutator& fixup) {
  RequireWritable("restore");
  auto entity = Get(kind, id);
  if (!entity.sync.soft_deleted) {
    throw util::NotDeleted("restore " + Describe(kind, id) + ": entity is not deleted");
  }

  if (fixup) {
    fixup(entity.fields);
    if (!ledgersync::model::FieldsMatchKind(kind, entity.fields)) {
      throw util::InvalidValue("restore " + Describe(kind, id) + ": fixup changed the field set");
    }
  }
  Transition(entity, SyncStatus::kUpdated);
  entity.sync.soft_deleted = false;
  entity.sync.deleted_at_ms.reset();
  entity.sync.deleted_by.clear();
  entity.sync.updated_at_ms = NextUpdatedAt(entity.sync.updated_at_ms);

  ThrowIfDbError(store_.repository_->UpdateEntity(tx_, entity), "restore " + Describe(kind, id));
  Record(entity, events::ChangeType::kRestored);
  return entity;
}

bool EntityStore::Batch::MarkSynced(EntityKind kind, const std::string& id, uint64_t expected_updated_at_ms) {
  RequireWritable("mark synced");
  auto entity = Find(kind, id);
  if (!entity.has_value() || entity->sync.updated_at_ms != expected_updated_at_ms) {
    return false;
  }
  if (!ledgersync::model::IsPending(entity->sync.status)) {
    return true;
  }

  Transition(*entity, SyncStatus::kSynced);
  ThrowIfDbError(store_.repository_->UpdateEntity(tx_, *entity), "mark synced " + Describe(kind, id));
  Record(*entity, events::ChangeType::kSynced);
  return true;
}

ApplyOutcome EntityStore::Batch::ApplyRemote(const Entity& remote) {
  RequireWritable("apply remote");
  if (remote.owner_id != owner_id_) {
    throw util::InvalidValue("apply remote " + Describe(remote.kind, remote.id) + ": owner mismatch");
  }
  if (!ledgersync::model::FieldsMatchKind(remote.kind, remote.fields)) {
    throw util::InvalidValue("apply remote " + Describe(remote.kind, remote.id) + ": fields do not match kind");
  }

  Entity incoming      = remote;
  incoming.sync.status = SyncStatus::kSynced;
  if (incoming.sync.soft_deleted && !incoming.sync.deleted_at_ms.has_value()) {
    incoming.sync.deleted_at_ms = incoming.sync.updated_at_ms;
  }
  if (!incoming.sync.soft_deleted) {
    incoming.sync.deleted_at_ms.reset();
    incoming.sync.deleted_by.clear();
  }

  auto local = Find(remote.kind, remote.id);
  if (!local.has_value()) {
    if (incoming.sync.soft_deleted) {
      return ApplyOutcome::kSkippedRemoteTombstone;
    }
    ThrowIfDbError(store_.repository_->InsertEntity(tx_, incoming), "apply remote " + Describe(remote.kind, remote.id));
    Record(incoming, events::ChangeType::kRemoteApplied);
    return ApplyOutcome::kInserted;
  }

  // last writer wins; ties keep the local copy
  if (incoming.sync.updated_at_ms <= local->sync.updated_at_ms) {
    return ApplyOutcome::kSkippedOlder;
  }

  incoming.sync.created_at_ms = std::min(local->sync.created_at_ms, incoming.sync.updated_at_ms);
  ThrowIfDbError(store_.repository_->UpdateEntity(tx_, incoming), "apply remote " + Describe(remote.kind, remote.id));
  Record(incoming, events::ChangeType::kRemoteApplied);
  return ApplyOutcome::kOverwritten;
}

std::optional<uint64_t> EntityStore::Batch::Checkpoint(EntityKind kind) {
  auto record = store_.repository_->GetCheckpoint(tx_, owner_id_, kind);
  if (!record.has_value()) {
    return std::nullopt;
  }
  return record->last_remote_seq;
}

void EntityStore::Batch::PutCheckpoint(EntityKind kind, uint64_t last_remote_seq) {
  RequireWritable("put checkpoint");
  db::model::CheckpointRecord record;
  record.owner_id        = owner_id_;
  record.kind            = kind;
  record.last_remote_seq = last_remote_seq;
  record.updated_at_ms   = store_.NowMs();
  ThrowIfDbError(store_.repository_->PutCheckpoint(tx_, record), "put checkpoint");
}

// ---------------------------------------------------------------------
// EntityStore
// ---------------------------------------------------------------------

EntityStore::EntityStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::ChangeBus> bus, util::NowFn now)
    : repository_(std::move(repository)), bus_(std::move(bus)), now_(std::move(now)) {
  if (!repository_) {
    throw std::invalid_argument("EntityStore requires a repository");
  }
  if (!now_) {
    now_ = util::Now;
  }
}

uint64_t EntityStore::NowMs() const {
  return util::ToUnixMillis(now_());
}

std::shared_ptr<std::mutex> EntityStore::OwnerMutex(const std::string& owner_id) {
  std::lock_guard<std::mutex> lock(owner_mutexes_guard_);
  auto&                       owner_mutex = owner_mutexes_[owner_id];
  if (!owner_mutex) {
    owner_mutex = std::make_shared<std::mutex>();
  }
  return owner_mutex;
}

void EntityStore::Run(const std::string& owner_id, const std::function<void(Batch&)>& work) {
  if (owner_id.empty()) {
    throw util::InvalidValue("owner id must not be empty");
  }

  std::vector<events::ChangeEvent> events;
  {
    std::lock_guard<std::mutex> owner_lock(*OwnerMutex(owner_id));
    auto                        tx = repository_->Begin();
    Batch                       batch(*this, *tx, owner_id, false);
    work(batch);
    tx->Commit();
    events = std::move(batch.events_);
  }

  if (bus_) {
    for (auto& event : events) {
      bus_->Publish(std::move(event));
    }
  }
}

void EntityStore::Read(const std::string& owner_id, const std::function<void(Batch&)>& work) {
  auto  tx = repository_->Begin();
  Batch batch(*this, *tx, owner_id, true);
  work(batch);
  tx->Rollback();
}

Entity EntityStore::Create(Entity entity) {
  const auto owner_id = entity.owner_id;
  Entity     created;
  Run(owner_id, [&](Batch& batch) { created = batch.Insert(std::move(entity)); });
  return created;
}

std::optional<Entity> EntityStore::FetchById(const std::string& owner_id, EntityKind kind, const std::string& id) {
  std::optional<Entity> found;
  Read(owner_id, [&](Batch& batch) { found = batch.Find(kind, id); });
  return found;
}

std::vector<Entity> EntityStore::FetchByOwner(const std::string& owner_id, EntityKind kind, Predicate predicate, db::SortKey sort, bool descending) {
  auto query       = db::ActiveOf(kind, owner_id);
  query.predicate  = std::move(predicate);
  query.sort       = sort;
  query.descending = descending;
  return Query(query);
}

std::vector<Entity> EntityStore::Query(const db::EntityQuery& query) {
  std::vector<Entity> out;
  Read(query.owner_id, [&](Batch& batch) { out = batch.Query(query); });
  return out;
}

std::size_t EntityStore::Count(const db::EntityQuery& query) {
  std::size_t count = 0;
  Read(query.owner_id, [&](Batch& batch) { count = batch.Count(query); });
  return count;
}

Entity EntityStore::Update(const std::string& owner_id, EntityKind kind, const std::string& id, const Mutator& mutator) {
  Entity updated;
  Run(owner_id, [&](Batch& batch) { updated = batch.Mutate(kind, id, mutator); });
  return updated;
}

void EntityStore::Delete(const std::string& owner_id, EntityKind kind, const std::string& id) {
  Run(owner_id, [&](Batch& batch) { batch.Erase(kind, id); });
}

std::optional<Entity> EntityStore::CreateIfAbsent(Entity entity, db::EntityQuery existing) {
  const auto            owner_id = entity.owner_id;
  std::optional<Entity> created;
  Run(owner_id, [&](Batch& batch) {
    if (batch.Count(existing) > 0) {
      return;
    }
    created = batch.Insert(std::move(entity));
  });
  return created;
}

bool EntityStore::MarkSynced(const std::string& owner_id, EntityKind kind, const std::string& id, uint64_t expected_updated_at_ms) {
  bool marked = false;
  Run(owner_id, [&](Batch& batch) { marked = batch.MarkSynced(kind, id, expected_updated_at_ms); });
  return marked;
}

ApplyOutcome EntityStore::ApplyRemote(const Entity& remote) {
  auto outcome = ApplyOutcome::kSkippedOlder;
  Run(remote.owner_id, [&](Batch& batch) { outcome = batch.ApplyRemote(remote); });
  return outcome;
}

uint64_t EntityStore::CheckpointOf(const std::string& owner_id, EntityKind kind) {
  uint64_t checkpoint = 0;
  Read(owner_id, [&](Batch& batch) { checkpoint = batch.Checkpoint(kind).value_or(0); });
  return checkpoint;
}

void EntityStore::AdvanceCheckpoint(const std::string& owner_id, EntityKind kind, uint64_t last_remote_seq) {
  Run(owner_id, [&](Batch& batch) {
    const auto current = batch.Checkpoint(kind).value_or(0);
    batch.PutCheckpoint(kind, std::max(current, last_remote_seq));
  });
}

} // namespace ledgersync::store
