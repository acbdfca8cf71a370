#include "memory_repository.hpp"

#include <string>

#include "memory_tx.hpp"

namespace ledgersync::db::memory {

using ledgersync::model::Entity;
using ledgersync::model::EntityKind;

namespace {

std::string EntityKey(EntityKind kind, const std::string& id) {
  return std::to_string(static_cast<int>(kind)) + "#" + id;
}

std::string CheckpointKey(const std::string& owner_id, EntityKind kind) {
  return owner_id + "#" + std::to_string(static_cast<int>(kind));
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertEntity(Transaction& t, const Entity& e) {
  auto&      s   = TX(t).Mutable();
  const auto key = EntityKey(e.kind, e.id);
  if (s.entities.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "entity " + e.id + " already exists");
  s.entities.emplace(key, e);
  return Result::Ok();
}

Result MemoryRepository::UpdateEntity(Transaction& t, const Entity& e) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entities.find(EntityKey(e.kind, e.id));
  if (it == s.entities.end()) return Result::Err(ErrorCode::NotFound, "entity " + e.id + " not found");
  it->second = e;
  return Result::Ok();
}

std::optional<Entity> MemoryRepository::GetEntity(Transaction& t, EntityKind kind, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.entities.find(EntityKey(kind, id));
  if (it == s.entities.end()) return std::nullopt;
  return it->second;
}

std::vector<Entity> MemoryRepository::QueryEntities(Transaction& t, const EntityQuery& query) {
  std::vector<Entity> out;
  for (const auto& [_, entity] : TX(t).View().entities) {
    if (Matches(query, entity)) out.push_back(entity);
  }
  Finalize(query, out);
  return out;
}

std::size_t MemoryRepository::CountEntities(Transaction& t, const EntityQuery& query) {
  std::size_t count = 0;
  for (const auto& [_, entity] : TX(t).View().entities) {
    if (Matches(query, entity)) ++count;
  }
  return count;
}

Result MemoryRepository::DeleteEntity(Transaction& t, EntityKind kind, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.entities.erase(EntityKey(kind, id)) == 0) return Result::Err(ErrorCode::NotFound, "entity " + id + " not found");
  return Result::Ok();
}

Result MemoryRepository::PutCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  TX(t).Mutable().checkpoints[CheckpointKey(r.owner_id, r.kind)] = r;
  return Result::Ok();
}

std::optional<model::CheckpointRecord> MemoryRepository::GetCheckpoint(Transaction& t, const std::string& owner_id, EntityKind kind) {
  const auto& s  = TX(t).View();
  auto        it = s.checkpoints.find(CheckpointKey(owner_id, kind));
  if (it == s.checkpoints.end()) return std::nullopt;
  return it->second;
}

} // namespace ledgersync::db::memory
