#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>

#include "internal/model/entity_kind.hpp"
#include "internal/remote/remote_store.hpp"
#include "internal/store/entity_store.hpp"
#include "internal/sync/sync_report.hpp"
#include "internal/sync/sync_state.hpp"
#include "internal/sync/worker_pool.hpp"
#include "internal/util/cancellation.hpp"

namespace ledgersync::sync {

/*
  Push-then-pull reconciliation of one owner's collections.

  Per collection: pending local rows (created/updated/deleted) are pushed and
  marked synced, then remote documents written after the collection
  checkpoint (a remote write sequence) are pulled and applied
  last-writer-wins by updatedAt. Collections run on a
  bounded worker pool.

  Per-item remote failures are accumulated as transient errors. Losing the
  remote (RemoteUnavailable) or cancellation stops the remaining work; rows
  whose push was confirmed stay synced. lastSyncAt advances only when every
  collection completed.
*/
class SyncEngine {
 public:
  SyncEngine(std::shared_ptr<store::EntityStore> store, std::shared_ptr<remote::RemoteStore> remote, std::shared_ptr<SyncState> state,
             std::size_t worker_threads);

  SyncReport PerformFullSync(const std::string& owner_id, util::CancellationToken token = {});

  // Rows waiting to be pushed, per collection.
  std::map<ledgersync::model::EntityKind, std::size_t> PendingCounts(const std::string& owner_id);

 private:
  struct RunContext;

  void SyncCollection(RunContext& ctx, CollectionReport& report);
  bool Push(RunContext& ctx, CollectionReport& report);
  bool Pull(RunContext& ctx, CollectionReport& report);

  std::shared_ptr<store::EntityStore>  store_;
  std::shared_ptr<remote::RemoteStore> remote_;
  std::shared_ptr<SyncState>           state_;
  WorkerPool                           pool_;
};

} // namespace ledgersync::sync
