#include "sync_engine.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>

#include "internal/codec/entity_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledgersync::sync {

using ledgersync::model::Entity;
using ledgersync::model::EntityKind;
using ledgersync::model::SyncStatus;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

// push + pull per collection
constexpr std::size_t kStepsPerCollection = 2;
constexpr std::size_t kTotalSteps         = ledgersync::model::kDependencyOrder.size() * kStepsPerCollection;

db::EntityQuery PendingOf(EntityKind kind, const std::string& owner_id) {
  db::EntityQuery query;
  query.kind     = kind;
  query.owner_id = owner_id;
  query.statuses = {SyncStatus::kCreated, SyncStatus::kUpdated, SyncStatus::kDeleted};
  query.sort     = db::SortKey::kUpdatedAt;
  return query;
}

} // namespace

struct SyncEngine::RunContext {
  RunContext(std::string owner, util::CancellationToken cancel, SyncState& sync_state)
      : owner_id(std::move(owner)), token(std::move(cancel)), state(sync_state) {
  }

  std::string             owner_id;
  util::CancellationToken token;
  SyncState&              state;

  std::atomic<bool>        aborted{false};
  std::atomic<std::size_t> steps_done{0};

  std::mutex             errors_mutex;
  std::vector<SyncError> errors;

  bool Stopped() const {
    return aborted.load() || token.IsCancelled();
  }

  void Transient(EntityKind kind, const std::string& id, const std::string& message) {
    const util::TransientSyncError error(message);
    LEDGERSYNC_LOG_WARN("sync item failed", {StringField("collection", ledgersync::model::CollectionName(kind)), StringField("id", id),
                                             StringField("error", error.what())});
    std::lock_guard lock(errors_mutex);
    errors.push_back({ErrorSeverity::kTransient, kind, id, error.what()});
  }

  void Fatal(std::optional<EntityKind> kind, const util::FatalSyncError& error) {
    aborted = true;
    LEDGERSYNC_LOG_ERROR("sync aborted", {StringField("error", error.what())});
    std::lock_guard lock(errors_mutex);
    errors.push_back({ErrorSeverity::kFatal, kind, {}, error.what()});
  }

  void Step(const std::string& operation) {
    const auto done = ++steps_done;
    state.SetProgress(static_cast<double>(done) / static_cast<double>(kTotalSteps), operation);
  }
};

SyncEngine::SyncEngine(std::shared_ptr<store::EntityStore> store, std::shared_ptr<remote::RemoteStore> remote, std::shared_ptr<SyncState> state,
                       std::size_t worker_threads)
    : store_(std::move(store)), remote_(std::move(remote)), state_(std::move(state)), pool_(worker_threads) {
}

SyncReport SyncEngine::PerformFullSync(const std::string& owner_id, util::CancellationToken token) {
  SyncReport report;
  report.started_at_ms = store_->NowMs();

  if (!state_->TryBegin()) {
    report.outcome        = SyncOutcome::kAlreadyRunning;
    report.finished_at_ms = report.started_at_ms;
    return report;
  }

  LEDGERSYNC_LOG_INFO("sync started", {StringField("owner", owner_id)});

  RunContext ctx(owner_id, token, *state_);

  try {
    // preflight
    try {
      state_->SetProgress(0.0, "checking connectivity");
      remote_->Ping();
    } catch (const util::RemoteUnavailable& e) {
      ctx.Fatal(std::nullopt, util::FatalSyncError(std::string("remote unavailable: ") + e.what()));
    } catch (const util::RemoteError& e) {
      ctx.Fatal(std::nullopt, util::FatalSyncError(std::string("remote preflight failed: ") + e.what()));
    }

    for (const auto kind : ledgersync::model::kDependencyOrder) {
      CollectionReport collection;
      collection.kind = kind;
      report.collections.push_back(collection);
    }

    if (!ctx.Stopped()) {
      std::vector<std::future<void>> pending;
      pending.reserve(report.collections.size());
      for (auto& collection : report.collections) {
        pending.push_back(pool_.Submit([this, &ctx, &collection] { SyncCollection(ctx, collection); }));
      }
      for (auto& f : pending) f.get();
    }
  } catch (const std::exception& e) {
    state_->Finish(std::nullopt, std::string("sync failed: ") + e.what());
    throw;
  }

  report.errors         = std::move(ctx.errors);
  report.finished_at_ms = store_->NowMs();

  const bool all_completed = std::all_of(report.collections.begin(), report.collections.end(),
                                         [](const CollectionReport& c) { return c.completed; });

  std::optional<uint64_t>    last_sync_at;
  std::optional<std::string> last_error;

  if (report.HasFatalError()) {
    report.outcome = SyncOutcome::kFailed;
    for (const auto& e : report.errors) {
      if (e.severity == ErrorSeverity::kFatal) {
        last_error = e.message;
        break;
      }
    }
  } else if (token.IsCancelled()) {
    report.outcome = SyncOutcome::kCancelled;
    last_error     = "sync cancelled";
  } else if (!report.errors.empty() || !all_completed) {
    report.outcome = SyncOutcome::kCompletedWithErrors;
    last_error     = std::to_string(report.errors.size()) + " item(s) failed to sync";
    if (all_completed) last_sync_at = report.started_at_ms;
  } else {
    report.outcome = SyncOutcome::kCompleted;
    last_sync_at   = report.started_at_ms;
  }

  state_->Finish(last_sync_at, last_error);

  LEDGERSYNC_LOG_INFO("sync finished", {StringField("owner", owner_id), StringField("outcome", ToString(report.outcome)),
                                        IntField("errors", static_cast<int64_t>(report.errors.size())), BoolField("all_collections_completed", all_completed),
                                        IntField("duration_ms", static_cast<int64_t>(report.finished_at_ms - report.started_at_ms))});
  return report;
}

void SyncEngine::SyncCollection(RunContext& ctx, CollectionReport& report) {
  try {
    if (!Push(ctx, report)) return;
    report.completed = Pull(ctx, report);
  } catch (const util::FatalSyncError& e) {
    ctx.Fatal(report.kind, e);
  } catch (const std::exception& e) {
    // local store failure: this collection is incomplete, siblings continue
    LEDGERSYNC_LOG_ERROR("collection sync failed", {StringField("collection", ledgersync::model::CollectionName(report.kind)),
                                                    StringField("error", e.what())});
    std::lock_guard lock(ctx.errors_mutex);
    ctx.errors.push_back({ErrorSeverity::kTransient, report.kind, {}, e.what()});
  }
}

bool SyncEngine::Push(RunContext& ctx, CollectionReport& report) {
  const std::string collection(ledgersync::model::CollectionName(report.kind));
  ctx.state.SetProgress(static_cast<double>(ctx.steps_done.load()) / kTotalSteps, "pushing " + collection);

  for (const auto& entity : store_->Query(PendingOf(report.kind, ctx.owner_id))) {
    if (ctx.Stopped()) return false;

    const auto document = codec::ToRemoteDocument(entity);
    try {
      if (entity.sync.soft_deleted) {
        remote_->MarkDeleted(collection, document);
      } else {
        remote_->Upsert(collection, document);
      }
    } catch (const util::RemoteUnavailable& e) {
      throw util::FatalSyncError("push " + collection + "/" + entity.id + ": " + e.what());
    } catch (const util::RemoteError& e) {
      ++report.push_failed;
      ctx.Transient(report.kind, entity.id, "push " + collection + "/" + entity.id + ": " + e.what());
      continue;
    }

    if (store_->MarkSynced(ctx.owner_id, report.kind, entity.id, entity.sync.updated_at_ms)) {
      ++report.pushed;
    } else {
      ++report.superseded;
    }
  }

  ctx.Step("pushed " + collection);
  return true;
}

bool SyncEngine::Pull(RunContext& ctx, CollectionReport& report) {
  const std::string collection(ledgersync::model::CollectionName(report.kind));
  if (ctx.Stopped()) return false;

  const auto since = store_->CheckpointOf(ctx.owner_id, report.kind);

  ledgersync::v1::RemoteDocuments documents;
  try {
    documents = remote_->FetchSince(collection, ctx.owner_id, since);
  } catch (const util::RemoteUnavailable& e) {
    throw util::FatalSyncError("pull " + collection + ": " + e.what());
  } catch (const util::RemoteError& e) {
    ctx.Transient(report.kind, {}, "pull " + collection + ": " + e.what());
    return false;
  }

  // apply in remote write order; the checkpoint is a remote sequence, never a client clock
  std::sort(documents.begin(), documents.end(), [](const auto& a, const auto& b) { return a.server_seq() < b.server_seq(); });

  uint64_t high_water = since;
  for (const auto& document : documents) {
    if (ctx.Stopped()) return false;

    high_water = std::max(high_water, document.server_seq());

    Entity remote;
    try {
      remote = codec::FromRemoteDocument(report.kind, document);
    } catch (const util::InvalidValue& e) {
      ++report.skipped;
      ctx.Transient(report.kind, document.id(), "decode " + collection + "/" + document.id() + ": " + e.what());
      continue;
    }

    switch (store_->ApplyRemote(remote)) {
      case store::ApplyOutcome::kInserted:
        ++report.inserted;
        break;
      case store::ApplyOutcome::kOverwritten:
        ++report.overwritten;
        break;
      case store::ApplyOutcome::kSkippedOlder:
      case store::ApplyOutcome::kSkippedRemoteTombstone:
        ++report.skipped;
        break;
    }
  }

  store_->AdvanceCheckpoint(ctx.owner_id, report.kind, high_water);
  report.checkpoint_seq = high_water;

  ctx.Step("pulled " + collection);
  return true;
}

std::map<EntityKind, std::size_t> SyncEngine::PendingCounts(const std::string& owner_id) {
  std::map<EntityKind, std::size_t> counts;
  for (const auto kind : ledgersync::model::kDependencyOrder) {
    counts[kind] = store_->Count(PendingOf(kind, owner_id));
  }
  return counts;
}

} // namespace ledgersync::sync
