#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/entity_kind.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/daemon.hpp"
#include "internal/runtime/session.hpp"
#include "internal/util/date.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using ledgersync::factory::Application;
using ledgersync::model::CollectionName;
using ledgersync::model::EntityKind;
using ledgersync::model::KindName;
using ledgersync::model::ParseEntityKind;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  ledgersync [--config <config.yaml>] <owner-id> sync\n"
            << "  ledgersync [--config <config.yaml>] <owner-id> generate [--force]\n"
            << "  ledgersync [--config <config.yaml>] <owner-id> sweep\n"
            << "  ledgersync [--config <config.yaml>] <owner-id> tombstones [kind]\n"
            << "  ledgersync [--config <config.yaml>] <owner-id> restore <kind> <id>\n"
            << "  ledgersync [--config <config.yaml>] <owner-id> purge <kind> <id> [--detach]\n"
            << "  ledgersync [--config <config.yaml>] <owner-id> pending\n"
            << "  ledgersync [--config <config.yaml>] <owner-id> stats\n"
            << "  ledgersync [--config <config.yaml>] <owner-id> validate\n"
            << "  ledgersync [--config <config.yaml>] <owner-id> budgets\n"
            << "  ledgersync [--config <config.yaml>] <owner-id> daemon\n"
            << "kinds: categories budgets incomes recurringExpenses recurringIncomes expenses\n";
}

static std::string FormatMoney(ledgersync::model::Money cents) {
  const auto sign  = cents < 0 ? "-" : "";
  const auto whole = (cents < 0 ? -cents : cents) / 100;
  const auto frac  = (cents < 0 ? -cents : cents) % 100;
  return sign + std::to_string(whole) + "." + (frac < 10 ? "0" : "") + std::to_string(frac);
}

static int RunSync(Application& app, const std::string& owner) {
  const auto report = app.sync_engine->PerformFullSync(owner);

  for (const auto& c : report.collections) {
    std::cout << CollectionName(c.kind) << ": pushed=" << c.pushed << " failed=" << c.push_failed << " superseded=" << c.superseded
              << " inserted=" << c.inserted << " overwritten=" << c.overwritten << " skipped=" << c.skipped
              << (c.completed ? "" : " (incomplete)") << "\n";
  }
  for (const auto& e : report.errors) {
    std::cout << (e.severity == ledgersync::sync::ErrorSeverity::kFatal ? "fatal: " : "error: ") << e.message << "\n";
  }
  std::cout << "outcome=" << ToString(report.outcome) << "\n";
  std::cout << app.sync_state->Describe() << "\n";

  return report.outcome == ledgersync::sync::SyncOutcome::kCompleted ? 0 : 2;
}

static int RunGenerate(Application& app, const std::string& owner, bool force) {
  const auto report = app.generator->GenerateDueOccurrences(owner, force);
  for (const auto& r : report.rules) {
    std::cout << KindName(r.kind) << " " << r.rule_id << " '" << r.title << "': generated=" << r.generated << (r.capped ? " (capped)" : "");
    if (r.error.has_value()) std::cout << " error=" << *r.error;
    std::cout << "\n";
  }
  std::cout << "generated=" << report.TotalGenerated() << " failed_rules=" << report.FailedRules() << "\n";
  return report.FailedRules() == 0 ? 0 : 2;
}

static int RunSweep(Application& app, const std::string& owner) {
  const auto report = app.tombstones->Sweep(owner, app.retention);
  for (const auto& f : report.failures) {
    std::cout << "skipped " << KindName(f.kind) << " " << f.id << ": " << f.reason << "\n";
  }
  std::cout << "purged=" << report.purged << " skipped=" << report.failures.size() << "\n";
  return 0;
}

static int RunTombstones(Application& app, const std::string& owner, std::optional<EntityKind> kind) {
  for (const auto& e : app.tombstones->FetchTombstones(owner, kind)) {
    std::cout << KindName(e.kind) << " " << e.id << " '" << ledgersync::model::DisplayName(e) << "'"
              << " deleted_at=" << ledgersync::util::FormatMillis(e.sync.deleted_at_ms.value_or(0)) << " by=" << e.sync.deleted_by
              << " status=" << ledgersync::model::ToString(e.sync.status) << "\n";
  }
  return 0;
}

static int RunPurge(Application& app, const std::string& owner, EntityKind kind, const std::string& id, bool detach) {
  try {
    app.tombstones->HardDelete(owner, kind, id,
                               detach ? ledgersync::tombstone::DependencyPolicy::kDetachDependents : ledgersync::tombstone::DependencyPolicy::kRefuse);
  } catch (const ledgersync::util::DependencyExists& e) {
    std::cerr << e.what() << "\n";
    for (const auto& [collection, count] : e.dependents()) {
      std::cerr << "  " << collection << ": " << count << "\n";
    }
    std::cerr << "re-run with --detach to reassign them\n";
    return 2;
  }
  std::cout << "purged\n";
  return 0;
}

static int RunBudgets(Application& app, const std::string& owner) {
  for (const auto& s : app.budget_monitor->Evaluate(owner)) {
    std::cout << s.budget_id << " " << ledgersync::util::FormatDate(s.start_date) << ".." << ledgersync::util::FormatDate(s.end_date)
              << " spent=" << FormatMoney(s.spent) << "/" << FormatMoney(s.amount);
    if (s.alert.has_value()) std::cout << " " << ledgersync::budget::ToString(*s.alert);
    std::cout << "\n";
  }
  return 0;
}

static int RunDaemon(Application& app, const std::string& owner) {
  ledgersync::runtime::Daemon daemon(owner, app.sync_interval, app.generator, app.sync_engine, app.tombstones, app.retention);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  daemon.Start();
  while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

  LEDGERSYNC_LOG_INFO("Shutting down ledgersync daemon");
  daemon.Stop();
  return 0;
}

static int Dispatch(Application& app, const std::string& owner, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  if (cmd == "sync") return RunSync(app, owner);
  if (cmd == "generate") return RunGenerate(app, owner, args.size() > 1 && args[1] == "--force");
  if (cmd == "sweep") return RunSweep(app, owner);
  if (cmd == "daemon") return RunDaemon(app, owner);
  if (cmd == "budgets") return RunBudgets(app, owner);

  if (cmd == "tombstones") {
    std::optional<EntityKind> kind;
    if (args.size() > 1) kind = ParseEntityKind(args[1]);
    return RunTombstones(app, owner, kind);
  }

  if (cmd == "restore") {
    if (args.size() < 3) return 1;
    const auto restored = app.tombstones->Restore(owner, ParseEntityKind(args[1]), args[2]);
    std::cout << "restored " << KindName(restored.kind) << " " << restored.id << "\n";
    return 0;
  }

  if (cmd == "purge") {
    if (args.size() < 3) return 1;
    return RunPurge(app, owner, ParseEntityKind(args[1]), args[2], args.size() > 3 && args[3] == "--detach");
  }

  if (cmd == "pending") {
    for (const auto& [kind, count] : app.sync_engine->PendingCounts(owner)) {
      std::cout << CollectionName(kind) << "=" << count << "\n";
    }
    return 0;
  }

  if (cmd == "stats") {
    for (const auto& [kind, s] : app.tombstones->Stats(owner).by_kind) {
      std::cout << CollectionName(kind) << ": active=" << s.active << " deleted=" << s.deleted << " pending=" << s.pending_sync << "\n";
    }
    return 0;
  }

  if (cmd == "validate") {
    const auto issues = app.tombstones->ValidateIntegrity(owner);
    for (const auto& issue : issues) {
      std::cout << KindName(issue.kind) << " " << issue.id << ": " << issue.problem << "\n";
    }
    std::cout << "issues=" << issues.size() << "\n";
    return issues.empty() ? 0 : 2;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.size() < 2) {
    Usage();
    return 1;
  }

  const std::string owner = args[0];
  args.erase(args.begin());

  int rc = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? ledgersync::config::ConfigLoader::Defaults() : ledgersync::config::ConfigLoader::LoadFromYaml(config_path);

    ledgersync::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = ledgersync::factory::Build(config);

    {
      ledgersync::runtime::Session session(app.bus, app.sync_state, app.budget_monitor);
      rc = Dispatch(app, owner, args);
    }

    ledgersync::observability::ShutdownLogging();
  } catch (const ledgersync::util::ValidationError& e) {
    std::cerr << e.what() << "\n";
    ledgersync::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    LEDGERSYNC_LOG_ERROR("Fatal error", {ledgersync::observability::StringField("error", e.what())});
    ledgersync::observability::ShutdownLogging();
    return 2;
  }

  return rc;
}
