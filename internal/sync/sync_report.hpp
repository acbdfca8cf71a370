#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/entity_kind.hpp"

namespace ledgersync::sync {

enum class SyncOutcome : std::uint8_t {
  kCompleted,
  kCompletedWithErrors, // transient per-item failures only
  kFailed,              // fatal error (remote unavailable)
  kCancelled,
  kAlreadyRunning,
};

constexpr std::string_view ToString(SyncOutcome outcome) {
  switch (outcome) {
    case SyncOutcome::kCompleted:
      return "completed";
    case SyncOutcome::kCompletedWithErrors:
      return "completed-with-errors";
    case SyncOutcome::kFailed:
      return "failed";
    case SyncOutcome::kCancelled:
      return "cancelled";
    case SyncOutcome::kAlreadyRunning:
      return "already-running";
  }
  return "unknown";
}

enum class ErrorSeverity : std::uint8_t {
  kTransient,
  kFatal,
};

struct SyncError {
  ErrorSeverity                                severity = ErrorSeverity::kTransient;
  std::optional<ledgersync::model::EntityKind> kind;
  std::string                                  entity_id; // empty for collection-level errors
  std::string                                  message;
};

struct CollectionReport {
  ledgersync::model::EntityKind kind;

  // push
  std::size_t pushed      = 0;
  std::size_t push_failed = 0;
  std::size_t superseded  = 0; // pushed, but edited locally meanwhile

  // pull
  std::size_t inserted    = 0;
  std::size_t overwritten = 0;
  std::size_t skipped     = 0;

  std::optional<uint64_t> checkpoint_seq;
  bool                    completed = false;
};

struct SyncReport {
  SyncOutcome                   outcome = SyncOutcome::kCompleted;
  uint64_t                      started_at_ms  = 0;
  uint64_t                      finished_at_ms = 0;
  std::vector<CollectionReport> collections;
  std::vector<SyncError>        errors;

  bool HasFatalError() const {
    for (const auto& e : errors) {
      if (e.severity == ErrorSeverity::kFatal) return true;
    }
    return false;
  }
};

} // namespace ledgersync::sync
