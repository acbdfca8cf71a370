#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/change_bus.hpp"
#include "internal/model/entity.hpp"
#include "internal/store/entity_store.hpp"
#include "internal/util/date.hpp"
#include "internal/util/time.hpp"

namespace ledgersync::testing {

// UTC noon of a YYYY-MM-DD day.
inline uint64_t NoonMs(const char* date) {
  const auto day = std::chrono::sys_days{util::ParseDate(date)};
  return util::ToUnixMillis(day + std::chrono::hours{12});
}

inline constexpr uint64_t kDayMs = 24ull * 60 * 60 * 1000;

// Test clock shared by copies of its NowFn.
class ManualClock {
 public:
  explicit ManualClock(uint64_t start_ms) : ms_(std::make_shared<std::atomic<uint64_t>>(start_ms)) {
  }

  util::NowFn Fn() const {
    auto ms = ms_;
    return [ms] { return util::FromUnixMillis(ms->load()); };
  }

  void     Set(uint64_t ms) { ms_->store(ms); }
  void     Advance(uint64_t delta_ms) { ms_->fetch_add(delta_ms); }
  uint64_t Ms() const { return ms_->load(); }

 private:
  std::shared_ptr<std::atomic<uint64_t>> ms_;
};

struct StoreHarness {
  explicit StoreHarness(uint64_t start_ms = NoonMs("2024-03-15"))
      : clock(start_ms),
        repository(std::make_shared<db::memory::MemoryRepository>()),
        bus(std::make_shared<events::ChangeBus>()),
        store(std::make_shared<store::EntityStore>(repository, bus, clock.Fn())) {
  }

  ManualClock                                  clock;
  std::shared_ptr<db::memory::MemoryRepository> repository;
  std::shared_ptr<events::ChangeBus>           bus;
  std::shared_ptr<store::EntityStore>          store;
};

inline model::Entity MakeCategory(const std::string& owner, const std::string& name) {
  model::CategoryFields f;
  f.name  = name;
  f.icon  = "tag";
  f.color = "#336699";

  model::Entity e;
  e.owner_id = owner;
  e.kind     = model::EntityKind::kCategory;
  e.fields   = f;
  return e;
}

inline model::Entity MakeExpense(const std::string& owner, model::Money amount, const char* date,
                                 std::optional<std::string> category_id = std::nullopt, const std::string& title = "coffee") {
  model::ExpenseFields f;
  f.amount      = amount;
  f.date        = util::ParseDate(date);
  f.title       = title;
  f.category_id = std::move(category_id);

  model::Entity e;
  e.owner_id = owner;
  e.kind     = model::EntityKind::kExpense;
  e.fields   = f;
  return e;
}

inline model::Entity MakeIncome(const std::string& owner, model::Money amount, const char* date, const std::string& source = "salary") {
  model::IncomeFields f;
  f.amount = amount;
  f.date   = util::ParseDate(date);
  f.source = source;

  model::Entity e;
  e.owner_id = owner;
  e.kind     = model::EntityKind::kIncome;
  e.fields   = f;
  return e;
}

inline model::Entity MakeBudget(const std::string& owner, model::Money amount, const char* start, const char* end,
                                std::optional<std::string> category_id = std::nullopt, double threshold = 0.8) {
  model::BudgetFields f;
  f.amount          = amount;
  f.period          = "monthly";
  f.start_date      = util::ParseDate(start);
  f.end_date        = util::ParseDate(end);
  f.alert_threshold = threshold;
  f.category_id     = std::move(category_id);

  model::Entity e;
  e.owner_id = owner;
  e.kind     = model::EntityKind::kBudget;
  e.fields   = f;
  return e;
}

inline model::Entity MakeRule(const std::string& owner, model::EntityKind kind, model::Frequency frequency, const char* start, int anchor,
                              std::optional<const char*> end = std::nullopt, const std::string& title = "rent") {
  model::RecurringRuleFields f;
  f.title             = title;
  f.amount            = 120000;
  f.frequency         = frequency;
  f.start_date        = util::ParseDate(start);
  f.day_of_month_week = anchor;
  if (end.has_value()) f.end_date = util::ParseDate(*end);

  model::Entity e;
  e.owner_id = owner;
  e.kind     = kind;
  e.fields   = f;
  return e;
}

} // namespace ledgersync::testing
