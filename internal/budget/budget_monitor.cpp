#include "budget_monitor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace ledgersync::budget {

using ledgersync::model::BudgetFields;
using ledgersync::model::Entity;
using ledgersync::model::EntityKind;
using ledgersync::model::ExpenseFields;
using observability::IntField;
using observability::StringField;

std::string_view ToString(AlertLevel level) {
  switch (level) {
    case AlertLevel::kThresholdReached:
      return "threshold-reached";
    case AlertLevel::kExceeded:
      return "exceeded";
  }
  return "unknown";
}

BudgetMonitor::BudgetMonitor(std::shared_ptr<store::EntityStore> store, std::shared_ptr<events::ChangeBus> bus, int utc_offset_minutes, AlertSink sink)
    : store_(std::move(store)), bus_(std::move(bus)), utc_offset_minutes_(utc_offset_minutes), sink_(std::move(sink)) {
}

BudgetMonitor::~BudgetMonitor() {
  Detach();
}

void BudgetMonitor::Attach() {
  std::lock_guard lock(mutex_);
  if (subscription_.has_value()) return;
  subscription_ = bus_->Subscribe([this](const events::ChangeEvent& event) { OnChange(event); });
}

void BudgetMonitor::Detach() {
  std::optional<events::ChangeBus::SubscriptionId> id;
  {
    std::lock_guard lock(mutex_);
    id.swap(subscription_);
  }
  if (id.has_value()) {
    bus_->Unsubscribe(*id);
  }
}

std::vector<BudgetStatus> BudgetMonitor::Evaluate(const std::string& owner_id) {
  const auto today = util::Today(util::FromUnixMillis(store_->NowMs()), utc_offset_minutes_);

  std::vector<BudgetStatus> out;

  const auto budgets = store_->FetchByOwner(
      owner_id, EntityKind::kBudget,
      [&](const Entity& e) {
        const auto& b = e.As<BudgetFields>();
        return b.is_active && b.start_date <= today && today <= b.end_date;
      },
      db::SortKey::kCreatedAt);
  if (budgets.empty()) return out;

  const auto expenses = store_->FetchByOwner(owner_id, EntityKind::kExpense);

  for (const auto& budget : budgets) {
    const auto& b = budget.As<BudgetFields>();

    BudgetStatus status;
    status.owner_id        = owner_id;
    status.budget_id       = budget.id;
    status.category_id     = b.category_id;
    status.start_date      = b.start_date;
    status.end_date        = b.end_date;
    status.amount          = b.amount;
    status.alert_threshold = b.alert_threshold;

    for (const auto& expense : expenses) {
      const auto& x = expense.As<ExpenseFields>();
      if (x.date < b.start_date || b.end_date < x.date) continue;
      if (b.category_id.has_value() && x.category_id != b.category_id) continue;
      status.spent += x.amount;
    }

    if (status.spent > status.amount) {
      status.alert = AlertLevel::kExceeded;
    } else if (status.amount > 0 && static_cast<double>(status.spent) >= static_cast<double>(status.amount) * status.alert_threshold) {
      status.alert = AlertLevel::kThresholdReached;
    }
    out.push_back(std::move(status));
  }
  return out;
}

void BudgetMonitor::OnChange(const events::ChangeEvent& event) {
  if (event.kind != EntityKind::kExpense && event.kind != EntityKind::kBudget) return;
  if (event.type == events::ChangeType::kSynced) return;

  for (const auto& status : Evaluate(event.owner_id)) {
    {
      std::lock_guard lock(mutex_);
      auto&           last = last_level_[status.budget_id];
      if (last == status.alert) continue;
      last = status.alert;
    }
    if (!status.alert.has_value()) continue;

    LEDGERSYNC_LOG_WARN("budget alert", {StringField("budget", status.budget_id), StringField("level", ToString(*status.alert)),
                                         IntField("spent", status.spent), IntField("amount", status.amount)});
    if (sink_) sink_(status);
  }
}

} // namespace ledgersync::budget
