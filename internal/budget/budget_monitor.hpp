#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/events/change_bus.hpp"
#include "internal/model/entity.hpp"
#include "internal/store/entity_store.hpp"

namespace ledgersync::budget {

enum class AlertLevel : std::uint8_t {
  kThresholdReached, // spent >= amount * alert_threshold
  kExceeded,         // spent > amount
};

std::string_view ToString(AlertLevel level);

struct BudgetStatus {
  std::string                owner_id;
  std::string                budget_id;
  std::optional<std::string> category_id;
  util::Date                 start_date{};
  util::Date                 end_date{};
  ledgersync::model::Money   amount          = 0;
  ledgersync::model::Money   spent           = 0;
  double                     alert_threshold = 0.8;
  std::optional<AlertLevel>  alert;
};

/*
  Watches expense and budget changes and reports budgets running over.

  Evaluation covers active, non-deleted budgets whose period contains today.
  Alerts are logged and forwarded to the sink; one alert is raised per level
  change of a budget, not per event.
*/
class BudgetMonitor {
 public:
  using AlertSink = std::function<void(const BudgetStatus&)>;

  BudgetMonitor(std::shared_ptr<store::EntityStore> store, std::shared_ptr<events::ChangeBus> bus, int utc_offset_minutes = 0, AlertSink sink = {});
  ~BudgetMonitor();

  BudgetMonitor(const BudgetMonitor&)            = delete;
  BudgetMonitor& operator=(const BudgetMonitor&) = delete;

  void Attach();
  void Detach();

  std::vector<BudgetStatus> Evaluate(const std::string& owner_id);

 private:
  void OnChange(const events::ChangeEvent& event);

  std::shared_ptr<store::EntityStore> store_;
  std::shared_ptr<events::ChangeBus>  bus_;
  int                                 utc_offset_minutes_;
  AlertSink                           sink_;

  std::mutex                                             mutex_;
  std::optional<events::ChangeBus::SubscriptionId>       subscription_;
  std::map<std::string, std::optional<AlertLevel>>       last_level_; // budget id -> level last reported
};

} // namespace ledgersync::budget
