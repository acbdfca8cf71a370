#include <cassert>
#include <iostream>
#include <string>

#include "internal/codec/entity_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using google::protobuf::Value;
using ledgersync::model::Entity;
using ledgersync::model::EntityKind;
using ledgersync::model::ExpenseFields;
using ledgersync::model::SyncStatus;
using ledgersync::testing::MakeExpense;
using ledgersync::testing::MakeIncome;

void TestExpenseFieldsUseCamelCaseKeys() {
  auto expense = MakeExpense("owner-1", 1250, "2024-03-02", std::string("cat-1"));
  expense.As<ExpenseFields>().recurring_rule_id = "rule-1";
  expense.As<ExpenseFields>().is_recurring      = true;

  const auto s = ledgersync::codec::FieldsToStruct(expense.fields);
  assert(s.fields().at("categoryId").string_value() == "cat-1");
  assert(s.fields().at("recurringExpenseId").string_value() == "rule-1");
  assert(s.fields().at("isRecurring").bool_value());
  assert(s.fields().at("date").string_value() == "2024-03-02");
  assert(s.fields().at("amount").number_value() == 1250);

  const auto decoded = std::get<ExpenseFields>(ledgersync::codec::FieldsFromStruct(EntityKind::kExpense, s));
  assert(decoded.category_id == std::optional<std::string>("cat-1"));
  assert(decoded.recurring_rule_id == std::optional<std::string>("rule-1"));
  assert(decoded.amount == 1250);
}

void TestUncategorizedIsNull() {
  const auto expense = MakeExpense("owner-1", 100, "2024-03-02");
  const auto s       = ledgersync::codec::FieldsToStruct(expense.fields);
  assert(s.fields().at("categoryId").kind_case() == Value::kNullValue);

  const auto decoded = std::get<ExpenseFields>(ledgersync::codec::FieldsFromStruct(EntityKind::kExpense, s));
  assert(!decoded.category_id.has_value());
}

void TestIncomeRuleReferenceKey() {
  auto income = MakeIncome("owner-1", 500000, "2024-03-01");
  income.As<ledgersync::model::IncomeFields>().recurring_rule_id = "rule-9";

  const auto s = ledgersync::codec::FieldsToStruct(income.fields);
  assert(s.fields().at("recurringIncomeId").string_value() == "rule-9");
  assert(s.fields().count("recurringExpenseId") == 0);
}

void TestMissingRequiredDateIsRejected() {
  google::protobuf::Struct s;
  (*s.mutable_fields())["amount"].set_number_value(10);
  (*s.mutable_fields())["title"].set_string_value("no date");

  bool threw = false;
  try {
    (void)ledgersync::codec::FieldsFromStruct(EntityKind::kExpense, s);
  } catch (const ledgersync::util::InvalidValue&) {
    threw = true;
  }
  assert(threw);
}

void TestRemoteTombstoneDecodesAsSyncedTombstone() {
  auto entity               = MakeExpense("owner-1", 100, "2024-03-02");
  entity.id                 = "exp-1";
  entity.sync.created_at_ms = 1000;
  entity.sync.updated_at_ms = 5000;

  auto document = ledgersync::codec::ToRemoteDocument(entity);
  document.set_deleted(true);
  document.clear_deleted_at();
  document.set_deleted_by("device-b");

  const auto decoded = ledgersync::codec::FromRemoteDocument(EntityKind::kExpense, document);
  assert(decoded.sync.status == SyncStatus::kSynced);
  assert(decoded.sync.soft_deleted);
  assert(decoded.sync.deleted_at_ms == std::optional<uint64_t>(5000));
  assert(decoded.sync.deleted_by == "device-b");
  assert(decoded.sync.created_at_ms == 1000);
}

void TestCreatedAtIsClampedToUpdatedAt() {
  auto entity               = MakeExpense("owner-1", 100, "2024-03-02");
  entity.id                 = "exp-2";
  entity.sync.updated_at_ms = 2000;

  auto document                  = ledgersync::codec::ToRemoteDocument(entity);
  *document.mutable_created_at() = ledgersync::util::MillisToProto(9000);

  const auto decoded = ledgersync::codec::FromRemoteDocument(EntityKind::kExpense, document);
  assert(decoded.sync.created_at_ms == 2000);
}

void TestDocumentJsonUsesProtoFieldNames() {
  auto entity = MakeExpense("owner-1", 100, "2024-03-02");
  entity.id   = "exp-3";

  const auto json = ledgersync::codec::DocumentToJson(ledgersync::codec::ToRemoteDocument(entity));
  assert(json.find("\"ownerId\"") != std::string::npos);
  assert(ledgersync::codec::DocumentFromJson(json).owner_id() == "owner-1");

  bool threw = false;
  try {
    (void)ledgersync::codec::DocumentFromJson("{not json");
  } catch (const ledgersync::util::InvalidValue&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestExpenseFieldsUseCamelCaseKeys();
  TestUncategorizedIsNull();
  TestIncomeRuleReferenceKey();
  TestMissingRequiredDateIsRejected();
  TestRemoteTombstoneDecodesAsSyncedTombstone();
  TestCreatedAtIsClampedToUpdatedAt();
  TestDocumentJsonUsesProtoFieldNames();

  std::cout << "ledgersync_unit_entity_codec: pass\n";
  return 0;
}
