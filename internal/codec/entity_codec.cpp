#include "entity_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <type_traits>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledgersync::codec {

using google::protobuf::Struct;
using google::protobuf::Value;
using namespace ledgersync::model;

namespace {

// ------------------------------------------------------------
// Struct writers
// ------------------------------------------------------------

void PutString(Struct& s, const char* key, const std::string& value) {
  (*s.mutable_fields())[key].set_string_value(value);
}

void PutNumber(Struct& s, const char* key, double value) {
  (*s.mutable_fields())[key].set_number_value(value);
}

void PutBool(Struct& s, const char* key, bool value) {
  (*s.mutable_fields())[key].set_bool_value(value);
}

void PutDate(Struct& s, const char* key, const util::Date& value) {
  PutString(s, key, util::FormatDate(value));
}

void PutOptionalString(Struct& s, const char* key, const std::optional<std::string>& value) {
  if (value.has_value()) {
    PutString(s, key, *value);
  } else {
    (*s.mutable_fields())[key].set_null_value(google::protobuf::NULL_VALUE);
  }
}

// ------------------------------------------------------------
// Struct readers. Missing keys fall back to the default unless required.
// ------------------------------------------------------------

const Value* Find(const Struct& s, const char* key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end() || it->second.kind_case() == Value::kNullValue) {
    return nullptr;
  }
  return &it->second;
}

[[noreturn]] void WrongType(const char* key, const char* expected) {
  throw util::InvalidValue(std::string("field '") + key + "' must be a " + expected);
}

std::string GetString(const Struct& s, const char* key, const std::string& fallback = {}) {
  const Value* v = Find(s, key);
  if (!v) return fallback;
  if (v->kind_case() != Value::kStringValue) WrongType(key, "string");
  return v->string_value();
}

std::optional<std::string> GetOptionalString(const Struct& s, const char* key) {
  const Value* v = Find(s, key);
  if (!v) return std::nullopt;
  if (v->kind_case() != Value::kStringValue) WrongType(key, "string");
  if (v->string_value().empty()) return std::nullopt;
  return v->string_value();
}

double GetNumber(const Struct& s, const char* key, double fallback = 0) {
  const Value* v = Find(s, key);
  if (!v) return fallback;
  if (v->kind_case() != Value::kNumberValue) WrongType(key, "number");
  return v->number_value();
}

Money GetMoney(const Struct& s, const char* key) {
  return static_cast<Money>(std::llround(GetNumber(s, key)));
}

bool GetBool(const Struct& s, const char* key, bool fallback = false) {
  const Value* v = Find(s, key);
  if (!v) return fallback;
  if (v->kind_case() != Value::kBoolValue) WrongType(key, "bool");
  return v->bool_value();
}

util::Date GetRequiredDate(const Struct& s, const char* key) {
  const Value* v = Find(s, key);
  if (!v) throw util::InvalidValue(std::string("missing required field '") + key + "'");
  if (v->kind_case() != Value::kStringValue) WrongType(key, "date string");
  return util::ParseDate(v->string_value());
}

std::optional<util::Date> GetOptionalDate(const Struct& s, const char* key) {
  const Value* v = Find(s, key);
  if (!v) return std::nullopt;
  if (v->kind_case() != Value::kStringValue) WrongType(key, "date string");
  return util::ParseDate(v->string_value());
}

// ------------------------------------------------------------
// Per field set
// ------------------------------------------------------------

void Encode(Struct& s, const CategoryFields& f) {
  PutString(s, "name", f.name);
  PutString(s, "icon", f.icon);
  PutString(s, "color", f.color);
  PutBool(s, "isDefault", f.is_default);
  PutNumber(s, "order", f.order);
}

void Encode(Struct& s, const BudgetFields& f) {
  PutNumber(s, "amount", static_cast<double>(f.amount));
  PutString(s, "period", f.period);
  PutDate(s, "startDate", f.start_date);
  PutDate(s, "endDate", f.end_date);
  PutNumber(s, "alertThreshold", f.alert_threshold);
  PutBool(s, "isActive", f.is_active);
  PutOptionalString(s, "categoryId", f.category_id);
}

void Encode(Struct& s, const IncomeFields& f) {
  PutNumber(s, "amount", static_cast<double>(f.amount));
  PutDate(s, "date", f.date);
  PutString(s, "source", f.source);
  PutString(s, "notes", f.notes);
  if (f.frequency.has_value()) {
    PutString(s, "frequency", std::string(ToString(*f.frequency)));
  }
  PutBool(s, "isRecurring", f.is_recurring);
  PutOptionalString(s, "recurringIncomeId", f.recurring_rule_id);
  PutString(s, "color", f.color);
  PutString(s, "icon", f.icon);
  PutNumber(s, "order", f.order);
}

void Encode(Struct& s, const ExpenseFields& f) {
  PutNumber(s, "amount", static_cast<double>(f.amount));
  PutDate(s, "date", f.date);
  PutString(s, "title", f.title);
  PutString(s, "notes", f.notes);
  PutOptionalString(s, "categoryId", f.category_id);
  PutBool(s, "isRecurring", f.is_recurring);
  PutOptionalString(s, "recurringExpenseId", f.recurring_rule_id);
  PutString(s, "color", f.color);
  PutString(s, "icon", f.icon);
}

void Encode(Struct& s, const RecurringRuleFields& f) {
  PutString(s, "title", f.title);
  PutNumber(s, "amount", static_cast<double>(f.amount));
  PutString(s, "notes", f.notes);
  PutOptionalString(s, "categoryId", f.category_id);
  PutString(s, "color", f.color);
  PutString(s, "icon", f.icon);
  PutString(s, "frequency", std::string(ToString(f.frequency)));
  PutDate(s, "startDate", f.start_date);
  if (f.end_date.has_value()) {
    PutDate(s, "endDate", *f.end_date);
  }
  PutNumber(s, "dayOfMonthWeek", f.day_of_month_week);
  PutBool(s, "isActive", f.is_active);
}

CategoryFields DecodeCategory(const Struct& s) {
  CategoryFields f;
  f.name       = GetString(s, "name");
  f.icon       = GetString(s, "icon");
  f.color      = GetString(s, "color");
  f.is_default = GetBool(s, "isDefault");
  f.order      = static_cast<std::int32_t>(GetNumber(s, "order"));
  return f;
}

BudgetFields DecodeBudget(const Struct& s) {
  BudgetFields f;
  f.amount          = GetMoney(s, "amount");
  f.period          = GetString(s, "period");
  f.start_date      = GetRequiredDate(s, "startDate");
  f.end_date        = GetRequiredDate(s, "endDate");
  f.alert_threshold = GetNumber(s, "alertThreshold", 0.8);
  f.is_active       = GetBool(s, "isActive", true);
  f.category_id     = GetOptionalString(s, "categoryId");
  return f;
}

IncomeFields DecodeIncome(const Struct& s) {
  IncomeFields f;
  f.amount = GetMoney(s, "amount");
  f.date   = GetRequiredDate(s, "date");
  f.source = GetString(s, "source");
  f.notes  = GetString(s, "notes");
  if (auto frequency = GetOptionalString(s, "frequency")) {
    f.frequency = ParseFrequency(*frequency);
  }
  f.is_recurring      = GetBool(s, "isRecurring");
  f.recurring_rule_id = GetOptionalString(s, "recurringIncomeId");
  f.color             = GetString(s, "color");
  f.icon              = GetString(s, "icon");
  f.order             = static_cast<std::int32_t>(GetNumber(s, "order"));
  return f;
}

ExpenseFields DecodeExpense(const Struct& s) {
  ExpenseFields f;
  f.amount            = GetMoney(s, "amount");
  f.date              = GetRequiredDate(s, "date");
  f.title             = GetString(s, "title");
  f.notes             = GetString(s, "notes");
  f.category_id       = GetOptionalString(s, "categoryId");
  f.is_recurring      = GetBool(s, "isRecurring");
  f.recurring_rule_id = GetOptionalString(s, "recurringExpenseId");
  f.color             = GetString(s, "color");
  f.icon              = GetString(s, "icon");
  return f;
}

RecurringRuleFields DecodeRule(const Struct& s) {
  RecurringRuleFields f;
  f.title             = GetString(s, "title");
  f.amount            = GetMoney(s, "amount");
  f.notes             = GetString(s, "notes");
  f.category_id       = GetOptionalString(s, "categoryId");
  f.color             = GetString(s, "color");
  f.icon              = GetString(s, "icon");
  f.frequency         = ParseFrequency(GetString(s, "frequency", "monthly"));
  f.start_date        = GetRequiredDate(s, "startDate");
  f.end_date          = GetOptionalDate(s, "endDate");
  f.day_of_month_week = static_cast<std::int32_t>(GetNumber(s, "dayOfMonthWeek", 1));
  f.is_active         = GetBool(s, "isActive", true);
  return f;
}

} // namespace

Struct FieldsToStruct(const EntityFields& fields) {
  Struct s;
  std::visit([&](const auto& f) { Encode(s, f); }, fields);
  return s;
}

EntityFields FieldsFromStruct(EntityKind kind, const Struct& data) {
  switch (kind) {
    case EntityKind::kCategory:
      return DecodeCategory(data);
    case EntityKind::kBudget:
      return DecodeBudget(data);
    case EntityKind::kIncome:
      return DecodeIncome(data);
    case EntityKind::kExpense:
      return DecodeExpense(data);
    case EntityKind::kRecurringExpense:
    case EntityKind::kRecurringIncome:
      return DecodeRule(data);
  }
  throw util::InvalidValue("unknown entity kind");
}

std::string FieldsToJson(const EntityFields& fields) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(FieldsToStruct(fields), &json);
  if (!status.ok()) {
    throw util::InvalidValue("failed to serialize entity fields: " + std::string(status.message()));
  }
  return json;
}

EntityFields FieldsFromJson(EntityKind kind, const std::string& json) {
  Struct data;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &data);
  if (!status.ok()) {
    throw util::InvalidValue("malformed entity body: " + std::string(status.message()));
  }
  return FieldsFromStruct(kind, data);
}

ledgersync::v1::RemoteDocument ToRemoteDocument(const Entity& entity) {
  ledgersync::v1::RemoteDocument doc;
  doc.set_id(entity.id);
  doc.set_owner_id(entity.owner_id);
  *doc.mutable_fields()     = FieldsToStruct(entity.fields);
  *doc.mutable_created_at() = util::MillisToProto(entity.sync.created_at_ms);
  *doc.mutable_updated_at() = util::MillisToProto(entity.sync.updated_at_ms);
  doc.set_deleted(entity.sync.soft_deleted);
  if (entity.sync.soft_deleted) {
    *doc.mutable_deleted_at() = util::MillisToProto(entity.sync.deleted_at_ms.value_or(entity.sync.updated_at_ms));
    doc.set_deleted_by(entity.sync.deleted_by);
  }
  return doc;
}

Entity FromRemoteDocument(EntityKind kind, const ledgersync::v1::RemoteDocument& doc) {
  if (doc.id().empty()) {
    throw util::InvalidValue("remote document without id");
  }

  Entity entity;
  entity.id       = doc.id();
  entity.owner_id = doc.owner_id();
  entity.kind     = kind;
  entity.fields   = FieldsFromStruct(kind, doc.fields());

  entity.sync.status        = SyncStatus::kSynced;
  entity.sync.updated_at_ms = util::ProtoToMillis(doc.updated_at());
  entity.sync.created_at_ms = doc.has_created_at() ? util::ProtoToMillis(doc.created_at()) : entity.sync.updated_at_ms;
  if (entity.sync.created_at_ms > entity.sync.updated_at_ms) {
    entity.sync.created_at_ms = entity.sync.updated_at_ms;
  }

  entity.sync.soft_deleted = doc.deleted();
  if (doc.deleted()) {
    entity.sync.deleted_at_ms = doc.has_deleted_at() ? util::ProtoToMillis(doc.deleted_at()) : entity.sync.updated_at_ms;
    entity.sync.deleted_by    = doc.deleted_by();
  }
  return entity;
}

std::string DocumentToJson(const ledgersync::v1::RemoteDocument& document) {
  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(document, &json, options);
  if (!status.ok()) {
    throw util::InvalidValue("failed to serialize remote document: " + std::string(status.message()));
  }
  return json;
}

ledgersync::v1::RemoteDocument DocumentFromJson(const std::string& json) {
  ledgersync::v1::RemoteDocument document;
  auto                           status = google::protobuf::util::JsonStringToMessage(json, &document);
  if (!status.ok()) {
    throw util::InvalidValue("malformed remote document: " + std::string(status.message()));
  }
  return document;
}

} // namespace ledgersync::codec
