#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/model/entity.hpp"
#include "ledgersync/v1.hpp"

namespace ledgersync::codec {

/*
  Entity <-> wire conversions.

  Domain fields travel as a google.protobuf.Struct with camelCase keys;
  amounts are minor units, dates "YYYY-MM-DD". Sync metadata maps onto the
  RemoteDocument envelope. Decoding throws util::InvalidValue on missing or
  mistyped required fields.
*/

google::protobuf::Struct FieldsToStruct(const ledgersync::model::EntityFields& fields);
ledgersync::model::EntityFields FieldsFromStruct(ledgersync::model::EntityKind kind, const google::protobuf::Struct& data);

std::string                     FieldsToJson(const ledgersync::model::EntityFields& fields);
ledgersync::model::EntityFields FieldsFromJson(ledgersync::model::EntityKind kind, const std::string& json);

ledgersync::v1::RemoteDocument ToRemoteDocument(const ledgersync::model::Entity& entity);

// The result carries SyncStatus::kSynced: it mirrors the remote copy.
ledgersync::model::Entity FromRemoteDocument(ledgersync::model::EntityKind kind, const ledgersync::v1::RemoteDocument& document);

std::string                    DocumentToJson(const ledgersync::v1::RemoteDocument& document);
ledgersync::v1::RemoteDocument DocumentFromJson(const std::string& json);

} // namespace ledgersync::codec
