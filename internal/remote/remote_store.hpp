#pragma once

#include <cstdint>
#include <string>

#include "ledgersync/v1.hpp"

namespace ledgersync::remote {

/*
  Remote document store, one collection per entity kind.

  Documents are keyed by id within a collection. Every accepted write stamps
  the stored document with a fresh server_seq, larger than any sequence the
  store handed out before; client timestamps play no part in paging.

  Implementations throw
  util::RemoteUnavailable when the store cannot be reached at all and
  util::RemoteError when a single request fails.
*/
class RemoteStore {
 public:
  virtual ~RemoteStore() = default;

  // Connectivity check.
  virtual void Ping() = 0;

  // Create or replace (merge) the document with the same id.
  virtual void Upsert(const std::string& collection, const ledgersync::v1::RemoteDocument& document) = 0;

  // Record the tombstone. The remote copy is kept with deleted=true.
  virtual void MarkDeleted(const std::string& collection, const ledgersync::v1::RemoteDocument& document) = 0;

  // Documents of one owner written after sequence after_seq (server_seq >
  // after_seq), tombstones included.
  virtual ledgersync::v1::RemoteDocuments FetchSince(const std::string& collection, const std::string& owner_id, uint64_t after_seq) = 0;
};

} // namespace ledgersync::remote
