#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "remote_store.hpp"

namespace ledgersync::remote {

/*
  In-process remote. Used by tests and by the "memory" remote config.

  Failure injection:
    SetAvailable(false)   every call throws RemoteUnavailable
    FailWritesFor(id)     writes of that document throw RemoteError
    FailAfterWrites(n)    after n more successful writes, RemoteUnavailable
*/
class MemoryRemoteStore final : public RemoteStore {
 public:
  void                            Ping() override;
  void                            Upsert(const std::string& collection, const ledgersync::v1::RemoteDocument& document) override;
  void                            MarkDeleted(const std::string& collection, const ledgersync::v1::RemoteDocument& document) override;
  ledgersync::v1::RemoteDocuments FetchSince(const std::string& collection, const std::string& owner_id, uint64_t after_seq) override;

  // Seed or overwrite a document without counting it as a write. The document
  // still gets the next server_seq.
  void Put(const std::string& collection, const ledgersync::v1::RemoteDocument& document);

  std::optional<ledgersync::v1::RemoteDocument> Get(const std::string& collection, const std::string& id) const;
  std::size_t                                   Size(const std::string& collection) const;

  void SetAvailable(bool available);
  void FailWritesFor(const std::string& id);
  void FailAfterWrites(std::size_t writes);

  std::size_t WriteCount() const;
  std::size_t FetchCount() const;

 private:
  void CheckAvailable() const;
  void BeforeWrite(const ledgersync::v1::RemoteDocument& document);

  mutable std::mutex                                                         mutex_;
  std::map<std::string, std::map<std::string, ledgersync::v1::RemoteDocument>> collections_;

  bool                       available_ = true;
  std::set<std::string>      failing_ids_;
  std::optional<std::size_t> writes_left_;
  uint64_t                   last_seq_    = 0;
  std::size_t                write_count_ = 0;
  std::size_t                fetch_count_ = 0;
};

} // namespace ledgersync::remote
