#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

#include "remote_store.hpp"

namespace ledgersync::remote {

/*
  Remote backed by a directory tree, one JSON document per file:

    <root>/<collection>/<id>.json

  Suitable for a mounted share or a second device's export. The root must
  exist; a missing root is reported as RemoteUnavailable. Writes go to a
  temporary file first and are renamed into place.

  The write sequence is kept in <root>/.sequence. Files that do not decode
  are logged and left out of fetches.
*/
class FileRemoteStore final : public RemoteStore {
 public:
  explicit FileRemoteStore(std::filesystem::path root);

  void                            Ping() override;
  void                            Upsert(const std::string& collection, const ledgersync::v1::RemoteDocument& document) override;
  void                            MarkDeleted(const std::string& collection, const ledgersync::v1::RemoteDocument& document) override;
  ledgersync::v1::RemoteDocuments FetchSince(const std::string& collection, const std::string& owner_id, uint64_t after_seq) override;

 private:
  std::filesystem::path DocumentPath(const std::string& collection, const std::string& id) const;
  void                  Write(const std::string& collection, ledgersync::v1::RemoteDocument document);
  uint64_t              NextSequence();
  void                  RequireRoot() const;

  std::filesystem::path root_;
  std::mutex            mutex_;
};

} // namespace ledgersync::remote
