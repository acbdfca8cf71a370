#include "memory_remote_store.hpp"

#include "internal/util/errors.hpp"

namespace ledgersync::remote {

void MemoryRemoteStore::CheckAvailable() const {
  if (!available_) {
    throw util::RemoteUnavailable("memory remote: offline");
  }
}

void MemoryRemoteStore::BeforeWrite(const ledgersync::v1::RemoteDocument& document) {
  CheckAvailable();

  if (writes_left_.has_value()) {
    if (*writes_left_ == 0) {
      available_ = false;
      throw util::RemoteUnavailable("memory remote: connection dropped");
    }
    --*writes_left_;
  }

  if (failing_ids_.count(document.id())) {
    throw util::RemoteError("memory remote: write rejected for " + document.id());
  }
}

void MemoryRemoteStore::Ping() {
  std::lock_guard lock(mutex_);
  CheckAvailable();
}

void MemoryRemoteStore::Upsert(const std::string& collection, const ledgersync::v1::RemoteDocument& document) {
  std::lock_guard lock(mutex_);
  BeforeWrite(document);
  auto& stored = collections_[collection][document.id()];
  stored       = document;
  stored.set_server_seq(++last_seq_);
  ++write_count_;
}

void MemoryRemoteStore::MarkDeleted(const std::string& collection, const ledgersync::v1::RemoteDocument& document) {
  std::lock_guard lock(mutex_);
  BeforeWrite(document);

  auto& stored = collections_[collection][document.id()];
  if (stored.id().empty()) {
    stored = document;
  } else {
    // keep the last pushed field values, stamp the tombstone
    *stored.mutable_deleted_at() = document.deleted_at();
    stored.set_deleted_by(document.deleted_by());
    *stored.mutable_updated_at() = document.updated_at();
  }
  stored.set_deleted(true);
  stored.set_server_seq(++last_seq_);
  ++write_count_;
}

ledgersync::v1::RemoteDocuments MemoryRemoteStore::FetchSince(const std::string& collection, const std::string& owner_id, uint64_t after_seq) {
  std::lock_guard lock(mutex_);
  CheckAvailable();
  ++fetch_count_;

  ledgersync::v1::RemoteDocuments out;
  auto                            it = collections_.find(collection);
  if (it == collections_.end()) return out;

  for (const auto& [_, document] : it->second) {
    if (document.owner_id() == owner_id && document.server_seq() > after_seq) {
      out.push_back(document);
    }
  }
  return out;
}

void MemoryRemoteStore::Put(const std::string& collection, const ledgersync::v1::RemoteDocument& document) {
  std::lock_guard lock(mutex_);
  auto&           stored = collections_[collection][document.id()];
  stored                 = document;
  stored.set_server_seq(++last_seq_);
}

std::optional<ledgersync::v1::RemoteDocument> MemoryRemoteStore::Get(const std::string& collection, const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            it = collections_.find(collection);
  if (it == collections_.end()) return std::nullopt;
  auto doc = it->second.find(id);
  if (doc == it->second.end()) return std::nullopt;
  return doc->second;
}

std::size_t MemoryRemoteStore::Size(const std::string& collection) const {
  std::lock_guard lock(mutex_);
  auto            it = collections_.find(collection);
  return it == collections_.end() ? 0 : it->second.size();
}

void MemoryRemoteStore::SetAvailable(bool available) {
  std::lock_guard lock(mutex_);
  available_ = available;
  if (available) writes_left_.reset();
}

void MemoryRemoteStore::FailWritesFor(const std::string& id) {
  std::lock_guard lock(mutex_);
  failing_ids_.insert(id);
}

void MemoryRemoteStore::FailAfterWrites(std::size_t writes) {
  std::lock_guard lock(mutex_);
  writes_left_ = writes;
}

std::size_t MemoryRemoteStore::WriteCount() const {
  std::lock_guard lock(mutex_);
  return write_count_;
}

std::size_t MemoryRemoteStore::FetchCount() const {
  std::lock_guard lock(mutex_);
  return fetch_count_;
}

} // namespace ledgersync::remote
