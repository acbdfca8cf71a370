#include "file_remote_store.hpp"

#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include "internal/codec/entity_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledgersync::remote {

namespace fs = std::filesystem;

namespace {

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::RemoteError("cannot open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void WriteAtomically(const fs::path& target, const std::string& content) {
  const auto tmp = fs::path(target).concat(".tmp");
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::RemoteError("cannot write " + tmp.string());
    }
    out << content;
    out.flush();
    if (!out) {
      throw util::RemoteError("short write to " + tmp.string());
    }
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw util::RemoteError("cannot publish " + target.string());
  }
}

void ValidateName(const std::string& name) {
  if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
    throw util::InvalidValue("invalid remote document name: '" + name + "'");
  }
}

} // namespace

FileRemoteStore::FileRemoteStore(fs::path root) : root_(std::move(root)) {
}

void FileRemoteStore::RequireRoot() const {
  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    throw util::RemoteUnavailable("remote directory unavailable: " + root_.string());
  }
}

fs::path FileRemoteStore::DocumentPath(const std::string& collection, const std::string& id) const {
  ValidateName(collection);
  ValidateName(id);
  return root_ / collection / (id + ".json");
}

void FileRemoteStore::Ping() {
  RequireRoot();
}

uint64_t FileRemoteStore::NextSequence() {
  const auto path = root_ / ".sequence";

  uint64_t        last = 0;
  std::error_code ec;
  if (fs::exists(path, ec)) {
    const auto text = ReadFile(path);
    try {
      last = std::stoull(text);
    } catch (const std::exception&) {
      throw util::RemoteError("corrupt sequence file " + path.string());
    }
  }

  WriteAtomically(path, std::to_string(last + 1));
  return last + 1;
}

void FileRemoteStore::Write(const std::string& collection, ledgersync::v1::RemoteDocument document) {
  std::lock_guard lock(mutex_);
  RequireRoot();

  const auto target = DocumentPath(collection, document.id());

  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    throw util::RemoteError("cannot create " + target.parent_path().string() + ": " + ec.message());
  }

  document.set_server_seq(NextSequence());
  WriteAtomically(target, codec::DocumentToJson(document));
}

void FileRemoteStore::Upsert(const std::string& collection, const ledgersync::v1::RemoteDocument& document) {
  Write(collection, document);
}

void FileRemoteStore::MarkDeleted(const std::string& collection, const ledgersync::v1::RemoteDocument& document) {
  if (!document.deleted()) {
    throw util::InvalidValue("MarkDeleted: document " + document.id() + " is not a tombstone");
  }
  Write(collection, document);
}

ledgersync::v1::RemoteDocuments FileRemoteStore::FetchSince(const std::string& collection, const std::string& owner_id, uint64_t after_seq) {
  std::lock_guard lock(mutex_);
  RequireRoot();
  ValidateName(collection);

  ledgersync::v1::RemoteDocuments out;
  const auto                      dir = root_ / collection;

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return out;
  }

  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json") {
      continue;
    }

    ledgersync::v1::RemoteDocument document;
    try {
      document = codec::DocumentFromJson(ReadFile(entry.path()));
    } catch (const util::InvalidValue& e) {
      LEDGERSYNC_LOG_WARN("skipping corrupt remote document", {observability::StringField("path", entry.path().string()),
                                                              observability::StringField("error", e.what())});
      continue;
    }

    if (document.owner_id() == owner_id && document.server_seq() > after_seq) {
      out.push_back(std::move(document));
    }
  }
  if (ec) {
    throw util::RemoteError("cannot list " + dir.string() + ": " + ec.message());
  }

  LEDGERSYNC_LOG_DEBUG("remote fetch", {observability::StringField("collection", collection),
                                        observability::IntField("documents", static_cast<int64_t>(out.size()))});
  return out;
}

} // namespace ledgersync::remote
