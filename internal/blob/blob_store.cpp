#include "blob_store.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace gigbook::blob {

namespace {

void ThrowIfFailed(const db::Result& result, const std::string& what) {
  if (!result) {
    throw util::StorageUnavailable(what + ": " + std::string(db::ToString(result.code)) + " " + result.message);
  }
}

} // namespace

BlobStore::BlobStore(std::shared_ptr<db::Repository> repository, storage::StorageBackendPtr bytes, bool fsync)
    : repository_(std::move(repository)), bytes_(std::move(bytes)), fsync_(fsync) {
  if (!repository_) throw std::invalid_argument("BlobStore requires a repository");
  if (!bytes_) throw std::invalid_argument("BlobStore requires a storage backend");
}

std::string BlobStore::GenerateKey(std::string_view kind) {
  return std::string(kind) + "_" + util::NewId() + "_" + std::to_string(util::ToUnixMillis(util::Now()));
}

std::string BlobStore::StoreBlob(std::string key, std::string data, const std::string& mime_type) {
  if (key.empty()) key = GenerateKey("blob");

  db::model::BlobRecord record;
  record.key           = key;
  record.mime_type     = mime_type;
  record.size_bytes    = data.size();
  record.created_at_ms = static_cast<int64_t>(util::ToUnixMillis(util::Now()));

  bytes_->Write(key, storage::common::FromBytes(std::move(data)), fsync_);

  auto tx = repository_->Begin();
  ThrowIfFailed(repository_->UpsertBlob(*tx, record), "index blob " + key);
  tx->Commit();

  GIGBOOK_LOG_DEBUG("blob stored", {observability::StringField("key", key), observability::StringField("mime_type", mime_type),
                                    observability::IntField("bytes", static_cast<int64_t>(record.size_bytes))});
  return key;
}

std::optional<StoredBlob> BlobStore::GetBlob(const std::string& key) {
  std::optional<db::model::BlobRecord> record;
  {
    auto tx = repository_->Begin();
    record  = repository_->GetBlob(*tx, key);
    tx->Commit();
  }
  if (!record) return std::nullopt;

  auto buffer = bytes_->Read(key);
  if (!buffer) {
    GIGBOOK_LOG_WARN("blob bytes missing for indexed key", {observability::StringField("key", key),
                                                            observability::StringField("backend", bytes_->Kind())});
    return std::nullopt;
  }

  StoredBlob blob;
  blob.key           = record->key;
  blob.data          = buffer->ToString();
  blob.mime_type     = record->mime_type;
  blob.size_bytes    = record->size_bytes;
  blob.created_at_ms = record->created_at_ms;
  return blob;
}

bool BlobStore::Contains(const std::string& key) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetBlob(*tx, key);
  tx->Commit();
  return record.has_value() && bytes_->Contains(key);
}

void BlobStore::DeleteBlob(const std::string& key) {
  {
    auto tx = repository_->Begin();
    ThrowIfFailed(repository_->DeleteBlob(*tx, key), "unindex blob " + key);
    tx->Commit();
  }
  bytes_->Remove(key);
}

std::vector<db::model::BlobRecord> BlobStore::ListBlobs() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListBlobs(*tx);
  tx->Commit();
  return records;
}

void BlobStore::Clear() {
  auto records = ListBlobs();
  {
    auto tx = repository_->Begin();
    ThrowIfFailed(repository_->ClearBlobs(*tx), "clear blob index");
    tx->Commit();
  }
  for (const auto& record : records) {
    bytes_->Remove(record.key);
  }
}

} // namespace gigbook::blob
