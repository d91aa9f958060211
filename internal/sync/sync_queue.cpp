#include "sync_queue.hpp"

#include <algorithm>

#include "internal/core/json_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace gigbook::sync {

namespace {

void ThrowIfFailed(const db::Result& result, const std::string& what) {
  if (!result) {
    throw util::StorageUnavailable(what + ": " + std::string(db::ToString(result.code)) + " " + result.message);
  }
}

} // namespace

SyncQueue::SyncQueue(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::string SyncQueue::TypeName(v1::SyncOperationType type) {
  switch (type) {
    case v1::SYNC_OPERATION_TYPE_CREATE:
      return "create";
    case v1::SYNC_OPERATION_TYPE_UPDATE:
      return "update";
    case v1::SYNC_OPERATION_TYPE_DELETE:
      return "delete";
    default:
      return "unspecified";
  }
}

v1::SyncOperationType SyncQueue::TypeFromName(const std::string& name) {
  if (name == "create") return v1::SYNC_OPERATION_TYPE_CREATE;
  if (name == "update") return v1::SYNC_OPERATION_TYPE_UPDATE;
  if (name == "delete") return v1::SYNC_OPERATION_TYPE_DELETE;
  return v1::SYNC_OPERATION_TYPE_UNSPECIFIED;
}

int64_t SyncQueue::NextTimestampMs() {
  std::scoped_lock lock(clock_mutex_);
  const auto       now = static_cast<int64_t>(util::ToUnixMillis(util::Now()));
  last_timestamp_ms_   = std::max(last_timestamp_ms_, now);
  return last_timestamp_ms_;
}

db::model::SyncOperationRecord SyncQueue::MakeOperation(v1::SyncOperationType type, model::Collection collection, const std::string& item_id,
                                                        std::optional<std::string> data_json) {
  db::model::SyncOperationRecord op;
  op.id           = util::NewId();
  op.type         = TypeName(type);
  op.table        = std::string(model::TableName(collection));
  op.item_id      = item_id;
  op.data_json    = std::move(data_json);
  op.timestamp_ms = NextTimestampMs();
  return op;
}

void SyncQueue::Append(db::model::SyncOperationRecord operation) {
  std::vector<db::model::SyncOperationRecord> batch;
  batch.push_back(std::move(operation));
  AppendBatch(std::move(batch));
}

void SyncQueue::AppendBatch(std::vector<db::model::SyncOperationRecord> operations) {
  if (operations.empty()) return;

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->AppendSyncOperations(*tx, operations);
    if (!result) {
      GIGBOOK_LOG_ERROR("sync queue append rejected", {observability::StringField("code", db::ToString(result.code)),
                                                       observability::StringField("error", result.message),
                                                       observability::IntField("operations", static_cast<int64_t>(operations.size()))});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    GIGBOOK_LOG_ERROR("sync queue append failed",
                      {observability::StringField("error", e.what()), observability::StringField("table", operations.front().table),
                       observability::StringField("item_id", operations.front().item_id),
                       observability::IntField("operations", static_cast<int64_t>(operations.size()))});
  }
}

std::vector<v1::SyncOperation> SyncQueue::Pending() {
  std::vector<db::model::SyncOperationRecord> records;
  {
    auto tx = repository_->Begin();
    records = repository_->ListSyncOperations(*tx);
  }

  std::vector<v1::SyncOperation> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    v1::SyncOperation op;
    op.set_id(record.id);
    op.set_type(TypeFromName(record.type));
    op.set_table(record.table);
    op.set_item_id(record.item_id);
    if (record.data_json) {
      *op.mutable_data() = core::ToStruct(*record.data_json);
    }
    *op.mutable_timestamp() = util::FromUnixMillis(record.timestamp_ms);
    op.set_sequence(record.seq);
    out.push_back(std::move(op));
  }
  return out;
}

void SyncQueue::Remove(const std::string& id) {
  auto tx = repository_->Begin();
  ThrowIfFailed(repository_->DeleteSyncOperation(*tx, id), "sync queue remove");
  tx->Commit();
}

void SyncQueue::Clear() {
  auto tx = repository_->Begin();
  ThrowIfFailed(repository_->ClearSyncOperations(*tx), "sync queue clear");
  tx->Commit();
}

std::size_t SyncQueue::Size() {
  auto tx = repository_->Begin();
  return repository_->ListSyncOperations(*tx).size();
}

} // namespace gigbook::sync
