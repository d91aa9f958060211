#pragma once

#include <google/protobuf/field_mask.pb.h>
#include <google/protobuf/util/field_mask_util.h>

#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/collections.hpp"
#include "internal/core/json_codec.hpp"
#include "internal/core/query.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/schema/schema_migrator.hpp"
#include "internal/sync/sync_queue.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/outcome.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/validation/validators.hpp"

namespace gigbook::core {

/*
  Generic typed CRUD, list and search over the entity collections.

  Every successful mutation is followed by one sync operation per
  affected row. The row commit and the sync append are separate writes:
  the append cannot fail the mutation. Mutations are serialized so the
  outbox order is the commit order.

  Absence is std::optional; NotFound, AlreadyExists and
  ValidationFailure come back as Outcome errors; storage failures throw
  util::StorageUnavailable.

  Initialize() must run (and succeed) before any other call.
*/
class EntityStore {
 public:
  EntityStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<sync::SyncQueue> sync_queue);

  // Runs pending migrations. Throws util::MigrationFailed; the store then stays closed.
  std::vector<schema::AppliedStep> Initialize(const schema::SchemaMigrator& migrator);
  bool                             IsInitialized() const;
  int                              SchemaVersion(model::Collection collection) const;

  template <typename T>
  util::Outcome<T> Create(const CollectionHandle<T>& handle, T item);

  template <typename T>
  std::optional<T> Read(const CollectionHandle<T>& handle, const std::string& id);

  /*
    Copies the fields named by `mask` from `patch` onto the stored row.
    Repeated and message fields named by a top-level path are replaced,
    not appended. updatedAt never moves backwards.
  */
  template <typename T>
  util::Outcome<T> Update(const CollectionHandle<T>& handle, const std::string& id, const T& patch, const google::protobuf::FieldMask& mask);

  // Idempotent; a missing id still records a delete operation.
  template <typename T>
  void Delete(const CollectionHandle<T>& handle, const std::string& id) {
    DeleteRecords(handle.collection, {id});
  }

  template <typename T>
  std::vector<T> List(const CollectionHandle<T>& handle, const ListOptions& options = {}) {
    return DecodeAll<T>(ListRecords(handle.collection, options));
  }

  // Validates every item before writing any; rows are written in one transaction.
  template <typename T>
  util::Outcome<std::vector<T>> CreateMany(const CollectionHandle<T>& handle, std::vector<T> items);

  template <typename T>
  void DeleteMany(const CollectionHandle<T>& handle, const std::vector<std::string>& ids) {
    DeleteRecords(handle.collection, ids);
  }

  template <typename T>
  std::vector<T> Search(const CollectionHandle<T>& handle, const SearchQuery& query) {
    return DecodeAll<T>(SearchRecords(handle.collection, query));
  }

  template <typename T>
  std::size_t Count(const CollectionHandle<T>& handle) {
    return CountRecords(handle.collection);
  }

  // Drops every row of a collection without recording sync operations.
  void Clear(model::Collection collection);

 private:
  // Returns the sync payload for the rewritten row, or the failure that aborts the update.
  using RowMutator = std::function<util::Outcome<std::string>(db::model::EntityRecord& record)>;

  void EnsureInitialized() const;

  db::Result                             InsertRecords(model::Collection collection, const std::vector<db::model::EntityRecord>& records);
  std::optional<db::model::EntityRecord> GetRecord(model::Collection collection, const std::string& id);
  db::Result                             UpdateRecord(model::Collection collection, const std::string& id, const RowMutator& mutate);
  void                                   DeleteRecords(model::Collection collection, const std::vector<std::string>& ids);
  std::vector<db::model::EntityRecord>   ListRecords(model::Collection collection, const ListOptions& options);
  std::vector<db::model::EntityRecord>   SearchRecords(model::Collection collection, const SearchQuery& query);
  std::size_t                            CountRecords(model::Collection collection);
  std::vector<Document>                  LoadDocuments(model::Collection collection);

  template <typename T>
  void Prepare(model::Collection collection, T& item, const google::protobuf::Timestamp& now) const;

  template <typename T>
  static db::model::EntityRecord Encode(model::Collection collection, const T& item);

  template <typename T>
  static T Decode(const db::model::EntityRecord& record);

  template <typename T>
  static std::vector<T> DecodeAll(const std::vector<db::model::EntityRecord>& records);

  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<sync::SyncQueue> sync_queue_;

  std::mutex                       mutation_mutex_;
  std::atomic<bool>                initialized_{false};
  std::map<model::Collection, int> versions_;
};

// ------------------------------------------------------------------
// Template implementation
// ------------------------------------------------------------------

template <typename T>
void EntityStore::Prepare(model::Collection collection, T& item, const google::protobuf::Timestamp& now) const {
  if (item.id().empty()) item.set_id(util::NewId());
  if (!item.has_created_at()) *item.mutable_created_at() = now;
  if (!item.has_updated_at()) *item.mutable_updated_at() = item.created_at();
  if (!item.has_version()) item.set_version(SchemaVersion(collection));
}

template <typename T>
db::model::EntityRecord EntityStore::Encode(model::Collection collection, const T& item) {
  db::model::EntityRecord record;
  record.collection    = collection;
  record.id            = item.id();
  record.json          = ToJson(item);
  record.created_at_ms = util::ToUnixMillis(item.created_at());
  record.updated_at_ms = util::ToUnixMillis(item.updated_at());
  return record;
}

template <typename T>
T EntityStore::Decode(const db::model::EntityRecord& record) {
  T           item;
  std::string error;
  if (!FromJson(record.json, &item, &error)) {
    throw util::StorageUnavailable("corrupt row " + std::string(model::TableName(record.collection)) + "/" + record.id + ": " + error);
  }
  return item;
}

template <typename T>
std::vector<T> EntityStore::DecodeAll(const std::vector<db::model::EntityRecord>& records) {
  std::vector<T> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(Decode<T>(record));
  }
  return out;
}

template <typename T>
util::Outcome<T> EntityStore::Create(const CollectionHandle<T>& handle, T item) {
  EnsureInitialized();
  Prepare(handle.collection, item, util::NowProto());

  auto errors = validation::Validate(item);
  if (!errors.empty()) {
    return util::Outcome<T>::Err(db::ErrorCode::ValidationFailure, validation::Describe(errors));
  }

  auto result = InsertRecords(handle.collection, {Encode(handle.collection, item)});
  if (!result) return util::Outcome<T>::From(result);
  return util::Outcome<T>::Ok(std::move(item));
}

template <typename T>
std::optional<T> EntityStore::Read(const CollectionHandle<T>& handle, const std::string& id) {
  EnsureInitialized();
  auto record = GetRecord(handle.collection, id);
  if (!record) return std::nullopt;
  return Decode<T>(*record);
}

template <typename T>
util::Outcome<T> EntityStore::Update(const CollectionHandle<T>& handle, const std::string& id, const T& patch, const google::protobuf::FieldMask& mask) {
  using google::protobuf::util::FieldMaskUtil;

  EnsureInitialized();
  if (!FieldMaskUtil::IsValidFieldMask<T>(mask)) {
    return util::Outcome<T>::Err(db::ErrorCode::ValidationFailure, "unknown field in mask: " + FieldMaskUtil::ToString(mask));
  }
  for (const auto& path : mask.paths()) {
    if (path == "id" || path.rfind("id.", 0) == 0) {
      return util::Outcome<T>::Err(db::ErrorCode::ValidationFailure, "id: cannot be changed");
    }
  }

  T    merged;
  auto result = UpdateRecord(handle.collection, id, [&](db::model::EntityRecord& record) -> util::Outcome<std::string> {
    merged = Decode<T>(record);

    FieldMaskUtil::MergeOptions options;
    options.set_replace_message_fields(true);
    options.set_replace_repeated_fields(true);
    FieldMaskUtil::MergeMessageTo(patch, mask, options, &merged);

    const int64_t now_ms     = util::ToUnixMillis(util::NowProto());
    const int64_t updated_ms = std::max({now_ms, record.updated_at_ms, util::ToUnixMillis(merged.created_at())});
    *merged.mutable_updated_at() = util::FromUnixMillis(updated_ms);

    auto errors = validation::Validate(merged);
    if (!errors.empty()) {
      return util::Outcome<std::string>::Err(db::ErrorCode::ValidationFailure, validation::Describe(errors));
    }

    record.json          = ToJson(merged);
    record.created_at_ms = util::ToUnixMillis(merged.created_at());
    record.updated_at_ms = updated_ms;

    auto sync_data = PatchDocument(patch, mask);
    (*sync_data.mutable_fields())["updatedAt"] = StringValue(util::ToIso8601(merged.updated_at()));
    return util::Outcome<std::string>::Ok(StructToJson(sync_data));
  });

  if (!result) return util::Outcome<T>::From(result);
  return util::Outcome<T>::Ok(std::move(merged));
}

template <typename T>
util::Outcome<std::vector<T>> EntityStore::CreateMany(const CollectionHandle<T>& handle, std::vector<T> items) {
  EnsureInitialized();
  const auto now = util::NowProto();

  std::vector<db::model::EntityRecord> records;
  records.reserve(items.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    Prepare(handle.collection, items[i], now);
    auto errors = validation::Validate(items[i]);
    if (!errors.empty()) {
      return util::Outcome<std::vector<T>>::Err(db::ErrorCode::ValidationFailure, "item " + std::to_string(i) + ": " + validation::Describe(errors));
    }
    records.push_back(Encode(handle.collection, items[i]));
  }

  auto result = InsertRecords(handle.collection, records);
  if (!result) return util::Outcome<std::vector<T>>::From(result);
  return util::Outcome<std::vector<T>>::Ok(std::move(items));
}

} // namespace gigbook::core
