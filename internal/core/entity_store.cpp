#include "entity_store.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace gigbook::core {

namespace {

// Storage failures are not the caller's to branch on.
db::Result Check(db::Result result, const std::string& what) {
  if (!result && !db::IsRecoverable(result.code)) {
    throw util::StorageUnavailable(what + ": " + std::string(db::ToString(result.code)) + " " + result.message);
  }
  return result;
}

} // namespace

EntityStore::EntityStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<sync::SyncQueue> sync_queue)
    : repository_(std::move(repository)), sync_queue_(std::move(sync_queue)) {
  if (!repository_) throw std::invalid_argument("EntityStore requires a repository");
  if (!sync_queue_) throw std::invalid_argument("EntityStore requires a sync queue");
}

std::vector<schema::AppliedStep> EntityStore::Initialize(const schema::SchemaMigrator& migrator) {
  if (initialized_) throw util::InvalidState("entity store already initialized");

  auto applied = migrator.Run(*repository_);

  for (auto collection : model::kAllCollections) {
    versions_[collection] = migrator.LatestVersion(collection);
  }
  initialized_ = true;

  GIGBOOK_LOG_INFO("entity store ready", {observability::IntField("migrations_applied", static_cast<int64_t>(applied.size()))});
  return applied;
}

bool EntityStore::IsInitialized() const {
  return initialized_;
}

int EntityStore::SchemaVersion(model::Collection collection) const {
  auto it = versions_.find(collection);
  return it == versions_.end() ? 1 : it->second;
}

void EntityStore::EnsureInitialized() const {
  if (!initialized_) throw util::InvalidState("entity store used before Initialize()");
}

db::Result EntityStore::InsertRecords(model::Collection collection, const std::vector<db::model::EntityRecord>& records) {
  if (records.empty()) return db::Result::Ok();

  std::scoped_lock lock(mutation_mutex_);
  {
    auto tx = repository_->Begin();
    for (const auto& record : records) {
      auto result = Check(repository_->InsertRow(*tx, record), "insert " + std::string(model::TableName(collection)));
      if (!result) {
        tx->Rollback();
        return db::Result::Err(result.code, std::string(model::TableName(collection)) + "/" + record.id + " already exists");
      }
    }
    tx->Commit();
  }

  std::vector<db::model::SyncOperationRecord> operations;
  operations.reserve(records.size());
  for (const auto& record : records) {
    operations.push_back(sync_queue_->MakeOperation(v1::SYNC_OPERATION_TYPE_CREATE, collection, record.id, record.json));
  }
  sync_queue_->AppendBatch(std::move(operations));
  return db::Result::Ok();
}

std::optional<db::model::EntityRecord> EntityStore::GetRecord(model::Collection collection, const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetRow(*tx, collection, id);
  tx->Commit();
  return record;
}

db::Result EntityStore::UpdateRecord(model::Collection collection, const std::string& id, const RowMutator& mutate) {
  const std::string where = std::string(model::TableName(collection)) + "/" + id;

  std::scoped_lock lock(mutation_mutex_);
  std::string      sync_data;
  {
    auto tx     = repository_->Begin();
    auto record = repository_->GetRow(*tx, collection, id);
    if (!record) {
      tx->Rollback();
      return db::Result::Err(db::ErrorCode::NotFound, where + " not found");
    }

    auto outcome = mutate(*record);
    if (!outcome) {
      tx->Rollback();
      return db::Result::Err(outcome.code(), outcome.message());
    }
    sync_data = std::move(outcome).value();

    auto result = Check(repository_->UpdateRow(*tx, *record), "update " + where);
    if (!result) {
      tx->Rollback();
      return result;
    }
    tx->Commit();
  }

  sync_queue_->Append(sync_queue_->MakeOperation(v1::SYNC_OPERATION_TYPE_UPDATE, collection, id, std::move(sync_data)));
  return db::Result::Ok();
}

void EntityStore::DeleteRecords(model::Collection collection, const std::vector<std::string>& ids) {
  EnsureInitialized();
  if (ids.empty()) return;

  std::scoped_lock lock(mutation_mutex_);
  {
    auto tx = repository_->Begin();
    for (const auto& id : ids) {
      Check(repository_->DeleteRow(*tx, collection, id), "delete " + std::string(model::TableName(collection)) + "/" + id);
    }
    tx->Commit();
  }

  std::vector<db::model::SyncOperationRecord> operations;
  operations.reserve(ids.size());
  for (const auto& id : ids) {
    operations.push_back(sync_queue_->MakeOperation(v1::SYNC_OPERATION_TYPE_DELETE, collection, id));
  }
  sync_queue_->AppendBatch(std::move(operations));
}

std::vector<Document> EntityStore::LoadDocuments(model::Collection collection) {
  std::vector<db::model::EntityRecord> rows;
  {
    auto tx = repository_->Begin();
    rows    = repository_->ScanRows(*tx, collection);
    tx->Commit();
  }

  std::vector<Document> documents;
  documents.reserve(rows.size());
  for (auto& row : rows) {
    Document doc;
    doc.body   = ToStruct(row.json);
    doc.record = std::move(row);
    documents.push_back(std::move(doc));
  }
  return documents;
}

std::vector<db::model::EntityRecord> EntityStore::ListRecords(model::Collection collection, const ListOptions& options) {
  EnsureInitialized();
  auto documents = ApplyList(LoadDocuments(collection), options);

  std::vector<db::model::EntityRecord> out;
  out.reserve(documents.size());
  for (auto& doc : documents) out.push_back(std::move(doc.record));
  return out;
}

std::vector<db::model::EntityRecord> EntityStore::SearchRecords(model::Collection collection, const SearchQuery& query) {
  EnsureInitialized();
  auto documents = ApplySearch(LoadDocuments(collection), query);

  std::vector<db::model::EntityRecord> out;
  out.reserve(documents.size());
  for (auto& doc : documents) out.push_back(std::move(doc.record));
  return out;
}

std::size_t EntityStore::CountRecords(model::Collection collection) {
  EnsureInitialized();
  auto tx    = repository_->Begin();
  auto count = repository_->CountRows(*tx, collection);
  tx->Commit();
  return static_cast<std::size_t>(count);
}

void EntityStore::Clear(model::Collection collection) {
  EnsureInitialized();
  std::scoped_lock lock(mutation_mutex_);
  auto             tx = repository_->Begin();
  Check(repository_->ClearRows(*tx, collection), "clear " + std::string(model::TableName(collection)));
  tx->Commit();
}

} // namespace gigbook::core
