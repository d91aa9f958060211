#include "memory_repository.hpp"

#include <algorithm>
#include <chrono>

#include "memory_tx.hpp"

namespace gigbook::db::memory {

namespace {

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Entity rows
// ------------------------------------------------------------------

Result MemoryRepository::InsertRow(Transaction& t, const model::EntityRecord& r) {
  auto& table = TX(t).Mutable().tables[r.collection];
  if (table.index.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);

  const uint64_t seq = table.next_seq++;
  table.rows[seq]    = r;
  table.index[r.id]  = seq;
  return Result::Ok();
}

std::optional<model::EntityRecord> MemoryRepository::GetRow(Transaction& t, gigbook::model::Collection collection, const std::string& id) {
  const auto& s        = TX(t).View();
  auto        table_it = s.tables.find(collection);
  if (table_it == s.tables.end()) return std::nullopt;

  auto it = table_it->second.index.find(id);
  if (it == table_it->second.index.end()) return std::nullopt;
  return table_it->second.rows.at(it->second);
}

Result MemoryRepository::UpdateRow(Transaction& t, const model::EntityRecord& r) {
  auto& table = TX(t).Mutable().tables[r.collection];
  auto  it    = table.index.find(r.id);
  if (it == table.index.end()) return Result::Err(ErrorCode::NotFound, r.id);

  table.rows[it->second] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteRow(Transaction& t, gigbook::model::Collection collection, const std::string& id) {
  auto& table = TX(t).Mutable().tables[collection];
  auto  it    = table.index.find(id);
  if (it == table.index.end()) return Result::Ok();

  table.rows.erase(it->second);
  table.index.erase(it);
  return Result::Ok();
}

std::vector<model::EntityRecord> MemoryRepository::ScanRows(Transaction& t, gigbook::model::Collection collection) {
  const auto&                      s = TX(t).View();
  std::vector<model::EntityRecord> records;

  auto table_it = s.tables.find(collection);
  if (table_it == s.tables.end()) return records;

  records.reserve(table_it->second.rows.size());
  for (const auto& [_, record] : table_it->second.rows) {
    records.push_back(record);
  }
  return records;
}

uint64_t MemoryRepository::CountRows(Transaction& t, gigbook::model::Collection collection) {
  const auto& s        = TX(t).View();
  auto        table_it = s.tables.find(collection);
  return table_it == s.tables.end() ? 0 : table_it->second.rows.size();
}

Result MemoryRepository::ClearRows(Transaction& t, gigbook::model::Collection collection) {
  auto& table = TX(t).Mutable().tables[collection];
  table.rows.clear();
  table.index.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Schema versions
// ------------------------------------------------------------------

std::optional<int> MemoryRepository::GetSchemaVersion(Transaction& t, gigbook::model::Collection collection) {
  const auto& s  = TX(t).View();
  auto        it = s.schema_versions.find(collection);
  if (it == s.schema_versions.end()) return std::nullopt;
  return it->second.version;
}

Result MemoryRepository::SetSchemaVersion(Transaction& t, gigbook::model::Collection collection, int version) {
  auto& record         = TX(t).Mutable().schema_versions[collection];
  record.collection    = collection;
  record.version       = version;
  record.updated_at_ms = NowMs();
  return Result::Ok();
}

std::vector<model::SchemaVersionRecord> MemoryRepository::ListSchemaVersions(Transaction& t) {
  const auto&                             s = TX(t).View();
  std::vector<model::SchemaVersionRecord> records;
  for (auto collection : gigbook::model::kAllCollections) {
    auto it = s.schema_versions.find(collection);
    if (it != s.schema_versions.end()) records.push_back(it->second);
  }
  return records;
}

// ------------------------------------------------------------------
// Sync outbox
// ------------------------------------------------------------------

Result MemoryRepository::AppendSyncOperations(Transaction& t, std::vector<model::SyncOperationRecord>& operations) {
  auto& s = TX(t).Mutable();
  for (auto& op : operations) {
    auto duplicate = std::find_if(s.sync_queue.begin(), s.sync_queue.end(), [&](const auto& existing) { return existing.id == op.id; });
    if (duplicate != s.sync_queue.end()) return Result::Err(ErrorCode::AlreadyExists, op.id);

    op.seq = s.next_sync_seq++;
    s.sync_queue.push_back(op);
  }
  return Result::Ok();
}

std::vector<model::SyncOperationRecord> MemoryRepository::ListSyncOperations(Transaction& t) {
  auto operations = TX(t).View().sync_queue;
  std::sort(operations.begin(), operations.end(), [](const auto& a, const auto& b) {
    if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms < b.timestamp_ms;
    return a.seq < b.seq;
  });
  return operations;
}

Result MemoryRepository::DeleteSyncOperation(Transaction& t, const std::string& id) {
  auto& queue = TX(t).Mutable().sync_queue;
  queue.erase(std::remove_if(queue.begin(), queue.end(), [&](const auto& op) { return op.id == id; }), queue.end());
  return Result::Ok();
}

Result MemoryRepository::ClearSyncOperations(Transaction& t) {
  TX(t).Mutable().sync_queue.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Blob index
// ------------------------------------------------------------------

Result MemoryRepository::UpsertBlob(Transaction& t, const model::BlobRecord& r) {
  TX(t).Mutable().blobs[r.key] = r;
  return Result::Ok();
}

std::optional<model::BlobRecord> MemoryRepository::GetBlob(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.blobs.find(key);
  if (it == s.blobs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteBlob(Transaction& t, const std::string& key) {
  TX(t).Mutable().blobs.erase(key);
  return Result::Ok();
}

std::vector<model::BlobRecord> MemoryRepository::ListBlobs(Transaction& t) {
  std::vector<model::BlobRecord> records;
  for (const auto& [_, record] : TX(t).View().blobs) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::ClearBlobs(Transaction& t) {
  TX(t).Mutable().blobs.clear();
  return Result::Ok();
}

} // namespace gigbook::db::memory
