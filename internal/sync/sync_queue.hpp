#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "gigbook/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/collection.hpp"

namespace gigbook::sync {

/*
  Outbox of local mutations awaiting delivery to the remote side.

  Appends are advisory: a failed append is logged and dropped, never
  reported to the mutation that triggered it. The remote collaborator
  reconciles full entity state periodically and covers such gaps.

  Pending() is FIFO by timestamp; timestamps never go backwards inside
  one process and ties fall back to append sequence.
*/
class SyncQueue {
 public:
  explicit SyncQueue(std::shared_ptr<db::Repository> repository);

  db::model::SyncOperationRecord MakeOperation(v1::SyncOperationType type, model::Collection collection, const std::string& item_id,
                                               std::optional<std::string> data_json = std::nullopt);

  void Append(db::model::SyncOperationRecord operation);
  void AppendBatch(std::vector<db::model::SyncOperationRecord> operations);

  std::vector<v1::SyncOperation> Pending();

  // acknowledgement; unknown ids are ignored
  void Remove(const std::string& id);
  void Clear();

  std::size_t Size();

  static std::string TypeName(v1::SyncOperationType type);
  static v1::SyncOperationType TypeFromName(const std::string& name);

 private:
  int64_t NextTimestampMs();

  std::shared_ptr<db::Repository> repository_;

  std::mutex clock_mutex_;
  int64_t    last_timestamp_ms_ = 0;
};

} // namespace gigbook::sync
