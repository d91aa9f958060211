#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gigbook::db::model {

struct SyncOperationRecord {
  std::string id;
  uint64_t    seq = 0; // assigned by the repository on append

  std::string type; // create | update | delete
  std::string table;
  std::string item_id;

  std::optional<std::string> data_json;

  int64_t timestamp_ms = 0;
};

} // namespace gigbook::db::model
