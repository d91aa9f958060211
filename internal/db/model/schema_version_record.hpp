#pragma once

#include <cstdint>

#include "internal/model/collection.hpp"

namespace gigbook::db::model {

struct SchemaVersionRecord {
  gigbook::model::Collection collection = gigbook::model::Collection::kNotes;
  int                        version    = 1;
  int64_t                    updated_at_ms = 0;
};

} // namespace gigbook::db::model
