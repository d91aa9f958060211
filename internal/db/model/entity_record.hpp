#pragma once

#include <cstdint>
#include <string>

#include "internal/model/collection.hpp"

namespace gigbook::db::model {

/*
  One stored entity.

  The row body is the protobuf JSON rendering of the entity message:
    sqlite -> text
    memory -> string

  Timestamps are duplicated out of the body so backends can order and
  inspect rows without parsing JSON.
*/
struct EntityRecord {
  gigbook::model::Collection collection = gigbook::model::Collection::kNotes;
  std::string                id;

  std::string json;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

} // namespace gigbook::db::model
