#pragma once

#include <google/protobuf/field_mask.pb.h>
#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

#include <string>

namespace gigbook::core {

/*
  Row body codec.

  Entities are stored as the canonical protobuf JSON mapping with
  camelCase names and every primitive field printed, so filters and
  sorts see zero values instead of missing keys.
*/

// Throws std::runtime_error if the message cannot be rendered.
std::string ToJson(const google::protobuf::Message& message, bool pretty = false);

// Unknown keys are ignored so rows written by newer builds still load.
bool FromJson(const std::string& json, google::protobuf::Message* message, std::string* error);

// Throws util::StorageUnavailable: only used on bodies read back from storage.
google::protobuf::Struct ToStruct(const std::string& json);
std::string              StructToJson(const google::protobuf::Struct& document);

/*
  Sync payload for a partial update: the JSON of `patch` restricted to
  the top-level fields named in `mask`. A masked message field that is
  unset in `patch` is emitted as null (cleared).
*/
google::protobuf::Struct PatchDocument(const google::protobuf::Message& patch, const google::protobuf::FieldMask& mask);

} // namespace gigbook::core
