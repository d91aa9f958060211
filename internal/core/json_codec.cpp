#include "json_codec.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace gigbook::core {

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = pretty;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = false;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("cannot encode " + message.GetDescriptor()->full_name() + ": " + status.ToString());
  }
  return json;
}

bool FromJson(const std::string& json, google::protobuf::Message* message, std::string* error) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    if (error) *error = status.ToString();
    return false;
  }
  return true;
}

google::protobuf::Struct ToStruct(const std::string& json) {
  google::protobuf::Struct document;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &document);
  if (!status.ok()) {
    throw util::StorageUnavailable("stored row is not a JSON object: " + status.ToString());
  }
  return document;
}

std::string StructToJson(const google::protobuf::Struct& document) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(document, &json);
  if (!status.ok()) {
    throw std::runtime_error("cannot encode document: " + status.ToString());
  }
  return json;
}

google::protobuf::Struct PatchDocument(const google::protobuf::Message& patch, const google::protobuf::FieldMask& mask) {
  const auto full       = ToStruct(ToJson(patch));
  const auto descriptor = patch.GetDescriptor();

  google::protobuf::Struct out;
  for (const auto& path : mask.paths()) {
    const auto top   = path.substr(0, path.find('.'));
    const auto field = descriptor->FindFieldByName(top);
    if (!field) continue;

    const auto& key = field->json_name();
    auto        it  = full.fields().find(key);
    if (it != full.fields().end()) {
      (*out.mutable_fields())[key] = it->second;
    } else {
      (*out.mutable_fields())[key].set_null_value(google::protobuf::NULL_VALUE);
    }
  }
  return out;
}

} // namespace gigbook::core
