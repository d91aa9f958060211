#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/entity_record.hpp"

namespace gigbook::core {

enum class SortOrder { kAscending, kDescending };

// field path (camelCase, dotted for nested objects) -> expected value
using FilterMap = std::map<std::string, google::protobuf::Value>;

struct ListOptions {
  FilterMap                  filter;
  std::string                sort_by    = "createdAt";
  SortOrder                  sort_order = SortOrder::kDescending;
  std::size_t                offset     = 0;
  std::optional<std::size_t> limit;
};

struct SearchQuery {
  std::string                text;
  std::vector<std::string>   fields;
  FilterMap                  filters;
  std::optional<std::size_t> limit;
};

// A stored row together with its parsed body.
struct Document {
  db::model::EntityRecord  record;
  google::protobuf::Struct body;
};

google::protobuf::Value StringValue(std::string_view value);
google::protobuf::Value NumberValue(double value);
google::protobuf::Value BoolValue(bool value);

std::string ToLower(std::string_view text);

// nullptr when any path segment is missing or not an object
const google::protobuf::Value* LookupField(const google::protobuf::Struct& body, std::string_view path);

/*
  Equality filter. When the stored field is a list and the expected value
  is not, the filter matches if the value is one of the list elements.
*/
bool MatchesFilters(const google::protobuf::Struct& body, const FilterMap& filters);

// Case-insensitive substring over string fields and string elements of list fields.
bool MatchesText(const google::protobuf::Struct& body, const std::vector<std::string>& fields, std::string_view lowered_needle);

/*
  Total order used for sorting: missing < null < bool < number < string.
  Strings that both parse as RFC 3339 timestamps compare chronologically.
*/
int CompareValues(const google::protobuf::Value* a, const google::protobuf::Value* b);

// filter -> stable sort -> offset -> limit
std::vector<Document> ApplyList(std::vector<Document> documents, const ListOptions& options);

// filters -> text match (skipped for empty text) -> limit; keeps scan order
std::vector<Document> ApplySearch(std::vector<Document> documents, const SearchQuery& query);

} // namespace gigbook::core
