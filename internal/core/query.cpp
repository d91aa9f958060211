#include "query.hpp"

#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/message_differencer.h>
#include <google/protobuf/util/time_util.h>

#include <algorithm>
#include <cctype>

namespace gigbook::core {

using google::protobuf::Value;

namespace {

int KindRank(const Value* v) {
  if (!v) return 0;
  switch (v->kind_case()) {
    case Value::kNullValue:
    case Value::KIND_NOT_SET:
      return 1;
    case Value::kBoolValue:
      return 2;
    case Value::kNumberValue:
      return 3;
    case Value::kStringValue:
      return 4;
    case Value::kListValue:
      return 5;
    case Value::kStructValue:
      return 6;
  }
  return 7;
}

template <typename V>
int ThreeWay(const V& a, const V& b) {
  if (a < b) return -1;
  if (b < a) return 1;
  return 0;
}

bool Contains(std::string_view haystack, std::string_view lowered_needle) {
  return ToLower(haystack).find(lowered_needle) != std::string::npos;
}

} // namespace

Value StringValue(std::string_view value) {
  Value v;
  v.set_string_value(std::string(value));
  return v;
}

Value NumberValue(double value) {
  Value v;
  v.set_number_value(value);
  return v;
}

Value BoolValue(bool value) {
  Value v;
  v.set_bool_value(value);
  return v;
}

std::string ToLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

const Value* LookupField(const google::protobuf::Struct& body, std::string_view path) {
  const google::protobuf::Struct* current = &body;
  while (true) {
    const auto dot = path.find('.');
    const auto key = std::string(path.substr(0, dot));

    auto it = current->fields().find(key);
    if (it == current->fields().end()) return nullptr;
    if (dot == std::string_view::npos) return &it->second;

    if (it->second.kind_case() != Value::kStructValue) return nullptr;
    current = &it->second.struct_value();
    path.remove_prefix(dot + 1);
  }
}

bool MatchesFilters(const google::protobuf::Struct& body, const FilterMap& filters) {
  using google::protobuf::util::MessageDifferencer;

  for (const auto& [path, expected] : filters) {
    const Value* actual = LookupField(body, path);
    if (!actual) return false;

    if (actual->kind_case() == Value::kListValue && expected.kind_case() != Value::kListValue) {
      const auto& values = actual->list_value().values();
      const bool  member = std::any_of(values.begin(), values.end(), [&](const Value& element) { return MessageDifferencer::Equals(element, expected); });
      if (!member) return false;
      continue;
    }

    if (!MessageDifferencer::Equals(*actual, expected)) return false;
  }
  return true;
}

bool MatchesText(const google::protobuf::Struct& body, const std::vector<std::string>& fields, std::string_view lowered_needle) {
  for (const auto& path : fields) {
    const Value* value = LookupField(body, path);
    if (!value) continue;

    if (value->kind_case() == Value::kStringValue && Contains(value->string_value(), lowered_needle)) {
      return true;
    }
    if (value->kind_case() == Value::kListValue) {
      for (const auto& element : value->list_value().values()) {
        if (element.kind_case() == Value::kStringValue && Contains(element.string_value(), lowered_needle)) {
          return true;
        }
      }
    }
  }
  return false;
}

int CompareValues(const Value* a, const Value* b) {
  const int rank_a = KindRank(a);
  const int rank_b = KindRank(b);
  if (rank_a != rank_b) return ThreeWay(rank_a, rank_b);

  switch (rank_a) {
    case 2:
      return ThreeWay(a->bool_value(), b->bool_value());
    case 3:
      return ThreeWay(a->number_value(), b->number_value());
    case 4: {
      // Timestamps order chronologically and before every other string.
      google::protobuf::Timestamp ta;
      google::protobuf::Timestamp tb;
      using google::protobuf::util::TimeUtil;
      const bool a_is_time = TimeUtil::FromString(a->string_value(), &ta);
      const bool b_is_time = TimeUtil::FromString(b->string_value(), &tb);
      if (a_is_time != b_is_time) return a_is_time ? -1 : 1;
      if (a_is_time) {
        return ThreeWay(TimeUtil::TimestampToNanoseconds(ta), TimeUtil::TimestampToNanoseconds(tb));
      }
      return ThreeWay(a->string_value(), b->string_value());
    }
    default:
      return 0;
  }
}

std::vector<Document> ApplyList(std::vector<Document> documents, const ListOptions& options) {
  if (!options.filter.empty()) {
    documents.erase(std::remove_if(documents.begin(), documents.end(), [&](const Document& d) { return !MatchesFilters(d.body, options.filter); }),
                    documents.end());
  }

  if (!options.sort_by.empty()) {
    const bool ascending = options.sort_order == SortOrder::kAscending;
    std::stable_sort(documents.begin(), documents.end(), [&](const Document& x, const Document& y) {
      const int cmp = CompareValues(LookupField(x.body, options.sort_by), LookupField(y.body, options.sort_by));
      return ascending ? cmp < 0 : cmp > 0;
    });
  }

  if (options.offset >= documents.size()) return {};
  documents.erase(documents.begin(), documents.begin() + static_cast<std::ptrdiff_t>(options.offset));

  if (options.limit && documents.size() > *options.limit) {
    documents.resize(*options.limit);
  }
  return documents;
}

std::vector<Document> ApplySearch(std::vector<Document> documents, const SearchQuery& query) {
  const auto needle = ToLower(query.text);

  std::vector<Document> out;
  for (auto& document : documents) {
    if (query.limit && out.size() >= *query.limit) break;
    if (!MatchesFilters(document.body, query.filters)) continue;
    if (!needle.empty() && !MatchesText(document.body, query.fields, needle)) continue;
    out.push_back(std::move(document));
  }
  return out;
}

} // namespace gigbook::core
