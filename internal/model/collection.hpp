#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gigbook::model {

/*
  Entity collections known to the store.

  Each maps to one physical table. The sync queue, blob index and schema
  version bookkeeping are internal tables with their own repository calls
  and are deliberately not listed here.
*/
enum class Collection : std::uint8_t {
  kNotes = 0,
  kSetLists,
  kVenues,
  kContacts,
  kRehearsalSessions,
  kPerformances,
};

inline constexpr std::array<Collection, 6> kAllCollections = {
    Collection::kNotes,    Collection::kSetLists,          Collection::kVenues,
    Collection::kContacts, Collection::kRehearsalSessions, Collection::kPerformances,
};

constexpr std::string_view TableName(Collection collection) {
  switch (collection) {
    case Collection::kNotes:
      return "notes";
    case Collection::kSetLists:
      return "setlists";
    case Collection::kVenues:
      return "venues";
    case Collection::kContacts:
      return "contacts";
    case Collection::kRehearsalSessions:
      return "rehearsal_sessions";
    case Collection::kPerformances:
      return "performances";
  }
  return "unknown";
}

constexpr std::optional<Collection> CollectionFromTable(std::string_view table) {
  for (auto collection : kAllCollections) {
    if (TableName(collection) == table) return collection;
  }
  return std::nullopt;
}

} // namespace gigbook::model
