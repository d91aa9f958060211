#pragma once

#include "gigbook/v1.hpp"
#include "internal/model/collection.hpp"

namespace gigbook::core {

/*
  Typed handle for one collection.

  The store's templates take a handle rather than a table name, so the
  message type a collection holds is fixed at compile time.
*/
template <typename T>
struct CollectionHandle {
  using Entity = T;
  model::Collection collection;
};

namespace collections {

inline constexpr CollectionHandle<v1::Note>             kNotes{model::Collection::kNotes};
inline constexpr CollectionHandle<v1::SetList>          kSetLists{model::Collection::kSetLists};
inline constexpr CollectionHandle<v1::Venue>            kVenues{model::Collection::kVenues};
inline constexpr CollectionHandle<v1::Contact>          kContacts{model::Collection::kContacts};
inline constexpr CollectionHandle<v1::RehearsalSession> kRehearsalSessions{model::Collection::kRehearsalSessions};
inline constexpr CollectionHandle<v1::Performance>      kPerformances{model::Collection::kPerformances};

} // namespace collections

} // namespace gigbook::core
