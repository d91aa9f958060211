#pragma once

#include <stdexcept>
#include <string>

namespace gigbook::util {

/*
  Exceptional failures.

  Expected outcomes (missing row, invalid payload) travel as Outcome<T>.
  These types are reserved for conditions no layer below the
  application shell can recover from.
*/

// Storage engine failed to open, read, write or commit.
class StorageUnavailable : public std::runtime_error {
 public:
  explicit StorageUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A schema migration step threw; the store must not be used.
class MigrationFailed : public std::runtime_error {
 public:
  explicit MigrationFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operation issued in the wrong lifecycle phase.
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace gigbook::util
