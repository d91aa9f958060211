#pragma once

#include <google/protobuf/struct.pb.h>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/collection.hpp"

namespace gigbook::schema {

// Rewrites one row body in place from version N to N+1.
using RowMigration = std::function<void(google::protobuf::Struct& row)>;

struct Migration {
  model::Collection collection = model::Collection::kNotes;
  int               from_version = 1;
  std::string       description;
  RowMigration      apply;
};

struct AppliedStep {
  model::Collection collection;
  int               from_version = 1;
  int               to_version   = 2;
  std::size_t       rows         = 0;
};

/*
  Per-collection version counter plus ordered upgrade steps.

  A collection with no recorded version is at version 1. Run() walks
  every collection from its recorded version to LatestVersion(). Each
  step rewrites all rows and records the new version in one
  transaction, so a step interrupted by a crash leaves the previous
  version recorded and untouched rows behind, and is re-run in full on
  the next start.

  Any failure throws util::MigrationFailed; steps already committed
  stay committed.
*/
class SchemaMigrator {
 public:
  // Throws std::invalid_argument unless from_version continues the chain for its collection.
  void Register(Migration migration);

  int LatestVersion(model::Collection collection) const;

  std::vector<AppliedStep> Run(db::Repository& repository) const;

 private:
  AppliedStep RunStep(db::Repository& repository, const Migration& migration) const;

  std::map<model::Collection, std::vector<Migration>> steps_;
};

} // namespace gigbook::schema
