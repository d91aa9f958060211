#include "schema_migrator.hpp"

#include <optional>
#include <stdexcept>

#include "internal/core/json_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace gigbook::schema {

namespace {

std::string Describe(model::Collection collection, int from_version) {
  return std::string(model::TableName(collection)) + " v" + std::to_string(from_version) + "->v" + std::to_string(from_version + 1);
}

void ThrowIfFailed(const db::Result& result, const std::string& what) {
  if (!result) {
    throw std::runtime_error(what + ": " + std::string(db::ToString(result.code)) + " " + result.message);
  }
}

} // namespace

void SchemaMigrator::Register(Migration migration) {
  if (!migration.apply) {
    throw std::invalid_argument("migration without body: " + Describe(migration.collection, migration.from_version));
  }

  auto& chain    = steps_[migration.collection];
  int   expected = 1 + static_cast<int>(chain.size());
  if (migration.from_version != expected) {
    throw std::invalid_argument("migration " + Describe(migration.collection, migration.from_version) + " does not continue from v" +
                                std::to_string(expected));
  }
  chain.push_back(std::move(migration));
}

int SchemaMigrator::LatestVersion(model::Collection collection) const {
  auto it = steps_.find(collection);
  return it == steps_.end() ? 1 : 1 + static_cast<int>(it->second.size());
}

AppliedStep SchemaMigrator::RunStep(db::Repository& repository, const Migration& migration) const {
  const int to_version = migration.from_version + 1;

  auto tx   = repository.Begin();
  auto rows = repository.ScanRows(*tx, migration.collection);

  for (auto& row : rows) {
    auto body = core::ToStruct(row.json);
    migration.apply(body);
    (*body.mutable_fields())["version"].set_number_value(to_version);

    row.json = core::StructToJson(body);
    ThrowIfFailed(repository.UpdateRow(*tx, row), "rewrite " + row.id);
  }

  ThrowIfFailed(repository.SetSchemaVersion(*tx, migration.collection, to_version), "record version");
  tx->Commit();

  return AppliedStep{migration.collection, migration.from_version, to_version, rows.size()};
}

std::vector<AppliedStep> SchemaMigrator::Run(db::Repository& repository) const {
  std::vector<AppliedStep> applied;

  for (auto collection : model::kAllCollections) {
    const int latest = LatestVersion(collection);

    std::optional<int> recorded;
    try {
      auto tx  = repository.Begin();
      recorded = repository.GetSchemaVersion(*tx, collection);
    } catch (const std::exception& e) {
      throw util::MigrationFailed(std::string(model::TableName(collection)) + ": cannot read schema version: " + e.what());
    }

    const int current = recorded.value_or(1);
    if (current > latest) {
      throw util::MigrationFailed(std::string(model::TableName(collection)) + " is at schema v" + std::to_string(current) +
                                  ", newer than this build (v" + std::to_string(latest) + ")");
    }

    for (int version = current; version < latest; ++version) {
      const auto& migration = steps_.at(collection)[static_cast<std::size_t>(version - 1)];
      try {
        applied.push_back(RunStep(repository, migration));
      } catch (const std::exception& e) {
        GIGBOOK_LOG_ERROR("schema migration failed", {observability::StringField("step", Describe(collection, version)),
                                                      observability::StringField("error", e.what())});
        throw util::MigrationFailed(Describe(collection, version) + " (" + migration.description + "): " + e.what());
      }

      GIGBOOK_LOG_INFO("schema migration applied", {observability::StringField("step", Describe(collection, version)),
                                                    observability::StringField("description", migration.description),
                                                    observability::IntField("rows", static_cast<int64_t>(applied.back().rows))});
    }

    if (!recorded && current == latest) {
      try {
        auto tx = repository.Begin();
        ThrowIfFailed(repository.SetSchemaVersion(*tx, collection, latest), "record version");
        tx->Commit();
      } catch (const std::exception& e) {
        throw util::MigrationFailed(std::string(model::TableName(collection)) + ": cannot record schema version: " + e.what());
      }
    }
  }

  return applied;
}

} // namespace gigbook::schema
