#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/json_codec.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/schema/builtin_migrations.hpp"
#include "internal/schema/schema_migrator.hpp"
#include "internal/util/errors.hpp"

namespace {

using gigbook::db::memory::MemoryRepository;
using gigbook::model::Collection;
using gigbook::schema::Migration;
using gigbook::schema::SchemaMigrator;

void SeedRow(MemoryRepository& repo, Collection collection, const std::string& id, const std::string& json) {
  gigbook::db::model::EntityRecord record;
  record.collection    = collection;
  record.id            = id;
  record.json          = json;
  record.created_at_ms = 1000;
  record.updated_at_ms = 1000;

  auto tx = repo.Begin();
  assert(repo.InsertRow(*tx, record));
  tx->Commit();
}

google::protobuf::Struct LoadBody(MemoryRepository& repo, Collection collection, const std::string& id) {
  auto tx  = repo.Begin();
  auto row = repo.GetRow(*tx, collection, id);
  assert(row.has_value());
  return gigbook::core::ToStruct(row->json);
}

std::optional<int> RecordedVersion(MemoryRepository& repo, Collection collection) {
  auto tx = repo.Begin();
  return repo.GetSchemaVersion(*tx, collection);
}

void TestDefaultMigratorUpgradesLegacyRows() {
  MemoryRepository repo;
  SeedRow(repo, Collection::kNotes, "n1", R"({"id":"n1","content":"bit","type":"voice"})");
  SeedRow(repo, Collection::kNotes, "n2", R"({"id":"n2","content":"bit"})");
  SeedRow(repo, Collection::kSetLists, "s1",
          R"({"id":"s1","name":"set","totalDuration":0,"notes":[{"metadata":{"duration":30}},{"metadata":{"duration":45}}]})");
  SeedRow(repo, Collection::kContacts, "c1", R"({"id":"c1","name":"Sam","role":"booker"})");

  auto applied = gigbook::schema::DefaultMigrator().Run(repo);
  assert(applied.size() == 3);

  auto n1 = LoadBody(repo, Collection::kNotes, "n1");
  assert(n1.fields().at("captureMethod").string_value() == "voice");
  assert(n1.fields().find("type") == n1.fields().end());
  assert(n1.fields().at("version").number_value() == 2);

  auto n2 = LoadBody(repo, Collection::kNotes, "n2");
  assert(n2.fields().at("captureMethod").string_value() == "text");

  auto s1 = LoadBody(repo, Collection::kSetLists, "s1");
  assert(s1.fields().at("totalDuration").number_value() == 75);
  assert(s1.fields().at("feedback").list_value().values_size() == 0);

  auto c1 = LoadBody(repo, Collection::kContacts, "c1");
  assert(c1.fields().at("interactions").has_list_value());
  assert(c1.fields().at("reminders").has_list_value());

  assert(RecordedVersion(repo, Collection::kNotes) == 2);
  assert(RecordedVersion(repo, Collection::kVenues) == 1);
}

void TestSecondRunIsNoOp() {
  MemoryRepository repo;
  SeedRow(repo, Collection::kNotes, "n1", R"({"id":"n1","content":"bit","type":"voice"})");

  auto migrator = gigbook::schema::DefaultMigrator();
  assert(!migrator.Run(repo).empty());
  assert(migrator.Run(repo).empty());
}

void TestFailedStepKeepsEarlierStepsAndOldVersion() {
  MemoryRepository repo;
  SeedRow(repo, Collection::kNotes, "n1", R"({"id":"n1","content":"bit"})");

  SchemaMigrator migrator;
  migrator.Register({Collection::kNotes, 1, "add mood", [](google::protobuf::Struct& row) {
                       (*row.mutable_fields())["mood"].set_string_value("calm");
                     }});
  migrator.Register({Collection::kNotes, 2, "explode", [](google::protobuf::Struct&) { throw std::runtime_error("boom"); }});

  bool threw = false;
  try {
    migrator.Run(repo);
  } catch (const gigbook::util::MigrationFailed& e) {
    threw = std::string(e.what()).find("boom") != std::string::npos;
  }
  assert(threw);

  assert(RecordedVersion(repo, Collection::kNotes) == 2);
  auto body = LoadBody(repo, Collection::kNotes, "n1");
  assert(body.fields().at("mood").string_value() == "calm");
  assert(body.fields().at("version").number_value() == 2);
}

void TestNewerStoredVersionIsRejected() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.SetSchemaVersion(*tx, Collection::kVenues, 7));
    tx->Commit();
  }

  bool threw = false;
  try {
    gigbook::schema::DefaultMigrator().Run(repo);
  } catch (const gigbook::util::MigrationFailed&) {
    threw = true;
  }
  assert(threw);
}

void TestRegisterRejectsGapsInChain() {
  SchemaMigrator migrator;
  bool           threw = false;
  try {
    migrator.Register({Collection::kVenues, 2, "skip", [](google::protobuf::Struct&) {}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(migrator.LatestVersion(Collection::kVenues) == 1);
}

} // namespace

int main() {
  TestDefaultMigratorUpgradesLegacyRows();
  TestSecondRunIsNoOp();
  TestFailedStepKeepsEarlierStepsAndOldVersion();
  TestNewerStoredVersionIsRejected();
  TestRegisterRejectsGapsInChain();

  std::cout << "gigbook_unit_schema_migrator: pass\n";
  return 0;
}
