#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <google/protobuf/util/time_util.h>

#include "internal/core/entity_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/schema/builtin_migrations.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using gigbook::core::EntityStore;
using gigbook::core::collections::kNotes;
using gigbook::core::collections::kVenues;
using gigbook::db::ErrorCode;
using gigbook::db::memory::MemoryRepository;

struct Harness {
  std::shared_ptr<MemoryRepository>         repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<gigbook::sync::SyncQueue> queue = std::make_shared<gigbook::sync::SyncQueue>(repo);
  std::shared_ptr<EntityStore>              store = std::make_shared<EntityStore>(repo, queue);

  Harness() {
    store->Initialize(gigbook::schema::DefaultMigrator());
  }
};

gigbook::v1::Note MakeNote(const std::string& content, std::vector<std::string> tags = {}) {
  gigbook::v1::Note note;
  note.set_content(content);
  note.set_capture_method("text");
  for (auto& tag : tags) note.add_tags(tag);
  return note;
}

google::protobuf::FieldMask Mask(std::initializer_list<const char*> paths) {
  google::protobuf::FieldMask mask;
  for (const char* path : paths) mask.add_paths(path);
  return mask;
}

void TestCreateAssignsEnvelopeAndRecordsSync() {
  Harness h;

  auto created = h.store->Create(kNotes, MakeNote("Dentist bit", {"health"}));
  assert(created.ok());
  assert(gigbook::util::IsUuidString(created->id()));
  assert(created->has_created_at());
  assert(created->updated_at().seconds() == created->created_at().seconds());
  assert(created->version() == 2);

  auto read = h.store->Read(kNotes, created->id());
  assert(read.has_value());
  assert(read->content() == "Dentist bit");

  auto pending = h.queue->Pending();
  assert(pending.size() == 1);
  assert(pending[0].type() == gigbook::v1::SYNC_OPERATION_TYPE_CREATE);
  assert(pending[0].table() == "notes");
  assert(pending[0].item_id() == created->id());
  assert(pending[0].data().fields().at("content").string_value() == "Dentist bit");
}

void TestInvalidCreateWritesNothing() {
  Harness h;

  auto created = h.store->Create(kNotes, MakeNote(""));
  assert(!created.ok());
  assert(created.code() == ErrorCode::ValidationFailure);
  assert(created.message().find("content") != std::string::npos);
  assert(h.store->Count(kNotes) == 0);
  assert(h.queue->Size() == 0);
}

void TestDuplicateIdIsAlreadyExists() {
  Harness h;

  auto first = h.store->Create(kNotes, MakeNote("one"));
  assert(first.ok());

  auto again = MakeNote("two");
  again.set_id(first->id());
  auto second = h.store->Create(kNotes, again);
  assert(second.code() == ErrorCode::AlreadyExists);
  assert(h.store->Read(kNotes, first->id())->content() == "one");
  assert(h.queue->Size() == 1);
}

void TestReadMissingIsEmpty() {
  Harness h;
  assert(!h.store->Read(kNotes, gigbook::util::NewId()).has_value());
}

void TestUpdateMergesMaskedFieldsOnly() {
  Harness h;

  auto created = h.store->Create(kNotes, MakeNote("old", {"a", "b"}));
  assert(created.ok());

  gigbook::v1::Note patch;
  patch.set_content("new");
  patch.add_tags("c");
  patch.set_capture_method("voice"); // not in mask

  auto updated = h.store->Update(kNotes, created->id(), patch, Mask({"content", "tags"}));
  assert(updated.ok());
  assert(updated->content() == "new");
  assert(updated->tags_size() == 1 && updated->tags(0) == "c");
  assert(updated->capture_method() == "text");
  assert(updated->id() == created->id());
  assert(gigbook::util::ToUnixMillis(updated->updated_at()) >= gigbook::util::ToUnixMillis(created->updated_at()));
  assert(gigbook::util::ToUnixMillis(updated->created_at()) == gigbook::util::ToUnixMillis(created->created_at()));

  auto pending = h.queue->Pending();
  assert(pending.size() == 2);
  const auto& data = pending[1].data().fields();
  assert(pending[1].type() == gigbook::v1::SYNC_OPERATION_TYPE_UPDATE);
  assert(data.at("content").string_value() == "new");
  assert(data.find("updatedAt") != data.end());
  assert(data.find("captureMethod") == data.end());
}

// A stored updatedAt ahead of the local clock is kept, not rolled back.
void TestUpdateNeverMovesUpdatedAtBackwards() {
  Harness h;

  const int64_t future_ms = gigbook::util::ToUnixMillis(gigbook::util::NowProto()) + 60 * 60 * 1000;
  auto          note      = MakeNote("written on a fast clock");
  *note.mutable_updated_at() = gigbook::util::FromUnixMillis(future_ms);

  auto created = h.store->Create(kNotes, note);
  assert(created.ok());
  assert(gigbook::util::ToUnixMillis(created->updated_at()) == future_ms);

  gigbook::v1::Note patch;
  patch.set_content("edited later");
  auto updated = h.store->Update(kNotes, created->id(), patch, Mask({"content"}));
  assert(updated.ok());
  assert(gigbook::util::ToUnixMillis(updated->updated_at()) >= future_ms);

  auto stored = h.store->Read(kNotes, created->id());
  assert(stored->content() == "edited later");
  assert(gigbook::util::ToUnixMillis(stored->updated_at()) >= future_ms);

  auto pending = h.queue->Pending();
  assert(pending.size() == 2);
  google::protobuf::Timestamp synced;
  assert(google::protobuf::util::TimeUtil::FromString(pending[1].data().fields().at("updatedAt").string_value(), &synced));
  assert(gigbook::util::ToUnixMillis(synced) >= future_ms);
  assert(gigbook::util::ToUnixMillis(synced) == gigbook::util::ToUnixMillis(stored->updated_at()));
}

void TestUpdateRejectsIdAndUnknownPaths() {
  Harness h;
  auto    created = h.store->Create(kNotes, MakeNote("x"));

  gigbook::v1::Note patch;
  patch.set_id(gigbook::util::NewId());
  assert(h.store->Update(kNotes, created->id(), patch, Mask({"id"})).code() == ErrorCode::ValidationFailure);
  assert(h.store->Update(kNotes, created->id(), patch, Mask({"no_such_field"})).code() == ErrorCode::ValidationFailure);
  assert(h.queue->Size() == 1);
}

void TestUpdateThatBreaksValidationLeavesRowIntact() {
  Harness h;
  auto    created = h.store->Create(kNotes, MakeNote("keep me"));

  gigbook::v1::Note patch;
  auto outcome = h.store->Update(kNotes, created->id(), patch, Mask({"content"}));
  assert(outcome.code() == ErrorCode::ValidationFailure);
  assert(h.store->Read(kNotes, created->id())->content() == "keep me");
}

void TestUpdateMissingRowIsNotFound() {
  Harness h;
  gigbook::v1::Note patch;
  patch.set_content("x");
  auto outcome = h.store->Update(kNotes, gigbook::util::NewId(), patch, Mask({"content"}));
  assert(outcome.code() == ErrorCode::NotFound);
  assert(h.queue->Size() == 0);
}

void TestDeleteIsIdempotentAndAlwaysRecorded() {
  Harness h;
  auto    created = h.store->Create(kNotes, MakeNote("x"));

  h.store->Delete(kNotes, created->id());
  h.store->Delete(kNotes, created->id());
  assert(!h.store->Read(kNotes, created->id()).has_value());

  auto pending = h.queue->Pending();
  assert(pending.size() == 3);
  assert(pending[1].type() == gigbook::v1::SYNC_OPERATION_TYPE_DELETE);
  assert(pending[2].type() == gigbook::v1::SYNC_OPERATION_TYPE_DELETE);
  assert(!pending[2].has_data());
}

void TestCreateManyIsAllOrNothing() {
  Harness h;

  std::vector<gigbook::v1::Note> batch = {MakeNote("a"), MakeNote(""), MakeNote("c")};
  auto                           bad   = h.store->CreateMany(kNotes, batch);
  assert(bad.code() == ErrorCode::ValidationFailure);
  assert(bad.message().rfind("item 1:", 0) == 0);
  assert(h.store->Count(kNotes) == 0);

  batch[1].set_content("b");
  auto good = h.store->CreateMany(kNotes, batch);
  assert(good.ok());
  assert(good->size() == 3);
  assert(h.store->Count(kNotes) == 3);
  assert(h.queue->Size() == 3);

  std::vector<std::string> ids;
  for (const auto& note : *good) ids.push_back(note.id());
  h.store->DeleteMany(kNotes, ids);
  assert(h.store->Count(kNotes) == 0);
  assert(h.queue->Size() == 6);
}

void TestListAndSearch() {
  Harness h;
  h.store->Create(kNotes, MakeNote("Airport security", {"travel"}));
  h.store->Create(kNotes, MakeNote("Cat videos", {"pets"}));
  h.store->Create(kNotes, MakeNote("Hotel breakfast", {"Travel"}));

  gigbook::core::ListOptions options;
  options.sort_by    = "content";
  options.sort_order = gigbook::core::SortOrder::kAscending;
  auto listed        = h.store->List(kNotes, options);
  assert(listed.size() == 3);
  assert(listed[0].content() == "Airport security");
  assert(listed[2].content() == "Hotel breakfast");

  gigbook::core::SearchQuery query;
  query.text   = "travel";
  query.fields = {"content", "tags"};
  assert(h.store->Search(kNotes, query).size() == 2);

  query.limit = 1;
  assert(h.store->Search(kNotes, query).size() == 1);
}

void TestClearRecordsNoSyncOperations() {
  Harness h;
  h.store->Create(kNotes, MakeNote("x"));
  const auto before = h.queue->Size();

  h.store->Clear(gigbook::model::Collection::kNotes);
  assert(h.store->Count(kNotes) == 0);
  assert(h.queue->Size() == before);
}

void TestLifecycleGuards() {
  auto        repo  = std::make_shared<MemoryRepository>();
  auto        queue = std::make_shared<gigbook::sync::SyncQueue>(repo);
  EntityStore store(repo, queue);

  bool threw = false;
  try {
    store.Count(kVenues);
  } catch (const gigbook::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  store.Initialize(gigbook::schema::DefaultMigrator());
  assert(store.IsInitialized());
  assert(store.SchemaVersion(gigbook::model::Collection::kVenues) == 1);

  threw = false;
  try {
    store.Initialize(gigbook::schema::DefaultMigrator());
  } catch (const gigbook::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentCreatesKeepOutboxInCommitOrder() {
  Harness h;

  constexpr int kThreads = 4;
  constexpr int kPerThread = 25;

  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&h, t] {
      for (int i = 0; i < kPerThread; ++i) {
        auto created = h.store->Create(kNotes, MakeNote("t" + std::to_string(t) + " #" + std::to_string(i)));
        assert(created.ok());
      }
    });
  }
  for (auto& w : workers) w.join();

  assert(h.store->Count(kNotes) == kThreads * kPerThread);

  auto                  pending = h.queue->Pending();
  std::set<std::string> seen;
  for (const auto& op : pending) seen.insert(op.item_id());
  assert(pending.size() == kThreads * kPerThread);
  assert(seen.size() == pending.size());

  // scan order is insertion order, which must match outbox order
  auto rows = h.store->List(kNotes, gigbook::core::ListOptions{.sort_by = ""});
  for (std::size_t i = 0; i < rows.size(); ++i) {
    assert(rows[i].id() == pending[i].item_id());
  }
}

} // namespace

int main() {
  TestCreateAssignsEnvelopeAndRecordsSync();
  TestInvalidCreateWritesNothing();
  TestDuplicateIdIsAlreadyExists();
  TestReadMissingIsEmpty();
  TestUpdateMergesMaskedFieldsOnly();
  TestUpdateNeverMovesUpdatedAtBackwards();
  TestUpdateRejectsIdAndUnknownPaths();
  TestUpdateThatBreaksValidationLeavesRowIntact();
  TestUpdateMissingRowIsNotFound();
  TestDeleteIsIdempotentAndAlwaysRecorded();
  TestCreateManyIsAllOrNothing();
  TestListAndSearch();
  TestClearRecordsNoSyncOperations();
  TestLifecycleGuards();
  TestConcurrentCreatesKeepOutboxInCommitOrder();

  std::cout << "gigbook_unit_entity_store: pass\n";
  return 0;
}
