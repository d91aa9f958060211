#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/schema/builtin_migrations.hpp"
#include "internal/storage/ram/ram_arrow_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using gigbook::db::ErrorCode;
using gigbook::factory::RuntimeDependencies;

RuntimeDependencies MakeRuntime() {
  gigbook::runtime::config::RuntimeConfig config;
  gigbook::config::ConfigLoader::ApplyDefaults(config);
  return gigbook::factory::BuildRuntime(config);
}

google::protobuf::FieldMask Mask(std::initializer_list<const char*> paths) {
  google::protobuf::FieldMask mask;
  for (const char* path : paths) mask.add_paths(path);
  return mask;
}

gigbook::v1::Note MakeNote(const std::string& content) {
  gigbook::v1::Note note;
  note.set_content(content);
  note.set_capture_method("text");
  return note;
}

// Fully formed note as embedded in a set list.
gigbook::v1::Note MemberNote(const std::string& content, double duration) {
  auto note = MakeNote(content);
  note.set_id(gigbook::util::NewId());
  *note.mutable_created_at() = gigbook::util::NowProto();
  *note.mutable_updated_at() = note.created_at();
  note.mutable_metadata()->set_duration(duration);
  return note;
}

void TestDeleteNoteRemovesAttachmentBlobs() {
  auto rt = MakeRuntime();
  auto& content = *rt.content_service;

  auto audio_key = content.StoreAudio("RIFFfakewav", "audio/wav");
  assert(audio_key.ok());

  auto note = MakeNote("Voice memo");
  note.set_capture_method("voice");
  auto* attachment = note.add_attachments();
  attachment->set_id("att-1");
  attachment->set_type("audio");
  attachment->set_filename("memo.wav");
  attachment->set_size(11);
  attachment->set_mime_type("audio/wav");
  attachment->set_blob_key(*audio_key);

  auto created = content.CreateNote(note);
  assert(created.ok());
  assert(content.GetMedia(*audio_key).has_value());

  content.DeleteNote(created->id());
  assert(!content.GetNote(created->id()).has_value());
  assert(!content.GetMedia(*audio_key).has_value());

  auto ops = rt.admin_service->SyncQueue();
  assert(ops.back().type() == gigbook::v1::SYNC_OPERATION_TYPE_DELETE);
  assert(ops.back().item_id() == created->id());
}

// RAM bytes whose Remove fails for chosen keys.
class StuckRemoveStore final : public gigbook::storage::StorageBackend {
 public:
  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override {
    return inner_.Read(key);
  }
  bool Contains(const std::string& key) override {
    return inner_.Contains(key);
  }
  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override {
    inner_.Write(key, buffer, fsync);
  }
  void Remove(const std::string& key) override {
    if (stuck.count(key)) throw gigbook::util::StorageUnavailable("remove " + key + ": device busy");
    inner_.Remove(key);
  }
  std::string_view Kind() const override {
    return "stuck-ram";
  }

  std::set<std::string> stuck;

 private:
  gigbook::storage::RamArrowStore inner_;
};

void TestDeleteNoteSurvivesBlobRemovalFailure() {
  auto repository = std::make_shared<gigbook::db::memory::MemoryRepository>();
  auto bytes      = std::make_shared<StuckRemoveStore>();

  gigbook::runtime::config::RuntimeConfig config;
  gigbook::config::ConfigLoader::ApplyDefaults(config);

  gigbook::service::ServiceContext ctx;
  ctx.repository = repository;
  ctx.sync_queue = std::make_shared<gigbook::sync::SyncQueue>(repository);
  ctx.store      = std::make_shared<gigbook::core::EntityStore>(repository, ctx.sync_queue);
  ctx.store->Initialize(gigbook::schema::DefaultMigrator());
  ctx.blobs = std::make_shared<gigbook::blob::BlobStore>(repository, bytes, false);
  ctx.media = std::make_shared<gigbook::media::MediaStorage>(ctx.blobs, config.media());
  gigbook::service::ContentService content(ctx);

  auto first  = content.StoreAudio("first clip", "audio/webm");
  auto second = content.StoreAudio("second clip", "audio/webm");
  auto third  = content.StoreAudio("third clip", "audio/webm");
  assert(first.ok() && second.ok() && third.ok());
  bytes->stuck.insert(*second);

  auto note = MakeNote("Three takes");
  for (const auto& key : {*first, *second, *third}) {
    auto* a = note.add_attachments();
    a->set_id("att-" + key);
    a->set_type("audio");
    a->set_filename("take.webm");
    a->set_blob_key(key);
  }
  auto created = content.CreateNote(note);
  assert(created.ok());

  content.DeleteNote(created->id());

  assert(!content.GetNote(created->id()).has_value());
  assert(!content.GetMedia(*first).has_value());
  assert(!content.GetMedia(*third).has_value());
  assert(!bytes->Contains(*first));
  assert(!bytes->Contains(*third));

  // unindexed but left behind on the backend
  assert(!content.GetMedia(*second).has_value());
  assert(bytes->Contains(*second));
}

void TestDeleteManyNotesCascades() {
  auto rt = MakeRuntime();
  auto& content = *rt.content_service;

  std::vector<std::string> keys;
  std::vector<gigbook::v1::Note> batch;
  for (int i = 0; i < 3; ++i) {
    auto key = content.StoreAudio(std::string(16, static_cast<char>('a' + i)), "audio/mp4");
    keys.push_back(*key);

    auto note = MakeNote("bit " + std::to_string(i));
    auto* a = note.add_attachments();
    a->set_id("a" + std::to_string(i));
    a->set_type("audio");
    a->set_filename("clip.m4a");
    a->set_blob_key(*key);
    batch.push_back(note);
  }

  auto created = content.CreateManyNotes(batch);
  assert(created.ok());

  std::vector<std::string> ids;
  for (const auto& n : *created) ids.push_back(n.id());
  content.DeleteManyNotes(ids);

  assert(content.ListNotes().empty());
  for (const auto& key : keys) assert(!content.GetMedia(key).has_value());
}

void TestSetListDurationIsDerivedFromNotes() {
  auto rt = MakeRuntime();
  auto& content = *rt.content_service;

  gigbook::v1::SetList setlist;
  setlist.set_name("Late show");
  *setlist.add_notes() = MemberNote("Opener", 30);
  *setlist.add_notes() = MemberNote("Closer", 45);
  setlist.set_total_duration(999);

  auto created = content.CreateSetList(setlist);
  assert(created.ok());
  assert(created->total_duration() == 75);

  gigbook::v1::SetList patch;
  *patch.add_notes() = created->notes(0);
  auto updated = content.UpdateSetList(created->id(), patch, Mask({"notes"}));
  assert(updated.ok());
  assert(updated->notes_size() == 1);
  assert(updated->total_duration() == 30);

  gigbook::v1::SetList direct;
  direct.set_total_duration(500);
  direct.set_name("Renamed");
  auto renamed = content.UpdateSetList(created->id(), direct, Mask({"name", "total_duration"}));
  assert(renamed.ok());
  assert(renamed->name() == "Renamed");
  assert(renamed->total_duration() == 30);

  auto ops = rt.admin_service->SyncQueue();
  const auto& last = ops.back().data().fields();
  assert(last.find("totalDuration") == last.end());
  assert(last.at("name").string_value() == "Renamed");
}

void TestTotalDurationIgnoresNotesWithoutDuration() {
  google::protobuf::RepeatedPtrField<gigbook::v1::Note> notes;
  *notes.Add() = MemberNote("a", 12.5);
  *notes.Add() = MakeNote("no metadata");
  assert(gigbook::service::ContentService::TotalDuration(notes) == 12.5);
}

void TestUpdateNoteRecordsPatchOnly() {
  auto rt = MakeRuntime();
  auto& content = *rt.content_service;

  auto created = content.CreateNote(MakeNote("draft"));
  gigbook::v1::Note patch;
  patch.add_tags("crowd-work");
  auto updated = content.UpdateNote(created->id(), patch, Mask({"tags"}));
  assert(updated.ok());
  assert(updated->content() == "draft");
  assert(updated->tags(0) == "crowd-work");

  auto ops = rt.admin_service->SyncQueue();
  assert(ops.size() == 2);
  assert(ops[1].data().fields().count("tags") == 1);
  assert(ops[1].data().fields().count("content") == 0);
}

void TestGlobalSearchSpansCollections() {
  auto rt = MakeRuntime();
  auto& content = *rt.content_service;

  content.CreateNote(MakeNote("Jokes about the Blue Moon bar"));
  content.CreateNote(MakeNote("Unrelated"));

  gigbook::v1::SetList setlist;
  setlist.set_name("Blue set");
  content.CreateSetList(setlist);

  gigbook::v1::Venue venue;
  venue.set_name("The Blue Moon");
  venue.set_location("Bergen");
  venue.mutable_characteristics()->set_acoustics("good");
  venue.mutable_characteristics()->set_lighting("basic");
  assert(rt.performance_service->CreateVenue(venue).ok());

  gigbook::v1::Contact contact;
  contact.set_name("Ola");
  contact.set_role("blues promoter");
  assert(rt.contact_service->CreateContact(contact).ok());

  auto results = content.GlobalSearch("blue");
  assert(results.notes.size() == 1);
  assert(results.setlists.size() == 1);
  assert(results.venues.size() == 1);
  assert(results.contacts.size() == 1);
  assert(results.performances.empty());

  auto limited = content.GlobalSearch("", 1);
  assert(limited.notes.size() == 1);
}

void TestSearchNotesMatchesTags() {
  auto rt = MakeRuntime();
  auto& content = *rt.content_service;

  auto note = MakeNote("Something");
  note.add_tags("Airlines");
  content.CreateNote(note);

  assert(content.SearchNotes("airline").size() == 1);
  assert(content.SearchNotes("boat").empty());
}

void TestCreateNoteValidation() {
  auto rt = MakeRuntime();
  auto outcome = rt.content_service->CreateNote(MakeNote(""));
  assert(outcome.code() == ErrorCode::ValidationFailure);
  assert(rt.admin_service->SyncQueue().empty());
}

} // namespace

int main() {
  TestDeleteNoteRemovesAttachmentBlobs();
  TestDeleteNoteSurvivesBlobRemovalFailure();
  TestDeleteManyNotesCascades();
  TestSetListDurationIsDerivedFromNotes();
  TestTotalDurationIgnoresNotesWithoutDuration();
  TestUpdateNoteRecordsPatchOnly();
  TestGlobalSearchSpansCollections();
  TestSearchNotesMatchesTags();
  TestCreateNoteValidation();

  std::cout << "gigbook_unit_content_service: pass\n";
  return 0;
}
