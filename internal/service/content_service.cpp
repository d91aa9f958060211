#include "content_service.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

#include "internal/core/entity_store.hpp"
#include "internal/observability/logging.hpp"
#include "observe.hpp"

namespace gigbook::service {

using core::collections::kContacts;
using core::collections::kNotes;
using core::collections::kPerformances;
using core::collections::kSetLists;
using core::collections::kVenues;

namespace {

constexpr const char* kTotalDurationPath = "total_duration";

core::SearchQuery TextQuery(const std::string& text, std::vector<std::string> fields, std::optional<std::size_t> limit) {
  core::SearchQuery query;
  query.text = text;
  query.fields = std::move(fields);
  query.limit = limit;
  return query;
}

} // namespace

ContentService::ContentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store) throw std::invalid_argument("ContentService requires an entity store");
  if (!ctx_.media) throw std::invalid_argument("ContentService requires media storage");
}

double ContentService::TotalDuration(const google::protobuf::RepeatedPtrField<v1::Note>& notes) {
  double total = 0;
  for (const auto& note : notes) {
    if (note.has_metadata() && note.metadata().has_duration()) total += note.metadata().duration();
  }
  return total;
}

// ------------------------------------------------------------------
// Notes
// ------------------------------------------------------------------

util::Outcome<v1::Note> ContentService::CreateNote(v1::Note note) {
  return Observe("ContentService.CreateNote", [&] { return ctx_.store->Create(kNotes, std::move(note)); });
}

std::optional<v1::Note> ContentService::GetNote(const std::string& id) {
  return ctx_.store->Read(kNotes, id);
}

util::Outcome<v1::Note> ContentService::UpdateNote(const std::string& id, const v1::Note& patch, const google::protobuf::FieldMask& mask) {
  return Observe("ContentService.UpdateNote", [&] { return ctx_.store->Update(kNotes, id, patch, mask); });
}

// Best effort: a blob that cannot be removed is logged and the note row still goes.
void ContentService::DeleteAttachmentBlobs(const v1::Note& note) {
  for (const auto& attachment : note.attachments()) {
    if (!attachment.has_blob_key() || attachment.blob_key().empty()) continue;
    try {
      ctx_.media->DeleteMedia(attachment.blob_key());
    } catch (const std::exception& ex) {
      GIGBOOK_LOG_WARN("cascade blob delete failed", {observability::StringField("key", attachment.blob_key()),
                                                      observability::StringField("note_id", note.id()),
                                                      observability::StringField("error", ex.what())});
    }
  }
}

void ContentService::DeleteNote(const std::string& id) {
  Observe("ContentService.DeleteNote", [&] {
    if (auto note = ctx_.store->Read(kNotes, id)) {
      DeleteAttachmentBlobs(*note);
    }
    ctx_.store->Delete(kNotes, id);
  });
}

std::vector<v1::Note> ContentService::ListNotes(const core::ListOptions& options) {
  return ctx_.store->List(kNotes, options);
}

std::vector<v1::Note> ContentService::SearchNotes(const std::string& text, std::optional<std::size_t> limit) {
  return ctx_.store->Search(kNotes, TextQuery(text, {"content", "tags"}, limit));
}

util::Outcome<std::vector<v1::Note>> ContentService::CreateManyNotes(std::vector<v1::Note> notes) {
  return Observe("ContentService.CreateManyNotes", [&] { return ctx_.store->CreateMany(kNotes, std::move(notes)); });
}

void ContentService::DeleteManyNotes(const std::vector<std::string>& ids) {
  Observe("ContentService.DeleteManyNotes", [&] {
    for (const auto& id : ids) {
      if (auto note = ctx_.store->Read(kNotes, id)) {
        DeleteAttachmentBlobs(*note);
      }
    }
    ctx_.store->DeleteMany(kNotes, ids);
  });
}

// ------------------------------------------------------------------
// Set lists
// ------------------------------------------------------------------

util::Outcome<v1::SetList> ContentService::CreateSetList(v1::SetList setlist) {
  setlist.set_total_duration(TotalDuration(setlist.notes()));
  return Observe("ContentService.CreateSetList", [&] { return ctx_.store->Create(kSetLists, std::move(setlist)); });
}

std::optional<v1::SetList> ContentService::GetSetList(const std::string& id) {
  return ctx_.store->Read(kSetLists, id);
}

util::Outcome<v1::SetList> ContentService::UpdateSetList(const std::string& id, const v1::SetList& patch, const google::protobuf::FieldMask& mask) {
  v1::SetList patched = patch;
  google::protobuf::FieldMask effective;

  bool touches_notes = false;
  for (const auto& path : mask.paths()) {
    if (path == kTotalDurationPath) continue;
    if (path == "notes") touches_notes = true;
    effective.add_paths(path);
  }
  if (touches_notes) {
    patched.set_total_duration(TotalDuration(patch.notes()));
    effective.add_paths(kTotalDurationPath);
  }

  return Observe("ContentService.UpdateSetList", [&] { return ctx_.store->Update(kSetLists, id, patched, effective); });
}

void ContentService::DeleteSetList(const std::string& id) {
  ctx_.store->Delete(kSetLists, id);
}

std::vector<v1::SetList> ContentService::ListSetLists(const core::ListOptions& options) {
  return ctx_.store->List(kSetLists, options);
}

// ------------------------------------------------------------------
// Search
// ------------------------------------------------------------------

GlobalSearchResults ContentService::GlobalSearch(const std::string& text, std::optional<std::size_t> limit) {
  return Observe("ContentService.GlobalSearch", [&] {
    auto& store = *ctx_.store;

    auto notes = std::async(std::launch::async, [&] { return store.Search(kNotes, TextQuery(text, {"content", "tags"}, limit)); });
    auto setlists = std::async(std::launch::async, [&] { return store.Search(kSetLists, TextQuery(text, {"name"}, limit)); });
    auto venues = std::async(std::launch::async, [&] { return store.Search(kVenues, TextQuery(text, {"name", "location"}, limit)); });
    auto contacts = std::async(std::launch::async, [&] { return store.Search(kContacts, TextQuery(text, {"name", "role"}, limit)); });
    auto performances = std::async(std::launch::async, [&] { return store.Search(kPerformances, TextQuery(text, {"notes"}, limit)); });

    GlobalSearchResults results;
    results.notes = notes.get();
    results.setlists = setlists.get();
    results.venues = venues.get();
    results.contacts = contacts.get();
    results.performances = performances.get();
    return results;
  });
}

// ------------------------------------------------------------------
// Media
// ------------------------------------------------------------------

util::Outcome<std::string> ContentService::StoreAudio(std::string bytes, const std::string& mime_type) {
  return Observe("ContentService.StoreAudio", [&] { return ctx_.media->StoreAudio(std::move(bytes), mime_type); });
}

util::Outcome<media::StoredImage> ContentService::StoreImage(const std::string& bytes) {
  return Observe("ContentService.StoreImage", [&] { return ctx_.media->StoreImage(bytes); });
}

util::Outcome<media::StoredImage> ContentService::StoreImage(const std::string& bytes, const media::ImageOptions& options) {
  return Observe("ContentService.StoreImage", [&] { return ctx_.media->StoreImage(bytes, options); });
}

std::optional<blob::StoredBlob> ContentService::GetMedia(const std::string& key) {
  return ctx_.media->GetMedia(key);
}

void ContentService::DeleteMedia(const std::string& key) {
  ctx_.media->DeleteMedia(key);
}

} // namespace gigbook::service
