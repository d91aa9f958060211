#pragma once

#include <google/protobuf/field_mask.pb.h>

#include <optional>
#include <string>
#include <vector>

#include "gigbook/v1.hpp"
#include "internal/blob/blob_store.hpp"
#include "internal/core/query.hpp"
#include "internal/media/media_storage.hpp"
#include "internal/util/outcome.hpp"
#include "service_context.hpp"

namespace gigbook::service {

struct GlobalSearchResults {
  std::vector<v1::Note> notes;
  std::vector<v1::SetList> setlists;
  std::vector<v1::Venue> venues;
  std::vector<v1::Contact> contacts;
  std::vector<v1::Performance> performances;
};

/*
  Notes, set lists and their media.

  Deleting a note removes the blobs its attachments reference before the
  row itself; a crash in between leaves orphaned blobs, never a note
  pointing at missing bytes. Set list totalDuration is always derived
  from the member notes and cannot be written directly.
*/
class ContentService {
public:
  explicit ContentService(ServiceContext ctx);

  // Notes
  util::Outcome<v1::Note> CreateNote(v1::Note note);
  std::optional<v1::Note> GetNote(const std::string& id);
  util::Outcome<v1::Note> UpdateNote(const std::string& id, const v1::Note& patch, const google::protobuf::FieldMask& mask);
  void DeleteNote(const std::string& id);
  std::vector<v1::Note> ListNotes(const core::ListOptions& options = {});
  std::vector<v1::Note> SearchNotes(const std::string& text, std::optional<std::size_t> limit = std::nullopt);
  util::Outcome<std::vector<v1::Note>> CreateManyNotes(std::vector<v1::Note> notes);
  void DeleteManyNotes(const std::vector<std::string>& ids);

  // Set lists
  util::Outcome<v1::SetList> CreateSetList(v1::SetList setlist);
  std::optional<v1::SetList> GetSetList(const std::string& id);
  util::Outcome<v1::SetList> UpdateSetList(const std::string& id, const v1::SetList& patch, const google::protobuf::FieldMask& mask);
  void DeleteSetList(const std::string& id);
  std::vector<v1::SetList> ListSetLists(const core::ListOptions& options = {});

  // One search per collection, run concurrently; no cross-collection ranking.
  GlobalSearchResults GlobalSearch(const std::string& text, std::optional<std::size_t> limit = std::nullopt);

  // Media
  util::Outcome<std::string> StoreAudio(std::string bytes, const std::string& mime_type);
  util::Outcome<media::StoredImage> StoreImage(const std::string& bytes);
  util::Outcome<media::StoredImage> StoreImage(const std::string& bytes, const media::ImageOptions& options);
  std::optional<blob::StoredBlob> GetMedia(const std::string& key);
  void DeleteMedia(const std::string& key);

  // Sum of the member notes' metadata.duration, in seconds.
  static double TotalDuration(const google::protobuf::RepeatedPtrField<v1::Note>& notes);

private:
  void DeleteAttachmentBlobs(const v1::Note& note);

  ServiceContext ctx_;
};

}
