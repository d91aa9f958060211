#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gigbook/v1.hpp"
#include "internal/util/outcome.hpp"
#include "service_context.hpp"

namespace gigbook::service {

enum class CsvKind { kNotes, kSetLists, kVenues, kContacts };

std::optional<CsvKind> CsvKindFromName(std::string_view name);

struct ImportOptions {
  bool skip_duplicates = false;
  // rows scoring at or above this against an existing row are skipped
  double similarity_threshold = 0.9;
};

struct ImportResult {
  bool success = true;
  uint32_t notes = 0;
  uint32_t setlists = 0;
  uint32_t venues = 0;
  uint32_t contacts = 0;
  uint32_t duplicates_skipped = 0;
  std::vector<std::string> errors;
};

struct DuplicateMatch {
  v1::Note note;
  double similarity = 0;
  std::vector<std::string> reasons;
};

struct DuplicateGroup {
  v1::Note original;
  std::vector<DuplicateMatch> duplicates;
};

/*
  Snapshot export and import, CSV export, and near-duplicate handling for
  notes.

  Export format version is "1.0.0". Import walks notes, venues, contacts,
  then set lists, one row at a time; a row that fails is reported in
  ImportResult::errors and does not stop the rest.
*/
class OrganizationService {
public:
  static constexpr const char* kExportVersion = "1.0.0";

  explicit OrganizationService(ServiceContext ctx);

  v1::ExportData Export();
  std::string ExportToJson();
  std::string ExportToCsv(CsvKind kind);

  // ValidationFailure when the document itself cannot be parsed.
  util::Outcome<ImportResult> ImportFromJson(const std::string& json, const ImportOptions& options = {});
  ImportResult Import(const v1::ExportData& data, const ImportOptions& options = {});

  std::vector<DuplicateGroup> DetectDuplicates(double threshold = 0.8);

  /*
    Folds the duplicates into `primary_id`: tags and attachments are
    unioned, sufficiently different content is appended. The duplicate
    rows are then deleted; their attachment blobs now belong to the
    primary and are kept.
  */
  util::Outcome<v1::Note> MergeDuplicateNotes(const std::string& primary_id, const std::vector<std::string>& duplicate_ids);

  // Jaccard over lowercased words longer than two characters.
  static double TextSimilarity(std::string_view a, std::string_view b);
  static double TagSimilarity(const google::protobuf::RepeatedPtrField<std::string>& a,
                              const google::protobuf::RepeatedPtrField<std::string>& b);
  // 0.7 content + 0.2 tags + 0.1 duration
  static double NoteSimilarity(const v1::Note& a, const v1::Note& b);
  // ~150 words per minute, at least 10 seconds
  static double EstimateDuration(std::string_view content);

  // RFC 4180 field quoting.
  static std::string CsvEscape(std::string_view field);

private:
  ServiceContext ctx_;
};

}
