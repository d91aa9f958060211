#include "organization_service.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "contact_service.hpp"
#include "content_service.hpp"
#include "internal/core/entity_store.hpp"
#include "internal/core/json_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "observe.hpp"
#include "performance_service.hpp"

namespace gigbook::service {

using core::collections::kContacts;
using core::collections::kNotes;
using core::collections::kSetLists;
using core::collections::kVenues;

namespace {

constexpr int64_t kDayMs = 24 * 60 * 60 * 1000;

std::unordered_set<std::string> Words(std::string_view text) {
  std::unordered_set<std::string> words;
  std::istringstream in(core::ToLower(text));
  std::string word;
  while (in >> word) {
    if (word.size() > 2) words.insert(word);
  }
  return words;
}

double Jaccard(const std::unordered_set<std::string>& a, const std::unordered_set<std::string>& b) {
  std::size_t shared = 0;
  for (const auto& item : a) {
    if (b.count(item)) ++shared;
  }
  const std::size_t combined = a.size() + b.size() - shared;
  return combined == 0 ? 0.0 : static_cast<double>(shared) / static_cast<double>(combined);
}

// Import duplicate score: identical text (ignoring case) is always a match.
double KeySimilarity(const std::string& a, const std::string& b) {
  if (core::ToLower(a) == core::ToLower(b)) return 1.0;
  return OrganizationService::TextSimilarity(a, b);
}

double NoteDuration(const v1::Note& note) {
  if (note.has_estimated_duration() && note.estimated_duration() > 0) return note.estimated_duration();
  return OrganizationService::EstimateDuration(note.content());
}

std::string FormatNumber(double value) {
  std::ostringstream out;
  out << std::setprecision(15) << value;
  return out.str();
}

std::string Iso(const google::protobuf::Timestamp& ts) {
  return util::ToIso8601(ts);
}

std::string CsvRow(const std::vector<std::string>& fields) {
  std::string row;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i) row += ',';
    row += OrganizationService::CsvEscape(fields[i]);
  }
  return row;
}

std::string JoinTags(const google::protobuf::RepeatedPtrField<std::string>& tags) {
  std::string out;
  for (const auto& tag : tags) {
    if (!out.empty()) out += "; ";
    out += tag;
  }
  return out;
}

template <typename T, typename KeyFn, typename CreateFn>
uint32_t ImportRows(core::EntityStore& store, const core::CollectionHandle<T>& handle, const google::protobuf::RepeatedPtrField<T>& rows,
                    const std::vector<T>& existing, const ImportOptions& options, const std::string& label, KeyFn&& key_of,
                    CreateFn&& create, ImportResult& result) {
  std::vector<std::string> known;
  known.reserve(existing.size());
  for (const auto& item : existing) known.push_back(key_of(item));

  uint32_t imported = 0;
  for (const auto& row : rows) {
    const std::string key = key_of(row);
    if (options.skip_duplicates) {
      bool duplicate = std::any_of(known.begin(), known.end(),
                                   [&](const std::string& other) { return KeySimilarity(other, key) >= options.similarity_threshold; });
      if (duplicate) {
        ++result.duplicates_skipped;
        continue;
      }
    }

    T item = row;
    item.clear_version();
    if (!item.id().empty() && store.Read(handle, item.id())) item.clear_id();

    auto created = create(std::move(item));
    if (!created) {
      result.errors.push_back("failed to import " + label + ": " + created.message());
      continue;
    }
    known.push_back(key);
    ++imported;
  }
  return imported;
}

} // namespace

std::optional<CsvKind> CsvKindFromName(std::string_view name) {
  if (name == "notes") return CsvKind::kNotes;
  if (name == "setlists") return CsvKind::kSetLists;
  if (name == "venues") return CsvKind::kVenues;
  if (name == "contacts") return CsvKind::kContacts;
  return std::nullopt;
}

OrganizationService::OrganizationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store) throw std::invalid_argument("OrganizationService requires an entity store");
}

// ------------------------------------------------------------------
// Similarity
// ------------------------------------------------------------------

double OrganizationService::TextSimilarity(std::string_view a, std::string_view b) {
  return Jaccard(Words(a), Words(b));
}

double OrganizationService::TagSimilarity(const google::protobuf::RepeatedPtrField<std::string>& a,
                                          const google::protobuf::RepeatedPtrField<std::string>& b) {
  std::unordered_set<std::string> left;
  std::unordered_set<std::string> right;
  for (const auto& tag : a) left.insert(core::ToLower(tag));
  for (const auto& tag : b) right.insert(core::ToLower(tag));
  return Jaccard(left, right);
}

double OrganizationService::EstimateDuration(std::string_view content) {
  std::istringstream in{std::string(content)};
  std::string word;
  std::size_t count = 0;
  while (in >> word) ++count;
  return std::max(static_cast<double>(count) / 150.0 * 60.0, 10.0);
}

double OrganizationService::NoteSimilarity(const v1::Note& a, const v1::Note& b) {
  const double content = TextSimilarity(a.content(), b.content());
  const double tags = TagSimilarity(a.tags(), b.tags());

  const double da = NoteDuration(a);
  const double db = NoteDuration(b);
  const double longest = std::max(da, db);
  const double duration = longest == 0 ? 1.0 : std::min(da, db) / longest;

  return content * 0.7 + tags * 0.2 + duration * 0.1;
}

// ------------------------------------------------------------------
// Export
// ------------------------------------------------------------------

v1::ExportData OrganizationService::Export() {
  v1::ExportData data;
  for (auto& note : ctx_.store->List(kNotes)) *data.add_notes() = std::move(note);
  for (auto& setlist : ctx_.store->List(kSetLists)) *data.add_setlists() = std::move(setlist);
  for (auto& venue : ctx_.store->List(kVenues, PerformanceService::DefaultVenueListOptions())) *data.add_venues() = std::move(venue);
  for (auto& contact : ctx_.store->List(kContacts, ContactService::DefaultListOptions())) *data.add_contacts() = std::move(contact);
  data.set_exported_at(util::ToIso8601(util::NowProto()));
  data.set_version(kExportVersion);
  return data;
}

std::string OrganizationService::ExportToJson() {
  return Observe("OrganizationService.ExportToJson", [&] { return core::ToJson(Export(), /*pretty=*/true); });
}

std::string OrganizationService::CsvEscape(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) return std::string(field);

  std::string out = "\"";
  for (char c : field) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::string OrganizationService::ExportToCsv(CsvKind kind) {
  return Observe("OrganizationService.ExportToCsv", [&] {
    std::vector<std::string> lines;

    switch (kind) {
      case CsvKind::kNotes:
        lines.push_back(CsvRow({"ID", "Content", "Capture Method", "Tags", "Venue", "Audience", "Estimated Duration", "Created At", "Updated At"}));
        for (const auto& note : ctx_.store->List(kNotes)) {
          lines.push_back(CsvRow({note.id(), note.content(), note.capture_method(), JoinTags(note.tags()), note.venue(), note.audience(),
                                  note.has_estimated_duration() ? FormatNumber(note.estimated_duration()) : "", Iso(note.created_at()),
                                  Iso(note.updated_at())}));
        }
        break;
      case CsvKind::kSetLists:
        lines.push_back(CsvRow({"ID", "Name", "Total Duration", "Note Count", "Venue", "Performance Date", "Created At"}));
        for (const auto& setlist : ctx_.store->List(kSetLists)) {
          lines.push_back(CsvRow({setlist.id(), setlist.name(), FormatNumber(setlist.total_duration()), std::to_string(setlist.notes_size()),
                                  setlist.venue(), setlist.has_performance_date() ? Iso(setlist.performance_date()) : "",
                                  Iso(setlist.created_at())}));
        }
        break;
      case CsvKind::kVenues:
        lines.push_back(CsvRow({"ID", "Name", "Location", "Audience Size", "Audience Type", "Acoustics", "Lighting", "Created At"}));
        for (const auto& venue : ctx_.store->List(kVenues, PerformanceService::DefaultVenueListOptions())) {
          const auto& traits = venue.characteristics();
          lines.push_back(CsvRow({venue.id(), venue.name(), venue.location(), std::to_string(traits.audience_size()), traits.audience_type(),
                                  traits.acoustics(), traits.lighting(), Iso(venue.created_at())}));
        }
        break;
      case CsvKind::kContacts:
        lines.push_back(CsvRow({"ID", "Name", "Role", "Venue", "Email", "Phone", "Created At"}));
        for (const auto& contact : ctx_.store->List(kContacts, ContactService::DefaultListOptions())) {
          lines.push_back(CsvRow({contact.id(), contact.name(), contact.role(), contact.venue(), contact.contact_info().email(),
                                  contact.contact_info().phone(), Iso(contact.created_at())}));
        }
        break;
    }

    std::string csv;
    for (std::size_t i = 0; i < lines.size(); ++i) {
      if (i) csv += '\n';
      csv += lines[i];
    }
    return csv;
  });
}

// ------------------------------------------------------------------
// Import
// ------------------------------------------------------------------

util::Outcome<ImportResult> OrganizationService::ImportFromJson(const std::string& json, const ImportOptions& options) {
  v1::ExportData data;
  std::string error;
  if (!core::FromJson(json, &data, &error)) {
    return util::Outcome<ImportResult>::Err(db::ErrorCode::ValidationFailure, "invalid export document: " + error);
  }
  return util::Outcome<ImportResult>::Ok(Import(data, options));
}

ImportResult OrganizationService::Import(const v1::ExportData& data, const ImportOptions& options) {
  return Observe("OrganizationService.Import", [&] {
    ImportResult result;
    auto& store = *ctx_.store;

    auto create = [&store](const auto& handle) {
      return [&store, &handle](auto item) { return store.Create(handle, std::move(item)); };
    };

    result.notes = ImportRows(
        store, kNotes, data.notes(), options.skip_duplicates ? store.List(kNotes) : std::vector<v1::Note>{}, options, "note",
        [](const v1::Note& n) { return n.content(); }, create(kNotes), result);

    result.venues = ImportRows(
        store, kVenues, data.venues(), options.skip_duplicates ? store.List(kVenues) : std::vector<v1::Venue>{}, options, "venue",
        [](const v1::Venue& v) { return v.name() + " " + v.location(); }, create(kVenues), result);

    result.contacts = ImportRows(
        store, kContacts, data.contacts(), options.skip_duplicates ? store.List(kContacts) : std::vector<v1::Contact>{}, options, "contact",
        [](const v1::Contact& c) { return c.name() + " " + c.contact_info().email(); }, create(kContacts), result);

    result.setlists = ImportRows(
        store, kSetLists, data.setlists(), options.skip_duplicates ? store.List(kSetLists) : std::vector<v1::SetList>{}, options, "setlist",
        [](const v1::SetList& s) { return s.name(); },
        [&store](v1::SetList item) {
          item.set_total_duration(ContentService::TotalDuration(item.notes()));
          return store.Create(kSetLists, std::move(item));
        },
        result);

    result.success = result.errors.empty();
    GIGBOOK_LOG_INFO("import finished", {observability::IntField("notes", result.notes), observability::IntField("venues", result.venues),
                                         observability::IntField("contacts", result.contacts), observability::IntField("setlists", result.setlists),
                                         observability::IntField("duplicates_skipped", result.duplicates_skipped),
                                         observability::IntField("errors", static_cast<int64_t>(result.errors.size()))});
    for (const auto& error : result.errors) {
      GIGBOOK_LOG_WARN("import row rejected", {observability::StringField("error", error)});
    }
    return result;
  });
}

// ------------------------------------------------------------------
// Duplicates
// ------------------------------------------------------------------

std::vector<DuplicateGroup> OrganizationService::DetectDuplicates(double threshold) {
  return Observe("OrganizationService.DetectDuplicates", [&] {
    const auto notes = ctx_.store->List(kNotes);
    std::vector<DuplicateGroup> groups;

    for (std::size_t i = 0; i < notes.size(); ++i) {
      DuplicateGroup group;
      group.original = notes[i];

      for (std::size_t j = i + 1; j < notes.size(); ++j) {
        const auto& a = notes[i];
        const auto& b = notes[j];
        const double similarity = NoteSimilarity(a, b);
        if (similarity < threshold) continue;

        DuplicateMatch match;
        match.note = b;
        match.similarity = similarity;

        const double content = TextSimilarity(a.content(), b.content());
        if (content > 0.6) match.reasons.push_back("Similar content (" + std::to_string(std::lround(content * 100)) + "% match)");
        const double tags = TagSimilarity(a.tags(), b.tags());
        if (tags > 0.5) match.reasons.push_back("Similar tags (" + std::to_string(std::lround(tags * 100)) + "% match)");
        if (a.has_venue() && b.has_venue() && !a.venue().empty() && a.venue() == b.venue()) match.reasons.push_back("Same venue");
        if (a.has_audience() && b.has_audience() && !a.audience().empty() && a.audience() == b.audience()) {
          match.reasons.push_back("Same audience type");
        }
        if (std::llabs(util::ToUnixMillis(a.created_at()) - util::ToUnixMillis(b.created_at())) < kDayMs) {
          match.reasons.push_back("Created within 24 hours");
        }

        group.duplicates.push_back(std::move(match));
      }

      if (!group.duplicates.empty()) groups.push_back(std::move(group));
    }
    return groups;
  });
}

util::Outcome<v1::Note> OrganizationService::MergeDuplicateNotes(const std::string& primary_id, const std::vector<std::string>& duplicate_ids) {
  return Observe("OrganizationService.MergeDuplicateNotes", [&]() -> util::Outcome<v1::Note> {
    auto primary = ctx_.store->Read(kNotes, primary_id);
    if (!primary) return util::Outcome<v1::Note>::Err(db::ErrorCode::NotFound, "note not found");

    v1::Note patch;
    patch.set_content(primary->content());
    *patch.mutable_tags() = primary->tags();
    *patch.mutable_attachments() = primary->attachments();

    std::unordered_set<std::string> tags(primary->tags().begin(), primary->tags().end());
    std::unordered_set<std::string> attachments;
    for (const auto& attachment : primary->attachments()) attachments.insert(attachment.id());

    std::vector<std::string> merged_ids;
    for (const auto& id : duplicate_ids) {
      if (id == primary_id) continue;
      auto duplicate = ctx_.store->Read(kNotes, id);
      if (!duplicate) continue;

      for (const auto& tag : duplicate->tags()) {
        if (tags.insert(tag).second) patch.add_tags(tag);
      }
      for (const auto& attachment : duplicate->attachments()) {
        if (attachments.insert(attachment.id()).second) *patch.add_attachments() = attachment;
      }
      if (TextSimilarity(primary->content(), duplicate->content()) < 0.8) {
        patch.set_content(patch.content() + "\n\n--- Merged from duplicate ---\n" + duplicate->content());
      }
      merged_ids.push_back(id);
    }

    google::protobuf::FieldMask mask;
    mask.add_paths("content");
    mask.add_paths("tags");
    mask.add_paths("attachments");

    auto updated = ctx_.store->Update(kNotes, primary_id, patch, mask);
    if (!updated) return updated;

    ctx_.store->DeleteMany(kNotes, merged_ids);
    return updated;
  });
}

} // namespace gigbook::service
