#include <cassert>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using gigbook::db::ErrorCode;
using gigbook::factory::RuntimeDependencies;
using gigbook::service::CsvKind;
using gigbook::service::ImportOptions;
using gigbook::service::OrganizationService;

RuntimeDependencies MakeRuntime() {
  gigbook::runtime::config::RuntimeConfig config;
  gigbook::config::ConfigLoader::ApplyDefaults(config);
  return gigbook::factory::BuildRuntime(config);
}

gigbook::v1::Note MakeNote(const std::string& content, std::vector<std::string> tags = {}) {
  gigbook::v1::Note note;
  note.set_content(content);
  note.set_capture_method("text");
  for (auto& tag : tags) note.add_tags(tag);
  return note;
}

gigbook::v1::Note MemberNote(const std::string& content, double duration) {
  auto note = MakeNote(content);
  note.set_id(gigbook::util::NewId());
  *note.mutable_created_at() = gigbook::util::NowProto();
  *note.mutable_updated_at() = note.created_at();
  note.mutable_metadata()->set_duration(duration);
  return note;
}

void Populate(RuntimeDependencies& rt) {
  assert(rt.content_service->CreateNote(MakeNote("Airport security bit", {"travel", "tsa"})).ok());
  assert(rt.content_service->CreateNote(MakeNote("Cat owner rant", {"pets"})).ok());

  gigbook::v1::SetList setlist;
  setlist.set_name("Friday late");
  *setlist.add_notes() = MemberNote("Opener", 20);
  assert(rt.content_service->CreateSetList(setlist).ok());

  gigbook::v1::Venue venue;
  venue.set_name("Blue Moon");
  venue.set_location("Bergen");
  venue.mutable_characteristics()->set_acoustics("good");
  venue.mutable_characteristics()->set_lighting("basic");
  assert(rt.performance_service->CreateVenue(venue).ok());

  gigbook::v1::Contact contact;
  contact.set_name("Ola");
  contact.set_role("promoter");
  contact.mutable_contact_info()->set_email("ola@example.com");
  assert(rt.contact_service->CreateContact(contact).ok());
}

std::vector<std::string> Lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream       in(text);
  std::string              line;
  while (std::getline(in, line)) lines.push_back(line);
  return lines;
}

void TestExportClearImportRestoresEverything() {
  auto rt = MakeRuntime();
  Populate(rt);
  auto& org = *rt.organization_service;

  auto exported = org.Export();
  assert(exported.version() == OrganizationService::kExportVersion);
  assert(!exported.exported_at().empty());
  const std::string note_id = exported.notes(0).id();

  auto json = org.ExportToJson();
  assert(json.find("\"version\": \"1.0.0\"") != std::string::npos);

  rt.admin_service->ClearAllData();
  assert(rt.content_service->ListNotes().empty());
  assert(rt.admin_service->SyncQueue().empty());

  auto imported = org.ImportFromJson(json);
  assert(imported.ok());
  assert(imported->success);
  assert(imported->notes == 2);
  assert(imported->setlists == 1);
  assert(imported->venues == 1);
  assert(imported->contacts == 1);
  assert(imported->duplicates_skipped == 0);

  assert(rt.content_service->GetNote(note_id).has_value());
  assert(rt.content_service->ListSetLists()[0].total_duration() == 20);
  assert(rt.admin_service->SyncQueue().size() == 5);
}

void TestReimportWithSkipDuplicates() {
  auto rt = MakeRuntime();
  Populate(rt);
  auto& org  = *rt.organization_service;
  auto  data = org.Export();

  ImportOptions options;
  options.skip_duplicates = true;
  auto result             = org.Import(data, options);
  assert(result.success);
  assert(result.notes == 0 && result.setlists == 0 && result.venues == 0 && result.contacts == 0);
  assert(result.duplicates_skipped == 5);

  // taken ids are reassigned rather than rejected
  auto again = org.Import(data);
  assert(again.notes == 2);
  assert(rt.content_service->ListNotes().size() == 4);
}

void TestBadRowsAreReportedAndOthersImported() {
  auto rt = MakeRuntime();

  gigbook::v1::ExportData data;
  *data.add_notes() = MakeNote("");
  *data.add_notes() = MakeNote("Fine note");

  gigbook::v1::SetList setlist;
  setlist.set_name("Imported set");
  setlist.set_total_duration(999);
  *setlist.add_notes() = MemberNote("a", 10);
  *setlist.add_notes() = MemberNote("b", 15);
  *data.add_setlists() = setlist;

  auto result = rt.organization_service->Import(data);
  assert(!result.success);
  assert(result.errors.size() == 1);
  assert(result.errors[0].rfind("failed to import note:", 0) == 0);
  assert(result.notes == 1);
  assert(result.setlists == 1);
  assert(rt.content_service->ListSetLists()[0].total_duration() == 25);
}

void TestMalformedJsonIsValidationFailure() {
  auto rt      = MakeRuntime();
  auto outcome = rt.organization_service->ImportFromJson("{not json");
  assert(outcome.code() == ErrorCode::ValidationFailure);
}

void TestCsvExportQuotesSpecialFields() {
  auto rt = MakeRuntime();
  assert(rt.content_service->CreateNote(MakeNote("He said \"hi\", then left", {"crowd", "story"})).ok());
  assert(rt.content_service->CreateNote(MakeNote("Line one\nline two")).ok());

  auto csv = rt.organization_service->ExportToCsv(CsvKind::kNotes);
  assert(csv.rfind("ID,Content,Capture Method,Tags,Venue,Audience,Estimated Duration,Created At,Updated At\n", 0) == 0);
  assert(csv.find(",\"He said \"\"hi\"\", then left\",text,crowd; story,") != std::string::npos);
  assert(csv.find("\"Line one\nline two\"") != std::string::npos);

  assert(OrganizationService::CsvEscape("plain") == "plain");
  assert(OrganizationService::CsvEscape("a,b") == "\"a,b\"");
  assert(OrganizationService::CsvEscape("cr\r") == "\"cr\r\"");
}

void TestCsvExportOtherKinds() {
  auto rt = MakeRuntime();
  Populate(rt);
  auto& org = *rt.organization_service;

  auto venues = Lines(org.ExportToCsv(CsvKind::kVenues));
  assert(venues.size() == 2);
  assert(venues[0] == "ID,Name,Location,Audience Size,Audience Type,Acoustics,Lighting,Created At");
  assert(venues[1].find(",Blue Moon,Bergen,0,,good,basic,") != std::string::npos);

  auto contacts = Lines(org.ExportToCsv(CsvKind::kContacts));
  assert(contacts.size() == 2);
  assert(contacts[1].find(",Ola,promoter,,ola@example.com,,") != std::string::npos);

  auto setlists = Lines(org.ExportToCsv(CsvKind::kSetLists));
  assert(setlists[0] == "ID,Name,Total Duration,Note Count,Venue,Performance Date,Created At");
  assert(setlists[1].find(",Friday late,20,1,,,") != std::string::npos);

  assert(gigbook::service::CsvKindFromName("setlists") == CsvKind::kSetLists);
  assert(!gigbook::service::CsvKindFromName("gigs").has_value());
}

void TestDetectDuplicatesAndReasons() {
  auto rt = MakeRuntime();
  auto& content = *rt.content_service;
  content.CreateNote(MakeNote("The airline food joke about peanuts", {"food"}));
  content.CreateNote(MakeNote("The airline food joke about pretzels", {"travel"}));
  content.CreateNote(MakeNote("Completely different material entirely"));

  auto& org = *rt.organization_service;
  assert(org.DetectDuplicates().empty());

  auto groups = org.DetectDuplicates(0.5);
  assert(groups.size() == 1);
  assert(groups[0].duplicates.size() == 1);
  const auto& match = groups[0].duplicates[0];
  assert(std::abs(match.similarity - 0.6) < 1e-9);
  assert(match.reasons.size() == 2);
  assert(match.reasons[0] == "Similar content (71% match)");
  assert(match.reasons[1] == "Created within 24 hours");
}

void TestMergeDuplicateNotes() {
  auto  rt      = MakeRuntime();
  auto& content = *rt.content_service;

  auto primary   = content.CreateNote(MakeNote("The airline food joke about peanuts", {"food"}));
  auto duplicate = MakeNote("The airline food joke about pretzels", {"travel", "food"});
  auto* attachment = duplicate.add_attachments();
  attachment->set_id("img-1");
  attachment->set_type("image");
  attachment->set_filename("tray.jpg");
  auto dup = content.CreateNote(duplicate);

  auto merged = rt.organization_service->MergeDuplicateNotes(primary->id(), {dup->id()});
  assert(merged.ok());
  assert(merged->tags_size() == 2);
  assert(merged->tags(0) == "food" && merged->tags(1) == "travel");
  assert(merged->attachments_size() == 1);
  assert(merged->content() ==
         "The airline food joke about peanuts\n\n--- Merged from duplicate ---\nThe airline food joke about pretzels");
  assert(!content.GetNote(dup->id()).has_value());
  assert(content.ListNotes().size() == 1);

  auto missing = rt.organization_service->MergeDuplicateNotes(gigbook::util::NewId(), {});
  assert(missing.code() == ErrorCode::NotFound);
}

void TestSimilarityHelpers() {
  assert(OrganizationService::TextSimilarity("", "") == 0.0);
  assert(OrganizationService::TextSimilarity("The Cat sat", "the cat SAT") == 1.0);
  assert(OrganizationService::EstimateDuration("short") == 10.0);

  std::string long_text;
  for (int i = 0; i < 300; ++i) long_text += "word ";
  assert(OrganizationService::EstimateDuration(long_text) == 120.0);

  auto a = MakeNote("same words here", {"x"});
  auto b = MakeNote("same words here", {"X"});
  assert(std::abs(OrganizationService::NoteSimilarity(a, b) - 1.0) < 1e-9);
}

} // namespace

int main() {
  TestExportClearImportRestoresEverything();
  TestReimportWithSkipDuplicates();
  TestBadRowsAreReportedAndOthersImported();
  TestMalformedJsonIsValidationFailure();
  TestCsvExportQuotesSpecialFields();
  TestCsvExportOtherKinds();
  TestDetectDuplicatesAndReasons();
  TestMergeDuplicateNotes();
  TestSimilarityHelpers();

  std::cout << "gigbook_unit_organization_service: pass\n";
  return 0;
}
