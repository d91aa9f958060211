#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/validation/validators.hpp"

namespace {

using gigbook::validation::Describe;
using gigbook::validation::Validate;
using gigbook::validation::ValidationErrors;

bool HasPath(const ValidationErrors& errors, const std::string& path) {
  for (const auto& e : errors) {
    if (e.path == path) return true;
  }
  return false;
}

template <typename T>
void Stamp(T& entity) {
  entity.set_id(gigbook::util::NewId());
  *entity.mutable_created_at() = gigbook::util::NowProto();
  *entity.mutable_updated_at() = entity.created_at();
}

gigbook::v1::Note ValidNote() {
  gigbook::v1::Note note;
  Stamp(note);
  note.set_content("Airline food bit");
  note.set_capture_method("text");
  note.add_tags("travel");
  return note;
}

void TestValidNotePasses() {
  auto errors = Validate(ValidNote());
  assert(errors.empty());
}

void TestNoteFieldErrorsCarryPaths() {
  auto note = ValidNote();
  note.set_content("");
  note.set_capture_method("telepathy");
  note.add_tags(std::string(51, 'x'));
  note.mutable_metadata()->set_confidence(1.5);

  auto errors = Validate(note);
  assert(HasPath(errors, "content"));
  assert(HasPath(errors, "captureMethod"));
  assert(HasPath(errors, "tags[1]"));
  assert(HasPath(errors, "metadata.confidence"));
  assert(Describe(errors).find("content: is required") != std::string::npos);
}

void TestEnvelopeRequiresUuidAndOrderedTimestamps() {
  auto note = ValidNote();
  note.set_id("not-a-uuid");
  *note.mutable_updated_at() = gigbook::util::FromUnixMillis(gigbook::util::ToUnixMillis(note.created_at()) - 1000);
  note.set_version(0);

  auto errors = Validate(note);
  assert(HasPath(errors, "id"));
  assert(HasPath(errors, "updatedAt"));
  assert(HasPath(errors, "version"));
}

void TestContentLengthCountsCodePoints() {
  auto note = ValidNote();
  std::string content;
  for (int i = 0; i < 10000; ++i) content += "é";
  note.set_content(content);
  assert(Validate(note).empty());

  note.set_content(content + "é");
  assert(HasPath(Validate(note), "content"));
}

void TestSetListValidatesMemberNotes() {
  gigbook::v1::SetList setlist;
  Stamp(setlist);
  setlist.set_name("Friday");
  auto* member = setlist.add_notes();
  *member      = ValidNote();
  member->set_content("");

  auto errors = Validate(setlist);
  assert(HasPath(errors, "notes[0].content"));
}

void TestVenueRequiresKnownCharacteristics() {
  gigbook::v1::Venue venue;
  Stamp(venue);
  venue.set_name("Cellar");
  venue.set_location("Oslo");
  venue.mutable_characteristics()->set_acoustics("good");
  venue.mutable_characteristics()->set_lighting("basic");
  assert(Validate(venue).empty());

  venue.mutable_characteristics()->set_lighting("disco");
  venue.add_contacts("nope");
  auto errors = Validate(venue);
  assert(HasPath(errors, "characteristics.lighting"));
  assert(HasPath(errors, "contacts[0]"));
}

void TestContactEmailAndPhoneFormats() {
  gigbook::v1::Contact contact;
  Stamp(contact);
  contact.set_name("Sam");
  contact.set_role("booker");
  contact.mutable_contact_info()->set_email("sam@example.com");
  contact.mutable_contact_info()->set_phone("+47 123 45 678");
  assert(Validate(contact).empty());

  contact.mutable_contact_info()->set_email("sam@example");
  contact.mutable_contact_info()->set_phone("call me");
  auto errors = Validate(contact);
  assert(HasPath(errors, "contactInfo.email"));
  assert(HasPath(errors, "contactInfo.phone"));

  assert(gigbook::validation::IsEmail("a.b@c.io"));
  assert(!gigbook::validation::IsEmail("a@b@c.io"));
  assert(!gigbook::validation::IsEmail("a b@c.io"));
}

void TestPerformanceStatusAndReferences() {
  gigbook::v1::Performance performance;
  Stamp(performance);
  performance.set_set_list_id(gigbook::util::NewId());
  performance.set_venue_id(gigbook::util::NewId());
  *performance.mutable_date() = gigbook::util::NowProto();
  performance.set_status("scheduled");
  assert(Validate(performance).empty());

  performance.set_status("postponed");
  performance.mutable_feedback()->set_rating(9);
  auto errors = Validate(performance);
  assert(HasPath(errors, "status"));
  assert(HasPath(errors, "feedback.rating"));
}

void TestRehearsalEndMayNotPrecedeStart() {
  gigbook::v1::RehearsalSession session;
  Stamp(session);
  session.set_set_list_id(gigbook::util::NewId());
  *session.mutable_start_time() = gigbook::util::FromUnixMillis(2'000'000);
  *session.mutable_end_time()   = gigbook::util::FromUnixMillis(1'000'000);

  assert(HasPath(Validate(session), "endTime"));
}

} // namespace

int main() {
  TestValidNotePasses();
  TestNoteFieldErrorsCarryPaths();
  TestEnvelopeRequiresUuidAndOrderedTimestamps();
  TestContentLengthCountsCodePoints();
  TestSetListValidatesMemberNotes();
  TestVenueRequiresKnownCharacteristics();
  TestContactEmailAndPhoneFormats();
  TestPerformanceStatusAndReferences();
  TestRehearsalEndMayNotPrecedeStart();

  std::cout << "gigbook_unit_validators: pass\n";
  return 0;
}
