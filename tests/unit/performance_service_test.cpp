#include <cassert>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
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

gigbook::v1::Venue MakeVenue(const std::string& name) {
  gigbook::v1::Venue venue;
  venue.set_name(name);
  venue.set_location("Trondheim");
  venue.mutable_characteristics()->set_audience_size(120);
  venue.mutable_characteristics()->set_audience_type("students");
  venue.mutable_characteristics()->set_acoustics("good");
  venue.mutable_characteristics()->set_lighting("professional");
  return venue;
}

gigbook::v1::Performance MakePerformance(const std::string& venue_id, int64_t date_ms) {
  gigbook::v1::Performance performance;
  performance.set_set_list_id(gigbook::util::NewId());
  performance.set_venue_id(venue_id);
  *performance.mutable_date() = gigbook::util::FromUnixMillis(date_ms);
  return performance;
}

void TestPerformanceDefaultsToScheduledAndSortsByDate() {
  auto  rt  = MakeRuntime();
  auto& svc = *rt.performance_service;

  auto venue = svc.CreateVenue(MakeVenue("Blæst"));
  assert(venue.ok());

  auto older = svc.CreatePerformance(MakePerformance(venue->id(), 1'000'000));
  auto newer = svc.CreatePerformance(MakePerformance(venue->id(), 9'000'000));
  assert(older.ok() && newer.ok());
  assert(older->status() == "scheduled");

  auto listed = svc.ListPerformances();
  assert(listed.size() == 2);
  assert(listed[0].id() == newer->id());

  gigbook::v1::Performance patch;
  patch.set_status("completed");
  patch.set_actual_duration(1800);
  google::protobuf::FieldMask mask;
  mask.add_paths("status");
  mask.add_paths("actual_duration");
  auto updated = svc.UpdatePerformance(older->id(), patch, mask);
  assert(updated.ok());
  assert(updated->status() == "completed");

  patch.set_status("postponed");
  assert(svc.UpdatePerformance(older->id(), patch, mask).code() == ErrorCode::ValidationFailure);
}

void TestLinkIsIdempotentAndUnlinkRemoves() {
  auto  rt  = MakeRuntime();
  auto& svc = *rt.performance_service;

  auto venue       = svc.CreateVenue(MakeVenue("Studentersamfundet"));
  auto performance = MakePerformance(venue->id(), 5'000'000);
  performance.set_actual_duration(2400);
  performance.set_notes("tight set");
  auto created = svc.CreatePerformance(performance);
  assert(created.ok());

  assert(svc.LinkPerformanceToVenue(created->id(), venue->id()));
  assert(svc.LinkPerformanceToVenue(created->id(), venue->id()));

  auto linked = svc.GetVenue(venue->id());
  assert(linked->performance_history_size() == 1);
  assert(linked->performance_history(0).id() == created->id());
  assert(linked->performance_history(0).duration() == 2400);
  assert(linked->performance_history(0).notes() == "tight set");

  assert(svc.UnlinkPerformanceFromVenue(created->id(), venue->id()));
  assert(svc.GetVenue(venue->id())->performance_history_size() == 0);
  assert(svc.UnlinkPerformanceFromVenue(created->id(), venue->id()));
}

void TestLinkMissingEntitiesIsNotFound() {
  auto  rt  = MakeRuntime();
  auto& svc = *rt.performance_service;

  auto venue  = svc.CreateVenue(MakeVenue("Olympen"));
  auto result = svc.LinkPerformanceToVenue(gigbook::util::NewId(), venue->id());
  assert(result.code == ErrorCode::NotFound);
  assert(result.message == "performance or venue not found");

  auto unlink = svc.UnlinkPerformanceFromVenue(gigbook::util::NewId(), gigbook::util::NewId());
  assert(unlink.code == ErrorCode::NotFound);
  assert(unlink.message == "venue not found");
}

void TestVenuesSortByNameAndRehearsalsByStart() {
  auto  rt  = MakeRuntime();
  auto& svc = *rt.performance_service;

  svc.CreateVenue(MakeVenue("Rockefeller"));
  svc.CreateVenue(MakeVenue("Cosmopolite"));
  auto venues = svc.ListVenues();
  assert(venues.size() == 2);
  assert(venues[0].name() == "Cosmopolite");

  const auto set_list_id = gigbook::util::NewId();
  for (int64_t start : {2'000'000, 7'000'000, 4'000'000}) {
    gigbook::v1::RehearsalSession session;
    session.set_set_list_id(set_list_id);
    *session.mutable_start_time() = gigbook::util::FromUnixMillis(start);
    assert(svc.CreateRehearsalSession(session).ok());
  }

  auto sessions = svc.ListRehearsalSessions();
  assert(sessions.size() == 3);
  assert(gigbook::util::ToUnixMillis(sessions[0].start_time()) == 7'000'000);
  assert(gigbook::util::ToUnixMillis(sessions[2].start_time()) == 2'000'000);

  gigbook::v1::RehearsalSession progress;
  progress.set_current_note_index(3);
  progress.set_is_completed(true);
  google::protobuf::FieldMask mask;
  mask.add_paths("current_note_index");
  mask.add_paths("is_completed");
  auto updated = svc.UpdateRehearsalSession(sessions[0].id(), progress, mask);
  assert(updated.ok());
  assert(updated->current_note_index() == 3);
  assert(updated->is_completed());

  svc.DeleteRehearsalSession(sessions[0].id());
  assert(!svc.GetRehearsalSession(sessions[0].id()).has_value());
  assert(svc.ListRehearsalSessions().size() == 2);
}

void TestVenueValidation() {
  auto rt    = MakeRuntime();
  auto venue = MakeVenue("Bad");
  venue.mutable_characteristics()->set_acoustics("echoey");
  assert(rt.performance_service->CreateVenue(venue).code() == ErrorCode::ValidationFailure);
}

} // namespace

int main() {
  TestPerformanceDefaultsToScheduledAndSortsByDate();
  TestLinkIsIdempotentAndUnlinkRemoves();
  TestLinkMissingEntitiesIsNotFound();
  TestVenuesSortByNameAndRehearsalsByStart();
  TestVenueValidation();

  std::cout << "gigbook_unit_performance_service: pass\n";
  return 0;
}
