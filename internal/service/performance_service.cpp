#include "performance_service.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/core/entity_store.hpp"
#include "observe.hpp"

namespace gigbook::service {

using core::collections::kPerformances;
using core::collections::kRehearsalSessions;
using core::collections::kVenues;

namespace {

core::ListOptions SortedBy(std::string field, core::SortOrder order) {
  core::ListOptions options;
  options.sort_by = std::move(field);
  options.sort_order = order;
  return options;
}

google::protobuf::FieldMask HistoryMask() {
  google::protobuf::FieldMask mask;
  mask.add_paths("performance_history");
  return mask;
}

v1::VenuePerformance Summarize(const v1::Performance& performance) {
  v1::VenuePerformance entry;
  entry.set_id(performance.id());
  entry.set_set_list_id(performance.set_list_id());
  *entry.mutable_date() = performance.date();
  entry.set_duration(performance.has_actual_duration() ? performance.actual_duration() : 0.0);
  if (performance.has_feedback()) {
    if (performance.feedback().has_audience_size()) entry.set_audience_size(performance.feedback().audience_size());
    entry.set_rating(performance.feedback().rating());
  }
  if (performance.has_notes()) entry.set_notes(performance.notes());
  *entry.mutable_created_at() = performance.created_at();
  return entry;
}

} // namespace

PerformanceService::PerformanceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store) throw std::invalid_argument("PerformanceService requires an entity store");
}

core::ListOptions PerformanceService::DefaultVenueListOptions() {
  return SortedBy("name", core::SortOrder::kAscending);
}

core::ListOptions PerformanceService::DefaultRehearsalListOptions() {
  return SortedBy("startTime", core::SortOrder::kDescending);
}

core::ListOptions PerformanceService::DefaultPerformanceListOptions() {
  return SortedBy("date", core::SortOrder::kDescending);
}

// ------------------------------------------------------------------
// Venues
// ------------------------------------------------------------------

util::Outcome<v1::Venue> PerformanceService::CreateVenue(v1::Venue venue) {
  return Observe("PerformanceService.CreateVenue", [&] { return ctx_.store->Create(kVenues, std::move(venue)); });
}

std::optional<v1::Venue> PerformanceService::GetVenue(const std::string& id) {
  return ctx_.store->Read(kVenues, id);
}

util::Outcome<v1::Venue> PerformanceService::UpdateVenue(const std::string& id, const v1::Venue& patch, const google::protobuf::FieldMask& mask) {
  return Observe("PerformanceService.UpdateVenue", [&] { return ctx_.store->Update(kVenues, id, patch, mask); });
}

void PerformanceService::DeleteVenue(const std::string& id) {
  ctx_.store->Delete(kVenues, id);
}

std::vector<v1::Venue> PerformanceService::ListVenues(const core::ListOptions& options) {
  return ctx_.store->List(kVenues, options);
}

// ------------------------------------------------------------------
// Rehearsal sessions
// ------------------------------------------------------------------

util::Outcome<v1::RehearsalSession> PerformanceService::CreateRehearsalSession(v1::RehearsalSession session) {
  return Observe("PerformanceService.CreateRehearsalSession", [&] { return ctx_.store->Create(kRehearsalSessions, std::move(session)); });
}

std::optional<v1::RehearsalSession> PerformanceService::GetRehearsalSession(const std::string& id) {
  return ctx_.store->Read(kRehearsalSessions, id);
}

util::Outcome<v1::RehearsalSession> PerformanceService::UpdateRehearsalSession(const std::string& id, const v1::RehearsalSession& patch,
                                                                               const google::protobuf::FieldMask& mask) {
  return Observe("PerformanceService.UpdateRehearsalSession", [&] { return ctx_.store->Update(kRehearsalSessions, id, patch, mask); });
}

void PerformanceService::DeleteRehearsalSession(const std::string& id) {
  ctx_.store->Delete(kRehearsalSessions, id);
}

std::vector<v1::RehearsalSession> PerformanceService::ListRehearsalSessions(const core::ListOptions& options) {
  return ctx_.store->List(kRehearsalSessions, options);
}

// ------------------------------------------------------------------
// Performances
// ------------------------------------------------------------------

util::Outcome<v1::Performance> PerformanceService::CreatePerformance(v1::Performance performance) {
  if (performance.status().empty()) performance.set_status("scheduled");
  return Observe("PerformanceService.CreatePerformance", [&] { return ctx_.store->Create(kPerformances, std::move(performance)); });
}

std::optional<v1::Performance> PerformanceService::GetPerformance(const std::string& id) {
  return ctx_.store->Read(kPerformances, id);
}

util::Outcome<v1::Performance> PerformanceService::UpdatePerformance(const std::string& id, const v1::Performance& patch,
                                                                     const google::protobuf::FieldMask& mask) {
  return Observe("PerformanceService.UpdatePerformance", [&] { return ctx_.store->Update(kPerformances, id, patch, mask); });
}

void PerformanceService::DeletePerformance(const std::string& id) {
  ctx_.store->Delete(kPerformances, id);
}

std::vector<v1::Performance> PerformanceService::ListPerformances(const core::ListOptions& options) {
  return ctx_.store->List(kPerformances, options);
}

// ------------------------------------------------------------------
// Venue history
// ------------------------------------------------------------------

db::Result PerformanceService::LinkPerformanceToVenue(const std::string& performance_id, const std::string& venue_id) {
  return Observe("PerformanceService.LinkPerformanceToVenue", [&] {
    auto performance = ctx_.store->Read(kPerformances, performance_id);
    auto venue = ctx_.store->Read(kVenues, venue_id);
    if (!performance || !venue) {
      return db::Result::Err(db::ErrorCode::NotFound, "performance or venue not found");
    }

    const auto& history = venue->performance_history();
    bool linked = std::any_of(history.begin(), history.end(), [&](const v1::VenuePerformance& p) { return p.id() == performance_id; });
    if (linked) return db::Result::Ok();

    *venue->add_performance_history() = Summarize(*performance);
    auto updated = ctx_.store->Update(kVenues, venue_id, *venue, HistoryMask());
    if (!updated) return db::Result::Err(updated.code(), updated.message());
    return db::Result::Ok();
  });
}

db::Result PerformanceService::UnlinkPerformanceFromVenue(const std::string& performance_id, const std::string& venue_id) {
  return Observe("PerformanceService.UnlinkPerformanceFromVenue", [&] {
    auto venue = ctx_.store->Read(kVenues, venue_id);
    if (!venue) return db::Result::Err(db::ErrorCode::NotFound, "venue not found");

    auto* history = venue->mutable_performance_history();
    auto removed = std::remove_if(history->begin(), history->end(), [&](const v1::VenuePerformance& p) { return p.id() == performance_id; });
    if (removed == history->end()) return db::Result::Ok();
    history->erase(removed, history->end());

    auto updated = ctx_.store->Update(kVenues, venue_id, *venue, HistoryMask());
    if (!updated) return db::Result::Err(updated.code(), updated.message());
    return db::Result::Ok();
  });
}

} // namespace gigbook::service
