#pragma once

#include <google/protobuf/field_mask.pb.h>

#include <optional>
#include <string>
#include <vector>

#include "gigbook/v1.hpp"
#include "internal/core/query.hpp"
#include "internal/db/api/result.hpp"
#include "internal/util/outcome.hpp"
#include "service_context.hpp"

namespace gigbook::service {

/*
  Venues, rehearsal sessions and performances.
*/
class PerformanceService {
public:
  explicit PerformanceService(ServiceContext ctx);

  // Venues, name ascending by default
  util::Outcome<v1::Venue> CreateVenue(v1::Venue venue);
  std::optional<v1::Venue> GetVenue(const std::string& id);
  util::Outcome<v1::Venue> UpdateVenue(const std::string& id, const v1::Venue& patch, const google::protobuf::FieldMask& mask);
  void DeleteVenue(const std::string& id);
  std::vector<v1::Venue> ListVenues(const core::ListOptions& options = DefaultVenueListOptions());
  static core::ListOptions DefaultVenueListOptions();

  // Rehearsal sessions, latest start first by default
  util::Outcome<v1::RehearsalSession> CreateRehearsalSession(v1::RehearsalSession session);
  std::optional<v1::RehearsalSession> GetRehearsalSession(const std::string& id);
  util::Outcome<v1::RehearsalSession> UpdateRehearsalSession(const std::string& id, const v1::RehearsalSession& patch,
                                                             const google::protobuf::FieldMask& mask);
  void DeleteRehearsalSession(const std::string& id);
  std::vector<v1::RehearsalSession> ListRehearsalSessions(const core::ListOptions& options = DefaultRehearsalListOptions());
  static core::ListOptions DefaultRehearsalListOptions();

  // Performances, latest date first by default. Status defaults to "scheduled".
  util::Outcome<v1::Performance> CreatePerformance(v1::Performance performance);
  std::optional<v1::Performance> GetPerformance(const std::string& id);
  util::Outcome<v1::Performance> UpdatePerformance(const std::string& id, const v1::Performance& patch, const google::protobuf::FieldMask& mask);
  void DeletePerformance(const std::string& id);
  std::vector<v1::Performance> ListPerformances(const core::ListOptions& options = DefaultPerformanceListOptions());
  static core::ListOptions DefaultPerformanceListOptions();

  /*
    Adds a summary of the performance to the venue's history. Linking an
    already linked performance is a no-op. Read-modify-write on the venue,
    with the same lost-update caveat as contact lists.
  */
  db::Result LinkPerformanceToVenue(const std::string& performance_id, const std::string& venue_id);
  db::Result UnlinkPerformanceFromVenue(const std::string& performance_id, const std::string& venue_id);

private:
  ServiceContext ctx_;
};

}
