#include <filesystem>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/time.hpp"

namespace {

gigbook::v1::Note Bit(const std::string& content, double seconds) {
  gigbook::v1::Note note;
  note.set_content(content);
  note.set_capture_method("text");
  note.mutable_metadata()->set_duration(seconds);
  note.add_tags("quickstart");
  return note;
}

} // namespace

int main(int argc, char** argv) {
  // With a directory argument the data lands in sqlite + disk blobs there;
  // without one everything stays in memory.
  gigbook::runtime::config::RuntimeConfig config;
  if (argc > 1) {
    const std::filesystem::path dir = argv[1];
    std::filesystem::create_directories(dir);
    config.mutable_database()->mutable_sqlite()->set_path((dir / "gigbook.db").string());
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
    config.mutable_blobs()->mutable_disk()->set_root_path((dir / "blobs").string());
  }
  gigbook::config::ConfigLoader::ApplyDefaults(config);

  auto rt = gigbook::factory::BuildRuntime(config);

  auto opener = rt.content_service->CreateNote(Bit("Open with the airport security bit", 240));
  auto closer = rt.content_service->CreateNote(Bit("Close on the cat owner callback", 180));
  if (!opener.ok() || !closer.ok()) {
    std::cerr << "CreateNote failed: " << (opener.ok() ? closer.message() : opener.message()) << '\n';
    return 1;
  }

  gigbook::v1::SetList setlist;
  setlist.set_name("Friday late show");
  *setlist.add_notes() = *opener;
  *setlist.add_notes() = *closer;
  auto created_set = rt.content_service->CreateSetList(setlist);
  if (!created_set.ok()) {
    std::cerr << "CreateSetList failed: " << created_set.message() << '\n';
    return 1;
  }
  std::cout << "set list " << created_set->id() << " runs " << created_set->total_duration() << "s\n";

  gigbook::v1::Venue venue;
  venue.set_name("Blue Moon");
  venue.set_location("Bergen");
  venue.mutable_characteristics()->set_acoustics("good");
  venue.mutable_characteristics()->set_lighting("basic");
  auto created_venue = rt.performance_service->CreateVenue(venue);
  if (!created_venue.ok()) {
    std::cerr << "CreateVenue failed: " << created_venue.message() << '\n';
    return 1;
  }

  gigbook::v1::Performance performance;
  performance.set_set_list_id(created_set->id());
  performance.set_venue_id(created_venue->id());
  *performance.mutable_date() = gigbook::util::NowProto();
  auto created_performance = rt.performance_service->CreatePerformance(performance);
  if (!created_performance.ok()) {
    std::cerr << "CreatePerformance failed: " << created_performance.message() << '\n';
    return 1;
  }

  auto linked = rt.performance_service->LinkPerformanceToVenue(created_performance->id(), created_venue->id());
  if (!linked) {
    std::cerr << "LinkPerformanceToVenue failed: " << linked.message << '\n';
    return 1;
  }

  auto results = rt.content_service->GlobalSearch("cat");
  std::cout << "search 'cat': " << results.notes.size() << " note(s)\n";

  // Everything above is waiting in the outbox for a sync collaborator.
  for (const auto& op : rt.admin_service->SyncQueue()) {
    std::cout << "  pending " << gigbook::v1::SyncOperationType_Name(op.type()) << " " << op.table() << "/" << op.item_id() << '\n';
  }

  std::cout << rt.organization_service->ExportToJson() << '\n';
  return 0;
}
