#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/json_codec.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using gigbook::factory::BuildRuntime;

static void Usage() {
  std::cout << "Usage:\n"
            << "  gigbookctl [--config <config.yaml>] export-json [path]\n"
            << "  gigbookctl [--config <config.yaml>] export-csv <notes|setlists|venues|contacts>\n"
            << "  gigbookctl [--config <config.yaml>] import-json <path> [--skip-duplicates] [--threshold <x>]\n"
            << "  gigbookctl [--config <config.yaml>] sync-queue\n"
            << "  gigbookctl [--config <config.yaml>] sync-ack <operation_id>\n"
            << "  gigbookctl [--config <config.yaml>] sync-clear\n"
            << "  gigbookctl [--config <config.yaml>] search <text>\n"
            << "  gigbookctl [--config <config.yaml>] duplicates [threshold]\n"
            << "  gigbookctl [--config <config.yaml>] schema-versions\n"
            << "  gigbookctl [--config <config.yaml>] clear-all\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

static void WriteOutput(const std::string& text, const std::string& path) {
  if (path.empty()) {
    std::cout << text << "\n";
    return;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("cannot write " + path);
  out << text;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    gigbook::runtime::config::RuntimeConfig config;
    if (config_path.empty()) {
      gigbook::config::ConfigLoader::ApplyDefaults(config);
    } else {
      config = gigbook::config::ConfigLoader::LoadFromYaml(config_path);
    }
    gigbook::observability::InitializeLogging(config);

    auto runtime = BuildRuntime(config);

    // ------------------------------------------------------------

    if (cmd == "export-json") {
      WriteOutput(runtime.organization_service->ExportToJson(), args.size() >= 2 ? args[1] : "");

    } else if (cmd == "export-csv") {
      if (args.size() < 2) {
        Usage();
        return 1;
      }
      auto kind = gigbook::service::CsvKindFromName(args[1]);
      if (!kind) {
        std::cerr << "unsupported export type: " << args[1] << "\n";
        return 1;
      }
      WriteOutput(runtime.organization_service->ExportToCsv(*kind), "");

    } else if (cmd == "import-json") {
      if (args.size() < 2) {
        Usage();
        return 1;
      }
      gigbook::service::ImportOptions options;
      for (size_t i = 2; i < args.size(); ++i) {
        if (args[i] == "--skip-duplicates") {
          options.skip_duplicates = true;
        } else if (args[i] == "--threshold" && i + 1 < args.size()) {
          options.similarity_threshold = std::stod(args[++i]);
        } else {
          std::cerr << "unknown option: " << args[i] << "\n";
          return 1;
        }
      }

      auto result = runtime.organization_service->ImportFromJson(ReadFile(args[1]), options);
      if (!result) {
        std::cerr << result.message() << "\n";
        return 1;
      }
      std::cout << "notes=" << result->notes << " setlists=" << result->setlists << " venues=" << result->venues
                << " contacts=" << result->contacts << " duplicates_skipped=" << result->duplicates_skipped << "\n";
      for (const auto& error : result->errors) std::cerr << error << "\n";
      return result->success ? 0 : 1;

    } else if (cmd == "sync-queue") {
      for (const auto& op : runtime.admin_service->SyncQueue()) {
        std::cout << gigbook::core::ToJson(op) << "\n";
      }

    } else if (cmd == "sync-ack") {
      if (args.size() < 2) {
        Usage();
        return 1;
      }
      runtime.admin_service->AcknowledgeSyncOperation(args[1]);

    } else if (cmd == "sync-clear") {
      runtime.admin_service->ClearSyncQueue();

    } else if (cmd == "search") {
      if (args.size() < 2) {
        Usage();
        return 1;
      }
      auto results = runtime.content_service->GlobalSearch(args[1]);
      for (const auto& n : results.notes) std::cout << "note\t" << n.id() << "\t" << n.content() << "\n";
      for (const auto& s : results.setlists) std::cout << "setlist\t" << s.id() << "\t" << s.name() << "\n";
      for (const auto& v : results.venues) std::cout << "venue\t" << v.id() << "\t" << v.name() << "\n";
      for (const auto& c : results.contacts) std::cout << "contact\t" << c.id() << "\t" << c.name() << "\n";
      for (const auto& p : results.performances) std::cout << "performance\t" << p.id() << "\t" << p.notes() << "\n";

    } else if (cmd == "duplicates") {
      double threshold = args.size() >= 2 ? std::stod(args[1]) : 0.8;
      for (const auto& group : runtime.organization_service->DetectDuplicates(threshold)) {
        std::cout << group.original.id() << "\n";
        for (const auto& match : group.duplicates) {
          std::cout << "  " << match.note.id() << " " << match.similarity;
          for (const auto& reason : match.reasons) std::cout << " [" << reason << "]";
          std::cout << "\n";
        }
      }

    } else if (cmd == "schema-versions") {
      for (const auto& record : runtime.admin_service->SchemaVersions()) {
        std::cout << gigbook::model::TableName(record.collection) << "\t" << record.version << "\n";
      }

    } else if (cmd == "clear-all") {
      runtime.admin_service->ClearAllData();

    } else {
      Usage();
      return 1;
    }

    gigbook::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    GIGBOOK_LOG_ERROR("Fatal error", {gigbook::observability::StringField("command", cmd), gigbook::observability::StringField("error", e.what())});
    gigbook::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
