#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/telemetry_client.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/file_order.hpp"
#include "internal/storage/event_store.hpp"
#include "internal/upload/upload_worker.hpp"
#include "internal/util/time.hpp"

using crumbtrail::factory::Application;
using crumbtrail::factory::BuildOptions;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  crumbtrailctl --config <config.yaml> status\n"
            << "  crumbtrailctl --config <config.yaml> flush\n"
            << "  crumbtrailctl --config <config.yaml> prune\n"
            << "  crumbtrailctl --config <config.yaml> track <name> [tag=value ...] [field:=number ...]\n"
            << "  crumbtrailctl --config <config.yaml> run\n";
}

static void PrintKind(const char* label, std::vector<std::filesystem::path> files) {
  crumbtrail::storage::common::SortChronologically(files);
  std::cout << label << ": " << files.size();
  if (!files.empty()) {
    std::cout << " (oldest " << files.front().filename().string() << ", newest " << files.back().filename().string() << ")";
  }
  std::cout << "\n";
}

static int Status(Application& app) {
  std::cout << "root: " << app.store->Root().string() << "\n";
  PrintKind("events", app.store->ListEventFiles());
  PrintKind("crashes", app.store->ListCrashFiles());
  return 0;
}

static int Flush(Application& app) {
  auto result = app.client->Flush();
  std::cout << "crashes: sent=" << result.crashes.records_sent << " pending=" << result.crashes.records_pending
            << " corrupted=" << result.crashes.skipped_corrupted << "\n";
  std::cout << "events: sent=" << result.events.records_sent << " pending=" << result.events.records_pending
            << " corrupted=" << result.events.skipped_corrupted << "\n";
  return result ? 0 : 3;
}

static int Prune(Application& app, const crumbtrail::runtime::config::RuntimeConfig& config) {
  crumbtrail::storage::RetentionPolicy policy;
  policy.max_age   = std::chrono::seconds(config.storage().retention().max_age_sec());
  policy.max_files = static_cast<std::size_t>(config.storage().retention().max_files());

  auto removed = app.store->Prune(policy, crumbtrail::util::Now());
  std::cout << "removed: " << removed << "\n";
  return 0;
}

static int Track(Application& app, int argc, char** argv, int first) {
  if (first >= argc) {
    Usage();
    return 1;
  }

  std::string                        name = argv[first];
  std::map<std::string, std::string> tags;
  std::map<std::string, double>      fields;

  for (int i = first + 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (auto pos = arg.find(":="); pos != std::string::npos && pos > 0) {
      try {
        fields[arg.substr(0, pos)] = std::stod(arg.substr(pos + 2));
      } catch (const std::exception&) {
        std::cerr << "invalid number in '" << arg << "'\n";
        return 1;
      }
    } else if (auto eq = arg.find('='); eq != std::string::npos && eq > 0) {
      tags[arg.substr(0, eq)] = arg.substr(eq + 1);
    } else {
      std::cerr << "expected tag=value or field:=number, got '" << arg << "'\n";
      return 1;
    }
  }

  auto path = app.client->TrackEvent(name, tags, fields);
  std::cout << path.string() << "\n";
  return 0;
}

static int Run(Application& app) {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  app.worker->Start();
  app.worker->TriggerNow();
  CRUMBTRAIL_LOG_INFO("crumbtrailctl running", {crumbtrail::observability::StringField("session_id", app.client->SessionId())});

  while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

  CRUMBTRAIL_LOG_INFO("Shutting down upload worker");
  app.Shutdown();
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  try {
    auto config = crumbtrail::config::ConfigLoader::LoadFromYaml(config_path);
    crumbtrail::observability::InitializeLogging(config);

    BuildOptions options;
    options.start_upload_worker    = false;
    options.install_terminate_hook = (cmd == "run");

    auto app = crumbtrail::factory::Build(config, options);

    int rc = 1;
    if (cmd == "status") {
      rc = Status(*app);
    } else if (cmd == "flush") {
      rc = Flush(*app);
    } else if (cmd == "prune") {
      rc = Prune(*app, config);
    } else if (cmd == "track") {
      rc = Track(*app, argc, argv, 4);
    } else if (cmd == "run") {
      rc = Run(*app);
    } else {
      Usage();
    }

    app.reset();
    crumbtrail::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    CRUMBTRAIL_LOG_ERROR("Fatal error", {crumbtrail::observability::StringField("error", e.what())});
    crumbtrail::observability::ShutdownLogging();
    return 2;
  }
}
