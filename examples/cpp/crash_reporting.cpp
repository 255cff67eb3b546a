#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/telemetry_client.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

namespace {

void ParseOrder(const std::string& raw) {
  try {
    (void)std::stoi(raw);
  } catch (...) {
    std::throw_with_nested(std::runtime_error("cannot parse order id '" + raw + "'"));
  }
}

} // namespace

int main(int argc, char** argv) {
  // Usage: crumbtrail_example_crash_reporting [collector_url] [--crash]
  const std::string base_url = argc > 1 ? argv[1] : "http://localhost:8080";
  const bool        crash    = argc > 2 && std::string(argv[2]) == "--crash";

  crumbtrail::runtime::config::RuntimeConfig config;
  config.mutable_collector()->set_base_url(base_url);
  config.mutable_storage()->set_root_path("/tmp/crumbtrail-example");
  config.mutable_app()->set_package_name("com.example.checkout");
  config.mutable_app()->set_app_version(1);
  crumbtrail::config::ConfigLoader::ApplyDefaults(&config);
  crumbtrail::observability::InitializeLogging(config);

  crumbtrail::factory::BuildOptions options;
  options.start_upload_worker = false;
  auto app                    = crumbtrail::factory::Build(config, options);
  auto client                 = app->client;

  client->LeaveBreadcrumb("opened cart", crumbtrail::model::BreadcrumbCategory::kNavigation);
  client->TrackEvent("cart_viewed", {{"source", "example"}}, {{"items", 3}});
  client->LeaveBreadcrumb("tapped checkout", crumbtrail::model::BreadcrumbCategory::kUserAction);

  // A handled failure is recorded as a non-fatal report and the program goes on.
  try {
    ParseOrder("A-17");
  } catch (...) {
    client->TrackException(std::current_exception(), {{"screen", "checkout"}});
  }

  if (crash) {
    // Recorded as a fatal report by the terminate hook, then the process aborts.
    ParseOrder("still-not-a-number");
  }

  auto result = client->Flush();
  std::cout << "uploaded crashes=" << result.crashes.records_sent << " events=" << result.events.records_sent
            << (result ? "" : " (collector unreachable, records kept for next run)") << '\n';

  app.reset();
  crumbtrail::observability::ShutdownLogging();
  return EXIT_SUCCESS;
}
