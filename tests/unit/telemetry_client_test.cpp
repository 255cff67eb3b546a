#include "internal/core/telemetry_client.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"
#include "internal/breadcrumbs/breadcrumb_buffer.hpp"
#include "internal/crash/terminate_hook.hpp"
#include "internal/factory.hpp"
#include "internal/session/session.hpp"
#include "internal/storage/event_store.hpp"
#include "internal/transport/api_client.hpp"
#include "tests/unit/fake_http_transport.hpp"

namespace {

using crumbtrail::breadcrumbs::BreadcrumbBuffer;
using crumbtrail::core::TelemetryClient;
using crumbtrail::model::BreadcrumbCategory;
using crumbtrail::session::Session;
using crumbtrail::storage::EventStore;
using crumbtrail::testing::FakeHttpTransport;

std::filesystem::path FreshRoot(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "crumbtrail_telemetry_client_tests" / test_name;
  std::filesystem::remove_all(root);
  return root;
}

struct Fixture {
  std::shared_ptr<EventStore>        store;
  std::shared_ptr<BreadcrumbBuffer>  breadcrumbs;
  std::shared_ptr<Session>           session;
  std::shared_ptr<FakeHttpTransport> transport;
  std::shared_ptr<TelemetryClient>   client;
};

Fixture MakeFixture(const std::string& test_name) {
  Fixture f;
  f.store       = std::make_shared<EventStore>(FreshRoot(test_name));
  f.breadcrumbs = std::make_shared<BreadcrumbBuffer>(4);
  f.session     = std::make_shared<Session>("client-session");
  f.transport   = std::make_shared<FakeHttpTransport>();

  auto env = [] {
    crumbtrail::v1::Environment environment;
    environment.set_package_name("com.example.app");
    environment.set_model("x86_64");
    return environment;
  };
  auto api      = std::make_shared<crumbtrail::transport::ApiClient>(f.transport, "https://collector.test", "k");
  auto uploader = std::make_shared<crumbtrail::upload::Uploader>(f.store, api, f.session, env);
  f.client      = std::make_shared<TelemetryClient>(f.session, f.store, f.breadcrumbs, env, uploader);
  return f;
}

void TestTrackEventPersistsBeforeReturning() {
  auto f    = MakeFixture("track_event");
  auto path = f.client->TrackEvent("screen_view", {{"screen", "home"}}, {{"load_ms", 120}});

  assert(std::filesystem::exists(path));
  auto event = f.store->ReadEvent(path);
  assert(event.has_value());
  assert(event->name() == "screen_view");
  assert(event->session_id() == "client-session");
  assert(event->tags().at("screen") == "home");
  assert(event->fields().at("load_ms") == 120);
  assert(event->time() > 0);
}

void TestTrackEventRejectsEmptyName() {
  auto f     = MakeFixture("empty_name");
  bool threw = false;
  try {
    f.client->TrackEvent("");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(f.store->ListEventFiles().empty());
}

void TestTrackExceptionWritesNonFatalReport() {
  auto f = MakeFixture("track_exception");
  f.client->LeaveBreadcrumb("loaded cart", BreadcrumbCategory::kNavigation);

  std::exception_ptr error;
  try {
    throw std::runtime_error("payment declined");
  } catch (...) {
    error = std::current_exception();
  }

  auto path = f.client->TrackException(error, {{"order", "A-17"}, {"model", "override"}});
  assert(path.has_value());
  assert(path->filename().string().find("-exception-") != std::string::npos);

  auto crash = f.store->ReadCrash(*path);
  assert(crash.has_value());
  assert(!crash->is_fatal());
  assert(crash->stacktrace().find("payment declined") != std::string::npos);
  assert(crash->context().at("order") == "A-17");
  assert(crash->context().at("model") == "override");
  assert(crash->context().at("package_name") == "com.example.app");
  assert(crash->breadcrumbs_size() == 1);
  assert(!crash->thread().empty());
}

void TestStartNewSessionRotatesAndClearsTrail() {
  auto f = MakeFixture("new_session");
  f.client->LeaveBreadcrumb("old session crumb");

  const auto before = f.client->SessionId();
  const auto after  = f.client->StartNewSession();

  assert(before != after);
  assert(f.client->SessionId() == after);
  assert(f.breadcrumbs->Size() == 0);

  auto path  = f.client->TrackEvent("after_rotate");
  auto event = f.store->ReadEvent(path);
  assert(event->session_id() == after);
}

void TestFlushUploadsBothKinds() {
  auto f = MakeFixture("flush");
  f.client->TrackEvent("one");
  f.client->TrackException(std::make_exception_ptr(std::logic_error("handled")));

  auto result = f.client->Flush();
  assert(result);
  assert(result.crashes.records_sent == 1);
  assert(result.events.records_sent == 1);
  assert(f.transport->requests.size() == 2);
  assert(f.transport->requests[0].url == "https://collector.test/api/v1/crashes/submit");
  assert(f.transport->requests[1].url == "https://collector.test/api/v1/events/submit");
  assert(f.store->ListEventFiles().empty());
  assert(f.store->ListCrashFiles().empty());
}

void TestFactoryWiresPipeline() {
  crumbtrail::runtime::config::RuntimeConfig config;
  config.mutable_collector()->set_base_url("https://collector.test/");
  config.mutable_collector()->set_api_key("factory-key");
  config.mutable_collector()->set_timeout_ms(1000);
  config.mutable_storage()->set_root_path(FreshRoot("factory").string());
  config.mutable_upload()->set_max_batch_size(10);
  config.mutable_upload()->set_interval_sec(3600);
  config.mutable_breadcrumbs()->set_capacity(3);
  config.mutable_app()->set_package_name("com.example.factory");

  auto transport = std::make_shared<FakeHttpTransport>();

  crumbtrail::factory::BuildOptions options;
  options.transport           = transport;
  options.start_upload_worker = false;

  const auto original_terminate = std::get_terminate();
  {
    auto app = crumbtrail::factory::Build(config, options);
    assert(crumbtrail::crash::TerminateHook::Installed());
    assert(app->breadcrumbs->Capacity() == 3);
    assert(std::filesystem::exists(app->store->Root() / "device_id"));

    app->client->TrackEvent("from_factory");
    auto result = app->client->Flush();
    assert(result);
    assert(transport->requests.size() == 1);
    assert(transport->Header(0, "X-API-Key") == "factory-key");
    assert(transport->requests[0].body.find("com.example.factory") != std::string::npos);
  }
  assert(!crumbtrail::crash::TerminateHook::Installed());
  assert(std::get_terminate() == original_terminate);
}

} // namespace

int main() {
  TestTrackEventPersistsBeforeReturning();
  TestTrackEventRejectsEmptyName();
  TestTrackExceptionWritesNonFatalReport();
  TestStartNewSessionRotatesAndClearsTrail();
  TestFlushUploadsBothKinds();
  TestFactoryWiresPipeline();

  std::cout << "crumbtrail_unit_telemetry_client: pass\n";
  return 0;
}
