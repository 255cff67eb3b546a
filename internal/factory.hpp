#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/environment/environment.hpp"
#include "internal/transport/http_transport.hpp"

namespace crumbtrail::breadcrumbs {
class BreadcrumbBuffer;
}
namespace crumbtrail::core {
class TelemetryClient;
}
namespace crumbtrail::crash {
class CrashHandler;
}
namespace crumbtrail::session {
class Session;
}
namespace crumbtrail::storage {
class EventStore;
}
namespace crumbtrail::transport {
class ApiClient;
}
namespace crumbtrail::upload {
class Uploader;
class UploadWorker;
}

namespace crumbtrail::factory {

struct BuildOptions {
  bool install_terminate_hook = true;
  bool start_upload_worker    = true;

  // Null selects CurlTransport.
  crumbtrail::transport::HttpTransportPtr transport;
};

/*
  Application

  Owns every long-lived component. Shutdown() stops the worker and removes
  the terminate hook; the destructor calls it.
*/
struct Application {
  std::shared_ptr<crumbtrail::session::Session>              session;
  std::shared_ptr<crumbtrail::storage::EventStore>           store;
  std::shared_ptr<crumbtrail::breadcrumbs::BreadcrumbBuffer> breadcrumbs;
  crumbtrail::environment::EnvironmentProvider               environment;
  std::shared_ptr<crumbtrail::transport::ApiClient>          api;
  std::shared_ptr<crumbtrail::upload::Uploader>              uploader;
  std::shared_ptr<crumbtrail::upload::UploadWorker>          worker;
  std::shared_ptr<crumbtrail::crash::CrashHandler>           crash_handler;
  std::shared_ptr<crumbtrail::core::TelemetryClient>         client;

  bool hook_installed = false;

  Application() = default;
  ~Application();

  Application(const Application&)            = delete;
  Application& operator=(const Application&) = delete;

  void Shutdown();
};

/*
  Build

  Composition root. `config` must already have defaults applied
  (ConfigLoader::ApplyDefaults).
*/
std::unique_ptr<Application> Build(const crumbtrail::runtime::config::RuntimeConfig& config, BuildOptions options = {});

} // namespace crumbtrail::factory
