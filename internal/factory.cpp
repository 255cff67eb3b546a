#include "factory.hpp"

#include <chrono>
#include <optional>
#include <utility>

#include "internal/breadcrumbs/breadcrumb_buffer.hpp"
#include "internal/core/telemetry_client.hpp"
#include "internal/crash/crash_handler.hpp"
#include "internal/crash/terminate_hook.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/session.hpp"
#include "internal/storage/event_store.hpp"
#include "internal/transport/api_client.hpp"
#include "internal/transport/curl_transport.hpp"
#include "internal/upload/upload_worker.hpp"
#include "internal/upload/uploader.hpp"

namespace crumbtrail::factory {

using crumbtrail::observability::StringField;

namespace {

std::optional<crumbtrail::storage::RetentionPolicy> RetentionFromConfig(const crumbtrail::runtime::config::StorageConfig& storage) {
  if (!storage.has_retention()) {
    return std::nullopt;
  }
  const auto& retention = storage.retention();
  if (retention.max_age_sec() == 0 && retention.max_files() == 0) {
    return std::nullopt;
  }

  crumbtrail::storage::RetentionPolicy policy;
  policy.max_age   = std::chrono::seconds(retention.max_age_sec());
  policy.max_files = static_cast<std::size_t>(retention.max_files());
  return policy;
}

} // namespace

Application::~Application() {
  Shutdown();
}

void Application::Shutdown() {
  if (worker) {
    worker->Stop();
  }
  if (hook_installed) {
    crumbtrail::crash::TerminateHook::Uninstall();
    hook_installed = false;
  }
}

/*
    Build full application dependency graph
*/
std::unique_ptr<Application> Build(const crumbtrail::runtime::config::RuntimeConfig& config, BuildOptions options) {
  auto  app_ptr = std::make_unique<Application>();
  auto& app     = *app_ptr;

  // ------------------------------------------------------------------
  // Local state
  // ------------------------------------------------------------------
  const std::filesystem::path root = config.storage().root_path();

  app.session     = std::make_shared<session::Session>();
  app.store       = std::make_shared<storage::EventStore>(root, config.storage().fsync());
  app.breadcrumbs = std::make_shared<breadcrumbs::BreadcrumbBuffer>(config.breadcrumbs().capacity());
  app.environment = environment::MakeCachedProvider(environment::CollectEnvironment(config.app(), root));

  // ------------------------------------------------------------------
  // Delivery
  // ------------------------------------------------------------------
  auto transport = options.transport ? options.transport : std::make_shared<transport::CurlTransport>();
  app.api        = std::make_shared<transport::ApiClient>(std::move(transport), config.collector());

  upload::UploadOptions upload_options;
  upload_options.max_batch_size   = config.upload().max_batch_size();
  upload_options.delete_corrupted = !config.upload().has_delete_corrupted() || config.upload().delete_corrupted();

  app.uploader = std::make_shared<upload::Uploader>(app.store, app.api, app.session, app.environment, upload_options);
  app.worker   = std::make_shared<upload::UploadWorker>(app.uploader, std::chrono::seconds(config.upload().interval_sec()), app.store,
                                                        RetentionFromConfig(config.storage()));

  // ------------------------------------------------------------------
  // Crash capture
  // ------------------------------------------------------------------
  auto previous     = crash::TerminateHook::PreviousDelegate();
  app.crash_handler = std::make_shared<crash::CrashHandler>(app.session, app.store, app.breadcrumbs, app.environment, std::move(previous));
  if (options.install_terminate_hook) {
    crash::TerminateHook::Install(app.crash_handler);
    app.hook_installed = true;
  }

  app.client = std::make_shared<core::TelemetryClient>(app.session, app.store, app.breadcrumbs, app.environment, app.uploader);

  if (options.start_upload_worker) {
    app.worker->Start();
  }

  CRUMBTRAIL_LOG_INFO("telemetry pipeline ready", {StringField("root", root.string()), StringField("session_id", app.session->Id())});
  return app_ptr;
}

} // namespace crumbtrail::factory
