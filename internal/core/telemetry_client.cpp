#include "telemetry_client.hpp"

#include <stdexcept>
#include <utility>

#include "internal/breadcrumbs/breadcrumb_buffer.hpp"
#include "internal/crash/crash_handler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/session.hpp"
#include "internal/storage/event_store.hpp"
#include "internal/util/thread.hpp"
#include "internal/util/time.hpp"

namespace crumbtrail::core {

using crumbtrail::observability::StringField;

TelemetryClient::TelemetryClient(std::shared_ptr<crumbtrail::session::Session> session, std::shared_ptr<crumbtrail::storage::EventStore> store,
                                 std::shared_ptr<crumbtrail::breadcrumbs::BreadcrumbBuffer> breadcrumbs,
                                 crumbtrail::environment::EnvironmentProvider environment, std::shared_ptr<crumbtrail::upload::Uploader> uploader)
    : session_(std::move(session)),
      store_(std::move(store)),
      breadcrumbs_(std::move(breadcrumbs)),
      environment_(std::move(environment)),
      uploader_(std::move(uploader)) {
  if (!session_ || !store_ || !breadcrumbs_) {
    throw std::invalid_argument("TelemetryClient: session, store and breadcrumbs are required");
  }
}

std::filesystem::path TelemetryClient::TrackEvent(const std::string& name, const std::map<std::string, std::string>& tags,
                                                  const std::map<std::string, double>& fields) {
  if (name.empty()) {
    throw std::invalid_argument("TrackEvent: event name is empty");
  }

  crumbtrail::v1::AnalyticsEvent event;
  event.set_session_id(session_->Id());
  event.set_name(name);
  event.set_time(crumbtrail::util::NowMillis());
  event.mutable_tags()->insert(tags.begin(), tags.end());
  event.mutable_fields()->insert(fields.begin(), fields.end());

  return store_->WriteEvent(event);
}

void TelemetryClient::LeaveBreadcrumb(std::string message, crumbtrail::model::BreadcrumbCategory category) {
  breadcrumbs_->Add(std::move(message), category);
}

std::optional<std::filesystem::path> TelemetryClient::TrackException(std::exception_ptr error, const std::map<std::string, std::string>& context) {
  if (!error) {
    throw std::invalid_argument("TrackException: null exception");
  }

  std::map<std::string, std::string> merged;
  if (environment_) {
    merged = crumbtrail::environment::ToContext(environment_());
  }
  for (const auto& [key, value] : context) {
    merged[key] = value;
  }

  auto crash = crumbtrail::crash::BuildCrashReport(session_->Id(), crumbtrail::util::CurrentThreadName(), error, /*is_fatal=*/false,
                                                   crumbtrail::util::NowMillis(), breadcrumbs_->Snapshot(), merged);

  auto path = store_->WriteCrashSync(crash);
  if (path) {
    CRUMBTRAIL_LOG_INFO("handled exception recorded", {StringField("path", path->string())});
  }
  return path;
}

std::string TelemetryClient::StartNewSession() {
  breadcrumbs_->Clear();
  auto id = session_->Rotate();
  CRUMBTRAIL_LOG_INFO("session started", {StringField("session_id", id)});
  return id;
}

std::string TelemetryClient::SessionId() const {
  return session_->Id();
}

FlushResult TelemetryClient::Flush() {
  FlushResult result;
  if (!uploader_) {
    result.crashes.ok = false;
    result.events.ok  = false;
    return result;
  }
  result.crashes = uploader_->UploadCrashes();
  result.events  = uploader_->UploadEvents();
  return result;
}

} // namespace crumbtrail::core
