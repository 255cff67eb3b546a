#pragma once

#include <exception>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "crumbtrail/v1/telemetry.pb.h"
#include "internal/environment/environment.hpp"
#include "internal/model/breadcrumb_category.hpp"
#include "internal/upload/uploader.hpp"

namespace crumbtrail::breadcrumbs {
class BreadcrumbBuffer;
}
namespace crumbtrail::session {
class Session;
}
namespace crumbtrail::storage {
class EventStore;
}

namespace crumbtrail::core {

struct FlushResult {
  crumbtrail::upload::UploadResult crashes;
  crumbtrail::upload::UploadResult events;

  explicit operator bool() const {
    return static_cast<bool>(crashes) && static_cast<bool>(events);
  }
};

/*
  Application-facing entry point.

  Everything recorded here is on disk before the call returns; delivery is
  left to the uploader.
*/
class TelemetryClient {
 public:
  TelemetryClient(std::shared_ptr<crumbtrail::session::Session> session, std::shared_ptr<crumbtrail::storage::EventStore> store,
                  std::shared_ptr<crumbtrail::breadcrumbs::BreadcrumbBuffer> breadcrumbs,
                  crumbtrail::environment::EnvironmentProvider environment, std::shared_ptr<crumbtrail::upload::Uploader> uploader);

  // Throws std::invalid_argument for an empty name, StorageError on I/O failure.
  std::filesystem::path TrackEvent(const std::string& name, const std::map<std::string, std::string>& tags = {},
                                   const std::map<std::string, double>& fields = {});

  void LeaveBreadcrumb(std::string message, crumbtrail::model::BreadcrumbCategory category = crumbtrail::model::BreadcrumbCategory::kCustom);

  /*
    Records a handled error as a non-fatal crash report. `context` is merged
    over the environment context. Returns nullopt if the write failed.
  */
  std::optional<std::filesystem::path> TrackException(std::exception_ptr error, const std::map<std::string, std::string>& context = {});

  // New session id; breadcrumbs of the previous session are dropped.
  std::string StartNewSession();

  std::string SessionId() const;

  // Uploads crashes, then events, on the calling thread.
  FlushResult Flush();

 private:
  std::shared_ptr<crumbtrail::session::Session>              session_;
  std::shared_ptr<crumbtrail::storage::EventStore>           store_;
  std::shared_ptr<crumbtrail::breadcrumbs::BreadcrumbBuffer> breadcrumbs_;
  crumbtrail::environment::EnvironmentProvider               environment_;
  std::shared_ptr<crumbtrail::upload::Uploader>              uploader_;
};

} // namespace crumbtrail::core
