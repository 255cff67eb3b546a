#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "crumbtrail/v1/telemetry.pb.h"
#include "internal/environment/environment.hpp"

namespace crumbtrail::breadcrumbs {
class BreadcrumbBuffer;
}
namespace crumbtrail::session {
class Session;
}
namespace crumbtrail::storage {
class EventStore;
}

namespace crumbtrail::crash {

/*
  Receives an error nobody caught, together with the name of the thread it
  escaped from. Implementations are chained: each one forwards to the handler
  that was active before it.
*/
class UncaughtExceptionHandler {
 public:
  virtual ~UncaughtExceptionHandler() = default;

  virtual void UncaughtException(const std::string& thread_name, std::exception_ptr error) = 0;
};

using UncaughtExceptionHandlerPtr = std::shared_ptr<UncaughtExceptionHandler>;

// Crash record for `error`; the stacktrace holds the whole nested cause chain.
crumbtrail::v1::CrashReport BuildCrashReport(const std::string& session_id, const std::string& thread_name, std::exception_ptr error,
                                             bool is_fatal, int64_t timestamp_ms, const std::vector<crumbtrail::v1::Breadcrumb>& breadcrumbs,
                                             const std::map<std::string, std::string>& context);

/*
  Turns an uncaught error into a persisted fatal CrashReport, then hands the
  original error to `previous` so normal termination still happens.

    idle → capturing → delegating → idle

  Capture failures are logged and dropped; forwarding always runs. A fault
  raised on a thread that is already capturing goes straight to `previous`.
*/
class CrashHandler final : public UncaughtExceptionHandler {
 public:
  enum class State : uint8_t {
    kIdle,
    kCapturing,
    kDelegating,
  };

  CrashHandler(std::shared_ptr<crumbtrail::session::Session> session, std::shared_ptr<crumbtrail::storage::EventStore> store,
               std::shared_ptr<crumbtrail::breadcrumbs::BreadcrumbBuffer> breadcrumbs, crumbtrail::environment::EnvironmentProvider environment,
               UncaughtExceptionHandlerPtr previous);

  void UncaughtException(const std::string& thread_name, std::exception_ptr error) override;

  State state() const {
    return state_.load();
  }

 private:
  void Capture(const std::string& thread_name, const std::exception_ptr& error) noexcept;

  std::shared_ptr<crumbtrail::session::Session>              session_;
  std::shared_ptr<crumbtrail::storage::EventStore>           store_;
  std::shared_ptr<crumbtrail::breadcrumbs::BreadcrumbBuffer> breadcrumbs_;
  crumbtrail::environment::EnvironmentProvider               environment_;
  UncaughtExceptionHandlerPtr                                previous_;

  // Serializes captures from different threads; one crash file per fault.
  std::mutex         capture_mutex_;
  std::atomic<State> state_{State::kIdle};
};

} // namespace crumbtrail::crash
