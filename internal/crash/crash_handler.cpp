#include "crash_handler.hpp"

#include <utility>

#include "internal/breadcrumbs/breadcrumb_buffer.hpp"
#include "internal/crash/exception_format.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/session.hpp"
#include "internal/storage/event_store.hpp"
#include "internal/util/time.hpp"

namespace crumbtrail::crash {

using crumbtrail::observability::StringField;
using crumbtrail::v1::Breadcrumb;
using crumbtrail::v1::CrashReport;

namespace {

thread_local bool t_in_capture = false;

// Resets the per-thread re-entrancy flag on every exit path.
class CaptureScope {
 public:
  CaptureScope() {
    t_in_capture = true;
  }
  ~CaptureScope() {
    t_in_capture = false;
  }

  CaptureScope(const CaptureScope&)            = delete;
  CaptureScope& operator=(const CaptureScope&) = delete;
};

} // namespace

CrashReport BuildCrashReport(const std::string& session_id, const std::string& thread_name, std::exception_ptr error, bool is_fatal,
                             int64_t timestamp_ms, const std::vector<Breadcrumb>& breadcrumbs,
                             const std::map<std::string, std::string>& context) {
  CrashReport crash;
  crash.set_session_id(session_id);
  crash.set_timestamp(timestamp_ms);
  crash.set_thread(thread_name);
  crash.set_stacktrace(DescribeException(error) + CaptureBacktrace(2));
  crash.set_is_fatal(is_fatal);
  crash.mutable_context()->insert(context.begin(), context.end());
  for (const auto& crumb : breadcrumbs) {
    *crash.add_breadcrumbs() = crumb;
  }
  return crash;
}

CrashHandler::CrashHandler(std::shared_ptr<crumbtrail::session::Session> session, std::shared_ptr<crumbtrail::storage::EventStore> store,
                           std::shared_ptr<crumbtrail::breadcrumbs::BreadcrumbBuffer> breadcrumbs,
                           crumbtrail::environment::EnvironmentProvider environment, UncaughtExceptionHandlerPtr previous)
    : session_(std::move(session)),
      store_(std::move(store)),
      breadcrumbs_(std::move(breadcrumbs)),
      environment_(std::move(environment)),
      previous_(std::move(previous)) {
}

void CrashHandler::UncaughtException(const std::string& thread_name, std::exception_ptr error) {
  if (t_in_capture) {
    // Fault raised by Capture itself: forward it, the outer call owns state_.
    if (previous_) {
      previous_->UncaughtException(thread_name, error);
    }
    return;
  }

  {
    CaptureScope scope;
    std::lock_guard lock(capture_mutex_);
    state_ = State::kCapturing;
    Capture(thread_name, error);
  }

  state_ = State::kDelegating;
  if (previous_) {
    previous_->UncaughtException(thread_name, error);
  }
  state_ = State::kIdle;
}

void CrashHandler::Capture(const std::string& thread_name, const std::exception_ptr& error) noexcept {
  try {
    const auto timestamp = crumbtrail::util::NowMillis();
    auto       trail     = breadcrumbs_ ? breadcrumbs_->Snapshot() : std::vector<Breadcrumb>{};

    std::map<std::string, std::string> context;
    if (environment_) {
      try {
        context = crumbtrail::environment::ToContext(environment_());
      } catch (const std::exception& e) {
        CRUMBTRAIL_LOG_WARN("Environment unavailable during crash capture", {StringField("error", e.what())});
      }
    }

    auto crash = BuildCrashReport(session_ ? session_->Id() : std::string{}, thread_name, error, /*is_fatal=*/true, timestamp, trail, context);

    if (auto path = store_->WriteCrashSync(crash)) {
      CRUMBTRAIL_LOG_ERROR("Uncaught exception recorded", {StringField("thread", thread_name), StringField("path", path->string())});
    }
  } catch (const std::exception& e) {
    try {
      CRUMBTRAIL_LOG_ERROR("Crash capture failed", {StringField("error", e.what())});
    } catch (const std::exception&) {
    }
  } catch (...) {
    // capture must never raise a second fault
  }
  crumbtrail::observability::FlushLogging();
}

} // namespace crumbtrail::crash
