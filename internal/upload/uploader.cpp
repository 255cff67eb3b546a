#include "uploader.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/session/session.hpp"
#include "internal/storage/common/file_order.hpp"
#include "internal/storage/event_store.hpp"
#include "internal/transport/api_client.hpp"

namespace crumbtrail::upload {

using crumbtrail::model::RecordKind;
namespace obs = crumbtrail::observability;

namespace {

class InFlightGuard {
 public:
  explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {
    bool expected = false;
    acquired_     = flag_.compare_exchange_strong(expected, true);
  }

  ~InFlightGuard() {
    if (acquired_) {
      flag_.store(false);
    }
  }

  InFlightGuard(const InFlightGuard&)            = delete;
  InFlightGuard& operator=(const InFlightGuard&) = delete;

  bool acquired() const {
    return acquired_;
  }

 private:
  std::atomic<bool>& flag_;
  bool               acquired_ = false;
};

} // namespace

Uploader::Uploader(std::shared_ptr<crumbtrail::storage::EventStore> store, std::shared_ptr<crumbtrail::transport::ApiClient> api,
                   std::shared_ptr<crumbtrail::session::Session> session, crumbtrail::environment::EnvironmentProvider environment,
                   UploadOptions options)
    : store_(std::move(store)), api_(std::move(api)), session_(std::move(session)), environment_(std::move(environment)), options_(options) {
  if (!store_ || !api_ || !session_) {
    throw std::invalid_argument("Uploader: store, api and session are required");
  }
  if (options_.max_batch_size == 0) {
    throw std::invalid_argument("Uploader: max_batch_size must be positive");
  }
}

UploadResult Uploader::UploadEvents() {
  return Upload(RecordKind::kEvent);
}

UploadResult Uploader::UploadCrashes() {
  return Upload(RecordKind::kCrash);
}

std::atomic<bool>& Uploader::InFlightFlag(RecordKind kind) {
  return kind == RecordKind::kCrash ? crashes_in_flight_ : events_in_flight_;
}

UploadResult Uploader::Upload(RecordKind kind) {
  InFlightGuard guard(InFlightFlag(kind));
  if (!guard.acquired()) {
    CRUMBTRAIL_LOG_DEBUG("upload already running", {obs::StringField("kind", crumbtrail::model::ToString(kind))});
    UploadResult result;
    result.skipped_in_flight = true;
    return result;
  }

  try {
    if (kind == RecordKind::kCrash) {
      return Run<crumbtrail::v1::CrashReport, crumbtrail::v1::SubmitCrashesRequest>(kind);
    }
    return Run<crumbtrail::v1::AnalyticsEvent, crumbtrail::v1::SubmitEventsRequest>(kind);
  } catch (const std::exception& e) {
    CRUMBTRAIL_LOG_ERROR("upload pass failed", {obs::StringField("kind", crumbtrail::model::ToString(kind)), obs::StringField("error", e.what())});
    UploadResult result;
    result.ok = false;
    return result;
  }
}

template <typename Record>
std::vector<Uploader::Pending<Record>> Uploader::LoadPending(RecordKind kind, UploadResult* result) {
  auto files = store_->ListFiles(kind);
  crumbtrail::storage::common::SortChronologically(files);

  std::vector<Pending<Record>>       pending;
  std::vector<std::filesystem::path> corrupted;
  pending.reserve(files.size());

  for (auto& file : files) {
    crumbtrail::storage::ReadError error = crumbtrail::storage::ReadError::kNone;
    std::optional<Record>          record;
    if constexpr (std::is_same_v<Record, crumbtrail::v1::CrashReport>) {
      record = store_->ReadCrash(file, &error);
    } else {
      record = store_->ReadEvent(file, &error);
    }

    if (record) {
      pending.push_back(Pending<Record>{std::move(file), std::move(*record)});
    } else if (error == crumbtrail::storage::ReadError::kMalformed) {
      ++result->skipped_corrupted;
      corrupted.push_back(std::move(file));
    } else {
      ++result->skipped_unreadable;
    }
  }

  if (!corrupted.empty() && options_.delete_corrupted) {
    const auto removed = store_->DeleteFiles(corrupted);
    CRUMBTRAIL_LOG_WARN("removed undecodable records",
                        {obs::StringField("kind", crumbtrail::model::ToString(kind)), obs::IntField("count", static_cast<int64_t>(removed))});
  }
  if (result->skipped_unreadable > 0) {
    CRUMBTRAIL_LOG_WARN("skipped unreadable records", {obs::StringField("kind", crumbtrail::model::ToString(kind)),
                                                       obs::IntField("count", static_cast<int64_t>(result->skipped_unreadable))});
  }

  return pending;
}

template <typename Record, typename Request>
UploadResult Uploader::Run(RecordKind kind) {
  UploadResult result;
  auto         pending = LoadPending<Record>(kind, &result);

  for (std::size_t begin = 0; begin < pending.size(); begin += options_.max_batch_size) {
    const std::size_t end = std::min(pending.size(), begin + options_.max_batch_size);

    Request request;
    request.set_session_id(session_->Id());
    if (environment_) {
      *request.mutable_environment() = environment_();
    }

    std::vector<std::filesystem::path> batch_files;
    batch_files.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
      if constexpr (std::is_same_v<Request, crumbtrail::v1::SubmitCrashesRequest>) {
        *request.add_crashes() = pending[i].record;
      } else {
        *request.add_events() = pending[i].record;
      }
      batch_files.push_back(pending[i].file);
    }

    bool accepted = false;
    if constexpr (std::is_same_v<Request, crumbtrail::v1::SubmitCrashesRequest>) {
      accepted = api_->SendCrashes(request);
    } else {
      accepted = api_->SendEvents(request);
    }
    if (!accepted) {
      result.ok              = false;
      result.records_pending = pending.size() - begin;
      break;
    }

    store_->DeleteFiles(batch_files);
    ++result.batches_sent;
    result.records_sent += batch_files.size();
  }

  if (result.records_sent > 0 || !result.ok) {
    CRUMBTRAIL_LOG_INFO("upload finished", {obs::StringField("kind", crumbtrail::model::ToString(kind)), obs::BoolField("ok", result.ok),
                                            obs::IntField("sent", static_cast<int64_t>(result.records_sent)),
                                            obs::IntField("pending", static_cast<int64_t>(result.records_pending))});
  }
  return result;
}

} // namespace crumbtrail::upload
