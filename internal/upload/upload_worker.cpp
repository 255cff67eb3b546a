#include "upload_worker.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/upload/uploader.hpp"
#include "internal/util/time.hpp"

namespace crumbtrail::upload {

namespace obs = crumbtrail::observability;

UploadWorker::UploadWorker(std::shared_ptr<Uploader> uploader, std::chrono::seconds interval,
                           std::shared_ptr<crumbtrail::storage::EventStore>    store,
                           std::optional<crumbtrail::storage::RetentionPolicy> retention)
    : uploader_(std::move(uploader)), interval_(interval), store_(std::move(store)), retention_(retention) {
  if (interval_.count() <= 0) {
    interval_ = std::chrono::seconds(60);
  }
}

UploadWorker::~UploadWorker() {
  Stop();
}

void UploadWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_  = false;
    triggered_ = false;
  }
  thread_ = std::thread(&UploadWorker::Run, this);
}

void UploadWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  running_ = false;
}

void UploadWorker::TriggerNow() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    triggered_ = true;
  }
  cv_.notify_all();
}

void UploadWorker::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    cv_.wait_for(lock, interval_, [this] { return stopping_ || triggered_; });
    if (stopping_) {
      break;
    }
    triggered_ = false;

    lock.unlock();
    RunCycle();
    lock.lock();
  }
}

void UploadWorker::RunCycle() {
  try {
    if (store_ && retention_) {
      store_->Prune(*retention_, crumbtrail::util::Now());
    }

    const auto crashes = uploader_->UploadCrashes();
    const auto events  = uploader_->UploadEvents();
    if (!crashes || !events) {
      CRUMBTRAIL_LOG_DEBUG("upload cycle incomplete, retrying next interval");
    }
  } catch (const std::exception& e) {
    CRUMBTRAIL_LOG_ERROR("upload cycle failed", {obs::StringField("error", e.what())});
  }
  ++cycles_;
}

} // namespace crumbtrail::upload
