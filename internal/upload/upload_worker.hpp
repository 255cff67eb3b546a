#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "internal/storage/event_store.hpp"

namespace crumbtrail::upload {

class Uploader;

/*
  Background worker that drains the store on a fixed interval.

  Each cycle: prune (if a retention policy is set), upload crashes, upload
  events. TriggerNow() wakes the worker early; triggers that arrive while a
  cycle is running collapse into one follow-up cycle.
*/
class UploadWorker {
 public:
  UploadWorker(std::shared_ptr<Uploader> uploader, std::chrono::seconds interval,
               std::shared_ptr<crumbtrail::storage::EventStore> store = nullptr,
               std::optional<crumbtrail::storage::RetentionPolicy> retention = std::nullopt);
  ~UploadWorker();

  UploadWorker(const UploadWorker&)            = delete;
  UploadWorker& operator=(const UploadWorker&) = delete;

  void Start();
  void Stop();

  void TriggerNow();

  bool Running() const {
    return running_.load();
  }

  // Completed cycles since Start().
  uint64_t Cycles() const {
    return cycles_.load();
  }

 private:
  void Run();
  void RunCycle();

  std::shared_ptr<Uploader>                           uploader_;
  std::chrono::seconds                                interval_;
  std::shared_ptr<crumbtrail::storage::EventStore>    store_;
  std::optional<crumbtrail::storage::RetentionPolicy> retention_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    triggered_ = false;
  bool                    stopping_  = false;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> cycles_{0};
};

} // namespace crumbtrail::upload
