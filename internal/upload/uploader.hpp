#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <vector>

#include "internal/environment/environment.hpp"
#include "internal/model/record_kind.hpp"

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

struct UploadOptions {
  std::size_t max_batch_size   = 100;
  bool        delete_corrupted = true;
};

/*
  Outcome of one upload pass for one record kind.

  ok is false when a batch was rejected or the pass could not run; files of
  unsent batches stay on disk for the next pass.
*/
struct UploadResult {
  bool        ok                 = true;
  bool        skipped_in_flight  = false; // another pass for this kind was running
  std::size_t batches_sent       = 0;
  std::size_t records_sent       = 0;
  std::size_t records_pending    = 0; // decoded but not delivered
  std::size_t skipped_corrupted  = 0; // content did not decode
  std::size_t skipped_unreadable = 0; // could not be read; left for the next pass

  explicit operator bool() const {
    return ok;
  }
};

/*
  Drains the store to the collector, oldest first.

  Each batch is submitted with the current session id and environment. A 2xx
  deletes exactly that batch's files; anything else stops the pass.
  Passes for the same kind never overlap; a second caller gets
  skipped_in_flight immediately.
*/
class Uploader {
 public:
  Uploader(std::shared_ptr<crumbtrail::storage::EventStore> store, std::shared_ptr<crumbtrail::transport::ApiClient> api,
           std::shared_ptr<crumbtrail::session::Session> session, crumbtrail::environment::EnvironmentProvider environment,
           UploadOptions options = {});

  UploadResult UploadEvents();
  UploadResult UploadCrashes();

  UploadResult Upload(crumbtrail::model::RecordKind kind);

 private:
  template <typename Record>
  struct Pending {
    std::filesystem::path file;
    Record                record;
  };

  template <typename Record>
  std::vector<Pending<Record>> LoadPending(crumbtrail::model::RecordKind kind, UploadResult* result);

  template <typename Record, typename Request>
  UploadResult Run(crumbtrail::model::RecordKind kind);

  std::atomic<bool>& InFlightFlag(crumbtrail::model::RecordKind kind);

  std::shared_ptr<crumbtrail::storage::EventStore>  store_;
  std::shared_ptr<crumbtrail::transport::ApiClient> api_;
  std::shared_ptr<crumbtrail::session::Session>     session_;
  crumbtrail::environment::EnvironmentProvider      environment_;
  UploadOptions                                     options_;

  std::atomic<bool> events_in_flight_{false};
  std::atomic<bool> crashes_in_flight_{false};
};

} // namespace crumbtrail::upload
