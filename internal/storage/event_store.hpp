#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "crumbtrail/v1/telemetry.pb.h"
#include "internal/model/record_kind.hpp"
#include "internal/util/time.hpp"

namespace crumbtrail::storage {

/*
  Durable file-per-record store.

  Layout under root:
    events/<millis>-<suffix>.event
    crashes/<millis>-<fatal|exception>-<suffix>.crash

  Properties:
    - atomic writes (tmp → rename), optional fsync
    - files are never rewritten; they are only read or deleted
    - unique names under concurrent same-millisecond writers
    - reads never throw; corruption reads as nullopt
*/

// Why a read returned nullopt.
enum class ReadError : uint8_t {
  kNone,
  kUnavailable, // missing or could not be opened; may succeed later
  kMalformed,   // content does not decode
};

struct RetentionPolicy {
  std::chrono::milliseconds max_age{0}; // 0 disables age pruning
  std::size_t               max_files{0}; // per kind, 0 disables
};

class EventStore {
 public:
  explicit EventStore(std::filesystem::path root, bool fsync = false);

  // Throws StorageError.
  std::filesystem::path WriteEvent(const crumbtrail::v1::AnalyticsEvent& event);

  /*
    Synchronous write for the crash path.

    Returns the written path, or nullopt after logging the failure.
    Never throws.
  */
  std::optional<std::filesystem::path> WriteCrashSync(const crumbtrail::v1::CrashReport& crash) noexcept;

  std::optional<crumbtrail::v1::AnalyticsEvent> ReadEvent(const std::filesystem::path& file, ReadError* error = nullptr) const;
  std::optional<crumbtrail::v1::CrashReport>    ReadCrash(const std::filesystem::path& file, ReadError* error = nullptr) const;

  // Unordered; see common::SortChronologically. Throws StorageError.
  std::vector<std::filesystem::path> ListEventFiles() const;
  std::vector<std::filesystem::path> ListCrashFiles() const;
  std::vector<std::filesystem::path> ListFiles(crumbtrail::model::RecordKind kind) const;

  // Best effort; returns how many files were actually removed.
  std::size_t DeleteFiles(const std::vector<std::filesystem::path>& files);

  // Returns the number of files removed across both kinds.
  std::size_t Prune(const RetentionPolicy& policy, crumbtrail::util::TimePoint now);

  const std::filesystem::path& Root() const {
    return root_;
  }
  std::filesystem::path EventsDir() const;
  std::filesystem::path CrashesDir() const;

 private:
  std::filesystem::path WriteCrash(const crumbtrail::v1::CrashReport& crash);
  std::size_t           PruneKind(crumbtrail::model::RecordKind kind, const RetentionPolicy& policy, int64_t now_ms);

  std::filesystem::path root_;
  bool                  fsync_;
};

} // namespace crumbtrail::storage
