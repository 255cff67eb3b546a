#include "event_store.hpp"

#include <system_error>

#include "internal/codec/json_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/file_io.hpp"
#include "internal/storage/common/file_order.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace crumbtrail::storage {

using namespace crumbtrail::storage::common;
using crumbtrail::model::RecordKind;
using crumbtrail::observability::IntField;
using crumbtrail::observability::StringField;
using crumbtrail::util::StorageError;
using crumbtrail::v1::AnalyticsEvent;
using crumbtrail::v1::CrashReport;

namespace {

std::string UniqueSuffix() {
  return crumbtrail::util::ToHex(crumbtrail::util::GenerateUUID());
}

template <typename Record>
std::optional<Record> ReadRecord(const std::filesystem::path& file, ReadError* error) {
  ReadError ignored;
  if (error == nullptr) {
    error = &ignored;
  }
  *error = ReadError::kNone;

  auto content = ReadFile(file);
  if (!content) {
    *error = ReadError::kUnavailable;
    return std::nullopt;
  }

  Record record;
  if (!crumbtrail::codec::FromJson(*content, &record)) {
    CRUMBTRAIL_LOG_WARN("Unreadable record file", {StringField("path", file.string())});
    *error = ReadError::kMalformed;
    return std::nullopt;
  }
  return record;
}

} // namespace

EventStore::EventStore(std::filesystem::path root, bool fsync) : root_(std::move(root)), fsync_(fsync) {
}

std::filesystem::path EventStore::EventsDir() const {
  return KindDirectory(root_, RecordKind::kEvent);
}

std::filesystem::path EventStore::CrashesDir() const {
  return KindDirectory(root_, RecordKind::kCrash);
}

// ------------------------------------------------------------
// Write
// ------------------------------------------------------------

std::filesystem::path EventStore::WriteEvent(const AnalyticsEvent& event) {
  std::string json;
  try {
    json = crumbtrail::codec::ToJson(event);
  } catch (const std::runtime_error& e) {
    throw StorageError(e.what());
  }

  auto path = EventsDir() / EventFileName(event.time(), UniqueSuffix());
  WriteFileAtomically(path, json, fsync_);
  return path;
}

std::filesystem::path EventStore::WriteCrash(const CrashReport& crash) {
  auto json = crumbtrail::codec::ToJson(crash);
  auto path = CrashesDir() / CrashFileName(crash.timestamp(), crash.is_fatal(), UniqueSuffix());
  WriteFileAtomically(path, json, fsync_);
  return path;
}

std::optional<std::filesystem::path> EventStore::WriteCrashSync(const CrashReport& crash) noexcept {
  // The caller may be a terminate handler; nothing may escape from here.
  try {
    return WriteCrash(crash);
  } catch (const std::exception& e) {
    try {
      CRUMBTRAIL_LOG_ERROR("Failed to persist crash report", {StringField("root", root_.string()), StringField("error", e.what())});
    } catch (const std::exception&) {
    }
  } catch (...) {
    try {
      CRUMBTRAIL_LOG_ERROR("Failed to persist crash report", {StringField("root", root_.string())});
    } catch (const std::exception&) {
    }
  }
  return std::nullopt;
}

// ------------------------------------------------------------
// Read
// ------------------------------------------------------------

std::optional<AnalyticsEvent> EventStore::ReadEvent(const std::filesystem::path& file, ReadError* error) const {
  return ReadRecord<AnalyticsEvent>(file, error);
}

std::optional<CrashReport> EventStore::ReadCrash(const std::filesystem::path& file, ReadError* error) const {
  return ReadRecord<CrashReport>(file, error);
}

// ------------------------------------------------------------
// List
// ------------------------------------------------------------

std::vector<std::filesystem::path> EventStore::ListFiles(RecordKind kind) const {
  std::vector<std::filesystem::path> files;

  const auto      dir = KindDirectory(root_, kind);
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) {
    return files;
  }

  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    throw StorageError("cannot list " + dir.string() + ": " + ec.message());
  }

  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw StorageError("cannot list " + dir.string() + ": " + ec.message());
    }
    if (IsRecordFile(it->path(), kind) && it->is_regular_file(ec)) {
      files.push_back(it->path());
    }
  }
  return files;
}

std::vector<std::filesystem::path> EventStore::ListEventFiles() const {
  return ListFiles(RecordKind::kEvent);
}

std::vector<std::filesystem::path> EventStore::ListCrashFiles() const {
  return ListFiles(RecordKind::kCrash);
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

std::size_t EventStore::DeleteFiles(const std::vector<std::filesystem::path>& files) {
  std::size_t removed = 0;
  for (const auto& file : files) {
    std::error_code ec;
    if (std::filesystem::remove(file, ec)) {
      ++removed;
    } else if (ec) {
      CRUMBTRAIL_LOG_WARN("Failed to delete record file", {StringField("path", file.string()), StringField("error", ec.message())});
    }
  }
  return removed;
}

// ------------------------------------------------------------
// Retention
// ------------------------------------------------------------

std::size_t EventStore::PruneKind(RecordKind kind, const RetentionPolicy& policy, int64_t now_ms) {
  auto files = ListFiles(kind);
  SortChronologically(files);

  std::vector<std::filesystem::path> doomed;
  std::vector<std::filesystem::path> kept;

  const int64_t max_age_ms = policy.max_age.count();
  for (auto& file : files) {
    const int64_t created_at = FileNameTime(file.filename().string());
    // names without a timestamp are left for inspection
    if (max_age_ms > 0 && created_at > 0 && now_ms - created_at > max_age_ms) {
      doomed.push_back(std::move(file));
    } else {
      kept.push_back(std::move(file));
    }
  }

  if (policy.max_files > 0 && kept.size() > policy.max_files) {
    const auto excess = kept.size() - policy.max_files;
    doomed.insert(doomed.end(), kept.begin(), kept.begin() + static_cast<std::ptrdiff_t>(excess));
  }

  const auto removed = DeleteFiles(doomed);
  if (removed > 0) {
    CRUMBTRAIL_LOG_INFO("Pruned record files", {StringField("kind", crumbtrail::model::ToString(kind)), IntField("count", static_cast<int64_t>(removed))});
  }
  return removed;
}

std::size_t EventStore::Prune(const RetentionPolicy& policy, crumbtrail::util::TimePoint now) {
  const auto now_ms = crumbtrail::util::ToUnixMillis(now);
  return PruneKind(RecordKind::kEvent, policy, now_ms) + PruneKind(RecordKind::kCrash, policy, now_ms);
}

} // namespace crumbtrail::storage
