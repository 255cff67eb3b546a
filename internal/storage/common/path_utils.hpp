#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "internal/model/record_kind.hpp"

namespace crumbtrail::storage::common {

inline std::filesystem::path KindDirectory(const std::filesystem::path& root, crumbtrail::model::RecordKind kind) {
  return root / std::string(crumbtrail::model::DirectoryName(kind));
}

// <millis>-<suffix>.event
inline std::string EventFileName(int64_t created_at_ms, std::string_view suffix) {
  return std::to_string(created_at_ms) + "-" + std::string(suffix) + ".event";
}

// <millis>-<fatal|exception>-<suffix>.crash
inline std::string CrashFileName(int64_t created_at_ms, bool is_fatal, std::string_view suffix) {
  return std::to_string(created_at_ms) + (is_fatal ? "-fatal-" : "-exception-") + std::string(suffix) + ".crash";
}

/*
  True for committed record files of the given kind.

  In-flight temp files start with '.' and end in ".tmp", so they never match.
*/
inline bool IsRecordFile(const std::filesystem::path& path, crumbtrail::model::RecordKind kind) {
  const auto name = path.filename().string();
  if (name.empty() || name.front() == '.') {
    return false;
  }
  return path.extension() == crumbtrail::model::FileExtension(kind);
}

inline std::filesystem::path TempPathFor(const std::filesystem::path& final_path) {
  return final_path.parent_path() / ("." + final_path.filename().string() + ".tmp");
}

} // namespace crumbtrail::storage::common
