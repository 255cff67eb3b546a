#pragma once

#include <cstdint>
#include <string_view>

namespace crumbtrail::model {

/*
  The two persisted entity kinds.

  Each kind owns one subdirectory of the store root and one file extension.
*/
enum class RecordKind : std::uint8_t {
  kEvent = 0,
  kCrash = 1,
};

constexpr std::string_view ToString(RecordKind kind) {
  return kind == RecordKind::kEvent ? "event" : "crash";
}

constexpr std::string_view DirectoryName(RecordKind kind) {
  return kind == RecordKind::kEvent ? "events" : "crashes";
}

constexpr std::string_view FileExtension(RecordKind kind) {
  return kind == RecordKind::kEvent ? ".event" : ".crash";
}

} // namespace crumbtrail::model
