#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace crumbtrail::storage::common {

/*
  Chronological order of record files, derived only from the file name.

  The key is the integer before the first '-'. Anything that does not parse as
  a non-negative integer (no dash, empty prefix, garbage, overflow) maps to 0,
  so malformed names sort ahead of every well-formed one.
*/
int64_t FileNameTime(std::string_view file_name);

struct RecordFileOrder {
  bool operator()(const std::filesystem::path& lhs, const std::filesystem::path& rhs) const;
};

// Ascending by FileNameTime; equal keys keep their relative order.
void SortChronologically(std::vector<std::filesystem::path>& files);

} // namespace crumbtrail::storage::common
