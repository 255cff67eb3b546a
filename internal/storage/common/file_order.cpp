#include "file_order.hpp"

#include <algorithm>
#include <charconv>

namespace crumbtrail::storage::common {

int64_t FileNameTime(std::string_view file_name) {
  const auto dash = file_name.find('-');
  if (dash == std::string_view::npos || dash == 0) {
    return 0;
  }

  const auto prefix = file_name.substr(0, dash);
  for (char c : prefix) {
    if (c < '0' || c > '9') return 0;
  }

  int64_t value  = 0;
  auto    result = std::from_chars(prefix.data(), prefix.data() + prefix.size(), value);
  if (result.ec != std::errc{} || result.ptr != prefix.data() + prefix.size()) {
    return 0;
  }
  return value;
}

bool RecordFileOrder::operator()(const std::filesystem::path& lhs, const std::filesystem::path& rhs) const {
  return FileNameTime(lhs.filename().string()) < FileNameTime(rhs.filename().string());
}

void SortChronologically(std::vector<std::filesystem::path>& files) {
  std::stable_sort(files.begin(), files.end(), RecordFileOrder{});
}

} // namespace crumbtrail::storage::common
