#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace crumbtrail::storage::common {

/*
  Atomic write:
      write tmp → (fsync) → rename

  Readers see either no file or the complete file. Throws StorageError.
*/
void WriteFileAtomically(const std::filesystem::path& path, std::string_view content, bool fsync);

// nullopt when the file is missing or cannot be read.
std::optional<std::string> ReadFile(const std::filesystem::path& path);

} // namespace crumbtrail::storage::common
