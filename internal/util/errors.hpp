#pragma once

#include <stdexcept>
#include <string>

namespace crumbtrail::util {

/*
  Central error types.

  Everything here is recoverable; callers decide whether to retry,
  skip or report. The crash path never lets these escape.
*/

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace crumbtrail::util
