#include "file_io.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace crumbtrail::storage::common {

using crumbtrail::util::StorageError;

namespace {

std::string ErrnoMessage(const std::string& what, const std::filesystem::path& path, int err) {
  return what + " " + path.string() + ": " + std::strerror(err);
}

// Closes the descriptor on every exit path.
class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {
  }
  ~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
  }

  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int get() const {
    return fd_;
  }

  int release() {
    int fd = fd_;
    fd_    = -1;
    return fd;
  }

 private:
  int fd_;
};

void WriteAll(int fd, std::string_view content, const std::filesystem::path& path) {
  const char* data      = content.data();
  size_t      remaining = content.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, data, remaining);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw StorageError(ErrnoMessage("write failed for", path, errno));
    }
    data += n;
    remaining -= static_cast<size_t>(n);
  }
}

} // namespace

void WriteFileAtomically(const std::filesystem::path& path, std::string_view content, bool fsync) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    throw StorageError("cannot create directory " + path.parent_path().string() + ": " + ec.message());
  }

  const auto tmp_path = TempPathFor(path);

  {
    FileDescriptor fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (fd.get() < 0) {
      throw StorageError(ErrnoMessage("open failed for", tmp_path, errno));
    }

    try {
      WriteAll(fd.get(), content, tmp_path);
      if (fsync && ::fsync(fd.get()) != 0) {
        throw StorageError(ErrnoMessage("fsync failed for", tmp_path, errno));
      }
      if (::close(fd.release()) != 0) {
        throw StorageError(ErrnoMessage("close failed for", tmp_path, errno));
      }
    } catch (const StorageError&) {
      std::filesystem::remove(tmp_path, ec);
      throw;
    }
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw StorageError("rename failed for " + path.string() + ": " + ec.message());
  }
}

std::optional<std::string> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }

  std::ostringstream content;
  content << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return content.str();
}

} // namespace crumbtrail::storage::common
