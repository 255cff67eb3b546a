#include "thread.hpp"

#include <pthread.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace crumbtrail::util {

std::string CurrentThreadName() {
  char name[64] = {0};
  if (pthread_getname_np(pthread_self(), name, sizeof(name)) == 0 && name[0] != '\0') {
    return name;
  }
  return "thread-" + std::to_string(static_cast<long>(::syscall(SYS_gettid)));
}

} // namespace crumbtrail::util
