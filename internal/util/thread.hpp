#pragma once

#include <string>

namespace crumbtrail::util {

// Name of the calling thread as seen by the OS, or "thread-<tid>" when unnamed.
std::string CurrentThreadName();

} // namespace crumbtrail::util
