#include "session.hpp"

#include <utility>

#include "internal/util/uuid.hpp"

namespace crumbtrail::session {

Session::Session() : id_(crumbtrail::util::ToString(crumbtrail::util::GenerateUUID())) {
}

Session::Session(std::string id) : id_(std::move(id)) {
}

std::string Session::Id() const {
  std::lock_guard lock(mutex_);
  return id_;
}

std::string Session::Rotate() {
  auto next = crumbtrail::util::ToString(crumbtrail::util::GenerateUUID());

  std::lock_guard lock(mutex_);
  id_ = next;
  return next;
}

} // namespace crumbtrail::session
