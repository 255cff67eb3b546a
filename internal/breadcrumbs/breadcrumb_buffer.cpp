#include "breadcrumb_buffer.hpp"

#include <stdexcept>
#include <utility>

#include "internal/util/time.hpp"

namespace crumbtrail::breadcrumbs {

using crumbtrail::v1::Breadcrumb;

BreadcrumbBuffer::BreadcrumbBuffer(std::size_t capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("breadcrumb buffer capacity must be positive");
  }
  slots_.resize(capacity);
}

void BreadcrumbBuffer::Add(std::string message, crumbtrail::model::BreadcrumbCategory category) {
  Breadcrumb crumb;
  crumb.set_timestamp(crumbtrail::util::NowMillis());
  crumb.set_message(std::move(message));
  crumb.set_category(std::string(crumbtrail::model::ToApiValue(category)));

  std::lock_guard lock(mutex_);

  if (size_ == slots_.size()) {
    // overwrite the oldest slot, next one becomes oldest
    slots_[head_] = std::move(crumb);
    head_         = (head_ + 1) % slots_.size();
    return;
  }

  slots_[(head_ + size_) % slots_.size()] = std::move(crumb);
  ++size_;
}

std::vector<Breadcrumb> BreadcrumbBuffer::Snapshot() const {
  std::lock_guard lock(mutex_);

  std::vector<Breadcrumb> out;
  out.reserve(size_);
  for (std::size_t i = 0; i < size_; ++i) {
    out.push_back(slots_[(head_ + i) % slots_.size()]);
  }
  return out;
}

void BreadcrumbBuffer::Clear() {
  std::lock_guard lock(mutex_);

  for (auto& slot : slots_) {
    slot.Clear();
  }
  head_ = 0;
  size_ = 0;
}

std::size_t BreadcrumbBuffer::Size() const {
  std::lock_guard lock(mutex_);
  return size_;
}

} // namespace crumbtrail::breadcrumbs
