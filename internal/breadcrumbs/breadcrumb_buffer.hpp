#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "crumbtrail/v1/telemetry.pb.h"
#include "internal/model/breadcrumb_category.hpp"

namespace crumbtrail::breadcrumbs {

/*
  Fixed-capacity ring of the most recent breadcrumbs.

  Add / Snapshot / Clear are serialized by one mutex. When full, Add evicts
  exactly the oldest entry. Snapshot copies; later Adds never show up in a
  snapshot already handed out.
*/
class BreadcrumbBuffer {
 public:
  static constexpr std::size_t kDefaultCapacity = 50;

  explicit BreadcrumbBuffer(std::size_t capacity = kDefaultCapacity);

  void Add(std::string message, crumbtrail::model::BreadcrumbCategory category);

  std::vector<crumbtrail::v1::Breadcrumb> Snapshot() const;

  void Clear();

  std::size_t Size() const;
  std::size_t Capacity() const {
    return slots_.size();
  }

 private:
  mutable std::mutex                      mutex_;
  std::vector<crumbtrail::v1::Breadcrumb> slots_;
  std::size_t                             head_ = 0; // index of the oldest entry
  std::size_t                             size_ = 0;
};

} // namespace crumbtrail::breadcrumbs
