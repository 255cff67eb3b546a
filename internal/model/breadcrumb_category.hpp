#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace crumbtrail::model {

enum class BreadcrumbCategory : std::uint8_t {
  kNavigation = 0,
  kUserAction = 1,
  kNetwork    = 2,
  kError      = 3,
  kCustom     = 4,
};

inline constexpr std::array<BreadcrumbCategory, 5> kAllBreadcrumbCategories = {
    BreadcrumbCategory::kNavigation, BreadcrumbCategory::kUserAction, BreadcrumbCategory::kNetwork,
    BreadcrumbCategory::kError,      BreadcrumbCategory::kCustom,
};

// Token stored in Breadcrumb.category and sent to the collector.
constexpr std::string_view ToApiValue(BreadcrumbCategory category) {
  switch (category) {
    case BreadcrumbCategory::kNavigation:
      return "navigation";
    case BreadcrumbCategory::kUserAction:
      return "user_action";
    case BreadcrumbCategory::kNetwork:
      return "network";
    case BreadcrumbCategory::kError:
      return "error";
    case BreadcrumbCategory::kCustom:
    default:
      return "custom";
  }
}

constexpr std::optional<BreadcrumbCategory> BreadcrumbCategoryFromApiValue(std::string_view value) {
  for (auto category : kAllBreadcrumbCategories) {
    if (ToApiValue(category) == value) {
      return category;
    }
  }
  return std::nullopt;
}

} // namespace crumbtrail::model
