#include "internal/model/breadcrumb_category.hpp"

#include <cassert>
#include <cctype>
#include <iostream>
#include <set>
#include <string>

namespace {

using crumbtrail::model::BreadcrumbCategory;
using crumbtrail::model::BreadcrumbCategoryFromApiValue;
using crumbtrail::model::kAllBreadcrumbCategories;
using crumbtrail::model::ToApiValue;

void TestApiValuesAreLowercaseAndUnique() {
  std::set<std::string> seen;
  for (auto category : kAllBreadcrumbCategories) {
    const std::string value(ToApiValue(category));
    assert(!value.empty());
    for (char c : value) {
      assert(!std::isupper(static_cast<unsigned char>(c)));
    }
    assert(seen.insert(value).second && "category tokens must be unique");
  }
  assert(seen.size() == kAllBreadcrumbCategories.size());
}

void TestKnownTokens() {
  assert(ToApiValue(BreadcrumbCategory::kNavigation) == "navigation");
  assert(ToApiValue(BreadcrumbCategory::kUserAction) == "user_action");
  assert(ToApiValue(BreadcrumbCategory::kNetwork) == "network");
  assert(ToApiValue(BreadcrumbCategory::kError) == "error");
  assert(ToApiValue(BreadcrumbCategory::kCustom) == "custom");
}

void TestParseBackFromToken() {
  for (auto category : kAllBreadcrumbCategories) {
    auto parsed = BreadcrumbCategoryFromApiValue(ToApiValue(category));
    assert(parsed.has_value());
    assert(*parsed == category);
  }
  assert(!BreadcrumbCategoryFromApiValue("Navigation").has_value());
  assert(!BreadcrumbCategoryFromApiValue("").has_value());
}

} // namespace

int main() {
  TestApiValuesAreLowercaseAndUnique();
  TestKnownTokens();
  TestParseBackFromToken();

  std::cout << "crumbtrail_unit_breadcrumb_category: pass\n";
  return 0;
}
