#include "internal/storage/common/file_order.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <vector>

namespace {

using crumbtrail::storage::common::FileNameTime;
using crumbtrail::storage::common::SortChronologically;

void TestExtractsLeadingTimestamp() {
  assert(FileNameTime("1234567890123-abc.event") == 1234567890123LL);
  assert(FileNameTime("1700000000000-fatal-0a1b.crash") == 1700000000000LL);
  assert(FileNameTime("0-x.event") == 0);
}

void TestMalformedNamesMapToZero() {
  assert(FileNameTime("noDash.event") == 0);
  assert(FileNameTime("") == 0);
  assert(FileNameTime("-12345.event") == 0);
  assert(FileNameTime("12a45-x.event") == 0);
  assert(FileNameTime("+12-x.event") == 0);
  assert(FileNameTime("99999999999999999999999-x.event") == 0);
}

void TestInvalidNamesSortFirstThenAscending() {
  std::vector<std::filesystem::path> files = {
      "/q/events/300-c.event", "/q/events/garbage.event", "/q/events/100-a.event",
      "/q/events/-5.event",    "/q/events/200-b.event",
  };

  SortChronologically(files);

  assert(FileNameTime(files[0].filename().string()) == 0);
  assert(FileNameTime(files[1].filename().string()) == 0);
  assert(files[2].filename() == "100-a.event");
  assert(files[3].filename() == "200-b.event");
  assert(files[4].filename() == "300-c.event");
}

void TestOrderingUsesFileNameOnly() {
  std::vector<std::filesystem::path> files = {"/z/20-b.event", "/a/10-a.event"};
  SortChronologically(files);
  assert(files[0].filename() == "10-a.event");
}

} // namespace

int main() {
  TestExtractsLeadingTimestamp();
  TestMalformedNamesMapToZero();
  TestInvalidNamesSortFirstThenAscending();
  TestOrderingUsesFileNameOnly();

  std::cout << "crumbtrail_unit_file_order: pass\n";
  return 0;
}
