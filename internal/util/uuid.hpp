#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace crumbtrail::util {

/*
  UUID helpers

  Session ids and record file suffixes are random RFC4122 v4 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// 32 lowercase hex chars, no dashes.
std::string ToHex(const UUID& id);

} // namespace crumbtrail::util
