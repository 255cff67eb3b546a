#include "uuid.hpp"

#include <stdexcept>

namespace crumbtrail::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

bool IsDashPosition(size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (size_t i = 0; i < id.size(); i += 8) {
    uint64_t bits = rng();
    for (size_t j = 0; j < 8; ++j) {
      id[i + j] = static_cast<uint8_t>(bits >> (j * 8));
    }
  }

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToHex(const UUID& id) {
  std::string out;
  out.reserve(id.size() * 2);
  for (auto b : id) {
    out.push_back(kHexDigits[(b >> 4) & 0x0F]);
    out.push_back(kHexDigits[b & 0x0F]);
  }
  return out;
}

std::string ToString(const UUID& id) {
  const auto hex = ToHex(id);

  std::string out;
  out.reserve(36);
  for (size_t i = 0, h = 0; i < 36; ++i) {
    out.push_back(IsDashPosition(i) ? '-' : hex[h++]);
  }
  return out;
}

UUID FromString(const std::string& str) {
  std::string hex;
  hex.reserve(32);
  for (size_t i = 0; i < str.size(); ++i) {
    if (str[i] == '-' && IsDashPosition(i)) continue;
    if (HexValue(str[i]) < 0) {
      throw std::invalid_argument("invalid uuid: '" + str + "'");
    }
    hex.push_back(str[i]);
  }
  if (hex.size() != 32) {
    throw std::invalid_argument("invalid uuid: '" + str + "'");
  }

  UUID id{};
  for (size_t i = 0; i < id.size(); ++i) {
    id[i] = static_cast<uint8_t>((HexValue(hex[2 * i]) << 4) | HexValue(hex[2 * i + 1]));
  }
  return id;
}

} // namespace crumbtrail::util
