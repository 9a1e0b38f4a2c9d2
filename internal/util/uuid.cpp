#include "uuid.hpp"

#include <stdexcept>

namespace lotcost::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool IsDashPosition(size_t byte_index) {
  return byte_index == 4 || byte_index == 6 || byte_index == 8 || byte_index == 10;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID     id{};
  uint64_t bits = 0;
  for (size_t i = 0; i < id.size(); ++i) {
    if (i % 8 == 0) bits = rng();
    id[i] = static_cast<uint8_t>(bits >> ((i % 8) * 8));
  }

  // version 4, RFC4122 variant
  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40);
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);
  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < id.size(); ++i) {
    if (IsDashPosition(i)) out.push_back('-');
    out.push_back(kHexDigits[id[i] >> 4]);
    out.push_back(kHexDigits[id[i] & 0x0F]);
  }
  return out;
}

UUID FromString(const std::string& str) {
  if (str.size() != 36) throw std::runtime_error("Invalid UUID string: " + str);

  UUID   id{};
  size_t pos = 0;
  for (size_t i = 0; i < id.size(); ++i) {
    if (IsDashPosition(i)) {
      if (str[pos] != '-') throw std::runtime_error("Invalid UUID string: " + str);
      ++pos;
    }
    const int hi = HexValue(str[pos]);
    const int lo = HexValue(str[pos + 1]);
    if (hi < 0 || lo < 0) throw std::runtime_error("Invalid UUID string: " + str);
    id[i] = static_cast<uint8_t>((hi << 4) | lo);
    pos += 2;
  }
  return id;
}

std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace lotcost::util
