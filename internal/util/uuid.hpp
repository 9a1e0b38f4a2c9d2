#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace lotcost::util {

/*
  UUID helpers

  Adjustment and consumption records are keyed by raw 16 byte RFC4122
  UUIDs, stored in their canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace lotcost::util
