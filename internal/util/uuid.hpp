#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace sealbench::util {

/*
  UUID helpers

  Used to name generated cache directories, raw 16 byte RFC4122 v4.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace sealbench::util
