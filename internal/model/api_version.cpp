#include "api_version.hpp"

#include <array>
#include <cctype>
#include <limits>

#include "internal/util/errors.hpp"

namespace sealbench::model {

namespace {

constexpr std::array<ApiVersion, 3> kSupported = {kApiVersion1_0_0, kApiVersion1_1_0, kApiVersion1_2_0};

} // namespace

ApiVersion ApiVersion::Parse(std::string_view text) {
  std::array<uint32_t, 3> parts{};
  size_t                  part  = 0;
  bool                    digit = false;

  for (char c : text) {
    if (c == '.') {
      if (!digit || part == 2) {
        throw util::InvalidApiVersion("malformed api version '" + std::string(text) + "'");
      }
      ++part;
      digit = false;
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw util::InvalidApiVersion("malformed api version '" + std::string(text) + "'");
    }
    const uint32_t d = static_cast<uint32_t>(c - '0');
    if (parts[part] > (std::numeric_limits<uint32_t>::max() - d) / 10) {
      throw util::InvalidApiVersion("malformed api version '" + std::string(text) + "'");
    }
    parts[part] = parts[part] * 10 + d;
    digit       = true;
  }

  if (part != 2 || !digit) {
    throw util::InvalidApiVersion("malformed api version '" + std::string(text) + "'");
  }

  ApiVersion version(parts[0], parts[1], parts[2]);
  if (!IsSupported(version)) {
    throw util::InvalidApiVersion("unsupported api version '" + std::string(text) + "'");
  }
  return version;
}

bool ApiVersion::IsSupported(const ApiVersion& version) {
  for (const auto& supported : kSupported) {
    if (supported == version) {
      return true;
    }
  }
  return false;
}

std::string ApiVersion::ToString() const {
  return std::to_string(major_) + "." + std::to_string(minor_) + "." + std::to_string(patch_);
}

} // namespace sealbench::model
