#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace sealbench::model {

/*
  Proof API version, "major.minor.patch".

  Selects engine behaviour; fixed for the lifetime of a run.
*/
class ApiVersion {
 public:
  constexpr ApiVersion() = default;
  constexpr ApiVersion(uint32_t major, uint32_t minor, uint32_t patch) : major_(major), minor_(minor), patch_(patch) {
  }

  // Throws InvalidApiVersion for malformed or unrecognized versions.
  static ApiVersion Parse(std::string_view text);

  static bool IsSupported(const ApiVersion& version);

  uint32_t major() const {
    return major_;
  }
  uint32_t minor() const {
    return minor_;
  }
  uint32_t patch() const {
    return patch_;
  }

  std::string ToString() const;

  auto operator<=>(const ApiVersion&) const = default;

 private:
  uint32_t major_{1};
  uint32_t minor_{0};
  uint32_t patch_{0};
};

inline constexpr ApiVersion kApiVersion1_0_0{1, 0, 0};
inline constexpr ApiVersion kApiVersion1_1_0{1, 1, 0};
inline constexpr ApiVersion kApiVersion1_2_0{1, 2, 0};

inline constexpr std::string_view kDefaultApiVersion = "1.0.0";

} // namespace sealbench::model
