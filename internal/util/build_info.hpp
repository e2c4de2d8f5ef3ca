#pragma once

#include <string_view>

namespace sealbench::util {

inline constexpr std::string_view kToolName    = "sealbench";
inline constexpr std::string_view kToolVersion = "0.1.0";

} // namespace sealbench::util
