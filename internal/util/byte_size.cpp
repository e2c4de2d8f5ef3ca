#include "byte_size.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <limits>
#include <utility>

#include "internal/util/errors.hpp"

namespace sealbench::util {

namespace {

struct Unit {
  std::string_view name;
  uint64_t         multiplier;
};

constexpr uint64_t kKi = 1024;
constexpr uint64_t kK  = 1000;

constexpr std::array<Unit, 17> kUnits = {{
    {"", 1},
    {"b", 1},
    {"k", kK},
    {"kb", kK},
    {"kib", kKi},
    {"m", kK * kK},
    {"mb", kK * kK},
    {"mib", kKi * kKi},
    {"g", kK * kK * kK},
    {"gb", kK * kK * kK},
    {"gib", kKi * kKi * kKi},
    {"t", kK * kK * kK * kK},
    {"tb", kK * kK * kK * kK},
    {"tib", kKi * kKi * kKi * kKi},
    {"p", kK * kK * kK * kK * kK},
    {"pb", kK * kK * kK * kK * kK},
    {"pib", kKi * kKi * kKi * kKi * kKi},
}};

std::string Lower(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

} // namespace

uint64_t ParseByteSize(std::string_view text) {
  const std::string original(text);

  size_t pos = 0;
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;

  const size_t number_start = pos;
  bool         seen_digit   = false;
  bool         seen_dot     = false;
  while (pos < text.size()) {
    const char c = text[pos];
    if (std::isdigit(static_cast<unsigned char>(c))) {
      seen_digit = true;
    } else if (c == '.' && !seen_dot) {
      seen_dot = true;
    } else {
      break;
    }
    ++pos;
  }
  if (!seen_digit) {
    throw InvalidSize("invalid byte size '" + original + "': missing number");
  }
  const std::string number(text.substr(number_start, pos - number_start));

  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
  size_t unit_end = text.size();
  while (unit_end > pos && std::isspace(static_cast<unsigned char>(text[unit_end - 1]))) --unit_end;
  const std::string unit = Lower(text.substr(pos, unit_end - pos));

  uint64_t multiplier = 0;
  for (const auto& candidate : kUnits) {
    if (candidate.name == unit) {
      multiplier = candidate.multiplier;
      break;
    }
  }
  if (multiplier == 0) {
    throw InvalidSize("invalid byte size '" + original + "': unknown unit '" + unit + "'");
  }

  uint64_t bytes = 0;
  if (!seen_dot) {
    uint64_t value = 0;
    for (char c : number) {
      const uint64_t digit = static_cast<uint64_t>(c - '0');
      if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
        throw InvalidSize("invalid byte size '" + original + "': overflow");
      }
      value = value * 10 + digit;
    }
    if (value != 0 && multiplier > std::numeric_limits<uint64_t>::max() / value) {
      throw InvalidSize("invalid byte size '" + original + "': overflow");
    }
    bytes = value * multiplier;
  } else {
    const long double value  = std::stold(number);
    const long double scaled = value * static_cast<long double>(multiplier);
    if (scaled >= static_cast<long double>(std::numeric_limits<uint64_t>::max())) {
      throw InvalidSize("invalid byte size '" + original + "': overflow");
    }
    if (scaled != std::floor(scaled)) {
      throw InvalidSize("invalid byte size '" + original + "': not a whole number of bytes");
    }
    bytes = static_cast<uint64_t>(scaled);
  }

  if (bytes == 0) {
    throw InvalidSize("invalid byte size '" + original + "': must be greater than zero");
  }
  return bytes;
}

std::string FormatByteSize(uint64_t bytes) {
  static constexpr std::array<std::pair<std::string_view, uint64_t>, 5> kBinary = {{
      {"PiB", kKi * kKi * kKi * kKi * kKi},
      {"TiB", kKi * kKi * kKi * kKi},
      {"GiB", kKi * kKi * kKi},
      {"MiB", kKi * kKi},
      {"KiB", kKi},
  }};

  for (const auto& [name, multiplier] : kBinary) {
    if (bytes >= multiplier && bytes % multiplier == 0) {
      return std::to_string(bytes / multiplier) + std::string(name);
    }
  }
  return std::to_string(bytes) + "B";
}

} // namespace sealbench::util
