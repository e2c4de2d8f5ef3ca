#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sealbench::util {

/*
  Human readable byte sizes.

    "2048", "2KiB", "2 KB", "1.5MiB", "32GiB"

  Decimal units (KB, MB, ...) are powers of 1000, binary units (KiB, MiB, ...)
  powers of 1024. Units are case-insensitive; a bare "K"/"M"/"G" is decimal.
  Throws InvalidSize for unparseable, fractional-byte or zero results.
*/
uint64_t ParseByteSize(std::string_view text);

/*
  Largest binary unit that divides bytes exactly, e.g. 2048 -> "2KiB".
*/
std::string FormatByteSize(uint64_t bytes);

} // namespace sealbench::util
