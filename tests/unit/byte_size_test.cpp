#include "internal/util/byte_size.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using sealbench::util::FormatByteSize;
using sealbench::util::ParseByteSize;

bool RejectsAsInvalidSize(const std::string& text) {
  try {
    (void)ParseByteSize(text);
  } catch (const sealbench::util::InvalidSize&) {
    return true;
  }
  return false;
}

void TestPlainBytes() {
  assert(ParseByteSize("2048") == 2048);
  assert(ParseByteSize("  2048  ") == 2048);
  assert(ParseByteSize("512B") == 512);
}

void TestBinaryAndDecimalUnits() {
  assert(ParseByteSize("2KiB") == 2048);
  assert(ParseByteSize("2KB") == 2000);
  assert(ParseByteSize("2 kib") == 2048);
  assert(ParseByteSize("8MiB") == 8ULL << 20);
  assert(ParseByteSize("32GiB") == 32ULL << 30);
  assert(ParseByteSize("1G") == 1000000000ULL);
}

void TestFractionalValues() {
  assert(ParseByteSize("1.5MiB") == 1572864);
  assert(ParseByteSize("0.5KiB") == 512);
  assert(RejectsAsInvalidSize("1.5B"));
}

void TestRejectsGarbage() {
  assert(RejectsAsInvalidSize(""));
  assert(RejectsAsInvalidSize("KiB"));
  assert(RejectsAsInvalidSize("12 parsecs"));
  assert(RejectsAsInvalidSize("0"));
  assert(RejectsAsInvalidSize("-2KiB"));
  assert(RejectsAsInvalidSize("99999999999999999999"));
  assert(RejectsAsInvalidSize("20000000PiB"));
}

void TestFormatPicksLargestExactUnit() {
  assert(FormatByteSize(2048) == "2KiB");
  assert(FormatByteSize(8ULL << 20) == "8MiB");
  assert(FormatByteSize(1536) == "1536B");
  assert(FormatByteSize(ParseByteSize(FormatByteSize(64ULL << 30))) == "64GiB");
}

} // namespace

int main() {
  TestPlainBytes();
  TestBinaryAndDecimalUnits();
  TestFractionalValues();
  TestRejectsGarbage();
  TestFormatPicksLargestExactUnit();

  std::cout << "sealbench_unit_byte_size: pass\n";
  return 0;
}
