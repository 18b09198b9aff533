// Fuzz target for format specifiers
// Copyright (C) 2026 libbyteconv contributors
//
// First byte is the value, the rest is the format token. Unknown tokens
// must raise Invalid_format; D and X output must parse back.

#include "fuzz_common.h"
#include "libbyteconv/byte.h"
#include "libbyteconv/except.h"
#include "libbyteconv/num_format.h"
#include <cctype>
#include <cstdint>
#include <cstddef>
#include <string>

using namespace byteconv;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  // Limit input size to prevent slow units
  if (size < 1 || size > fuzz::MAX_INPUT_SIZE) return 0;

  const Byte value = data[0];
  std::string token(reinterpret_cast<const char*>(data + 1), size - 1);

  num_format::Format_spec spec;
  try {
    spec = num_format::parse_format_spec(token);
  } catch (const Invalid_format&) {
    try {
      (void)value.to_string(token, &fuzz::exotic_conventions());
      fuzz::violation();
    } catch (const Invalid_format&) {}
    return 0;
  }

  if (spec.precision > 99)
    fuzz::violation();

  const Numeric_conventions& conv = fuzz::exotic_conventions();
  std::string out = value.to_string(token, &conv);

  switch (std::toupper(static_cast<unsigned char>(spec.letter))) {
  case 'D':
    if (Byte::parse(out, Number_styles::Integer, &conv) != value)
      fuzz::violation();
    break;
  case 'X':
    if (Byte::parse(out, Number_styles::Hex_number, &conv) != value)
      fuzz::violation();
    break;
  default:
    if (out.empty())
      fuzz::violation();
    break;
  }

  // Wider magnitudes go through the grouping and rounding paths
  if (size >= 5) {
    std::uint32_t wide = static_cast<std::uint32_t>(data[1]) |
                         (static_cast<std::uint32_t>(data[2]) << 8) |
                         (static_cast<std::uint32_t>(data[3]) << 16) |
                         (static_cast<std::uint32_t>(data[4]) << 24);
    (void)num_format::format_unsigned(wide, token, &conv);
  }

  return 0;
}
