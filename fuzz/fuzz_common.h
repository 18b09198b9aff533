// Common utilities for fuzz targets
// Copyright (C) 2026 libbyteconv contributors

#ifndef BYTECONV_FUZZ_COMMON_H
#define BYTECONV_FUZZ_COMMON_H

#include <cstddef>
#include <cstdint>
#include <cstdlib>

#include "libbyteconv/conventions.h"
#include "libbyteconv/number_styles.h"

namespace fuzz {

// Maximum input size to prevent slow units
constexpr size_t MAX_INPUT_SIZE = 64 * 1024;

// Two leading bytes select the styles; 11 bits so undefined bits are hit too.
inline byteconv::Number_styles take_styles(const uint8_t*& data, size_t& size)
{
  std::uint32_t raw = 0;
  if (size >= 2) {
    raw = (static_cast<std::uint32_t>(data[0]) | (static_cast<std::uint32_t>(data[1]) << 8)) & 0x7FF;
    data += 2;
    size -= 2;
  }
  return static_cast<byteconv::Number_styles>(raw);
}

// Profile with multi-byte tokens, including the no-break space group separator.
inline const byteconv::Numeric_conventions& exotic_conventions()
{
  static const byteconv::Numeric_conventions conv = [] {
    byteconv::Numeric_conventions c;
    c.set_negative_sign("\xE2\x88\x92");   // minus sign
    c.set_decimal_separator(",");
    c.set_group_separator("\xC2\xA0");
    c.set_currency_symbol("\xE2\x82\xAC");
    return c;
  }();
  return conv;
}

// Report an invariant violation so libFuzzer keeps the input.
[[noreturn]] inline void violation()
{
  std::abort();
}

} // namespace fuzz

#endif // BYTECONV_FUZZ_COMMON_H
