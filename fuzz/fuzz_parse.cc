// Fuzz target for byte parsing
// Copyright (C) 2026 libbyteconv contributors
//
// Feeds arbitrary text and styles through parse/try_parse and checks that
// both entry points agree and that accepted values format back losslessly.

#include "fuzz_common.h"
#include "libbyteconv/byte.h"
#include "libbyteconv/except.h"
#include <cstdint>
#include <cstddef>
#include <string>

using namespace byteconv;

namespace {

void check_text(const std::string& input, Number_styles styles, const Numeric_conventions& conv)
{
  Byte via_try;
  bool ok = Byte::try_parse(input, styles, &conv, via_try);

  try {
    Byte via_parse = Byte::parse(input, styles, &conv);
    if (!ok || via_parse != via_try)
      fuzz::violation();
  } catch (const Format_error&) {
    if (ok) fuzz::violation();
  } catch (const Overflow_error&) {
    if (ok) fuzz::violation();
  }

  if (!ok) {
    if (via_try.value() != 0)
      fuzz::violation();
    return;
  }

  // Round-trip through the general and hex formats
  if (Byte::parse(via_try.to_string("G", &conv), Number_styles::Integer, &conv) != via_try)
    fuzz::violation();
  if (Byte::parse(via_try.to_string("x", &conv), Number_styles::Hex_number, &conv) != via_try)
    fuzz::violation();
}

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  // Limit input size to prevent slow units
  if (size > fuzz::MAX_INPUT_SIZE) return 0;

  Number_styles styles = fuzz::take_styles(data, size);
  std::string input(reinterpret_cast<const char*>(data), size);

  try {
    validate_styles(styles);
  } catch (const Invalid_style&) {
    // Both entry points must reject the styles before looking at the text
    Byte b;
    try {
      Byte::try_parse(input, styles, nullptr, b);
      fuzz::violation();
    } catch (const Invalid_style&) {}
    return 0;
  }

  check_text(input, styles, *Numeric_conventions::invariant());
  check_text(input, styles, fuzz::exotic_conventions());
  return 0;
}
