//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include "unicode.h"

namespace byteconv {
namespace unicode {

namespace {

inline bool is_continuation(unsigned char c)
{
  return (c & 0xC0) == 0x80;
}

} // anonymous namespace

size_t decode(std::string_view text, size_t pos, char32_t& cp)
{
  if (pos >= text.size())
    return 0;

  const auto lead = static_cast<unsigned char>(text[pos]);
  size_t len = 0;
  char32_t min_cp = 0;

  if (lead < 0x80) {
    cp = lead;
    return 1;
  } else if ((lead & 0xE0) == 0xC0) {
    len = 2; cp = lead & 0x1F; min_cp = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3; cp = lead & 0x0F; min_cp = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    len = 4; cp = lead & 0x07; min_cp = 0x10000;
  } else {
    return 0;
  }

  if (text.size() - pos < len)
    return 0;

  for (size_t i = 1; i < len; ++i) {
    const auto c = static_cast<unsigned char>(text[pos + i]);
    if (!is_continuation(c))
      return 0;
    cp = (cp << 6) | (c & 0x3F);
  }

  // Overlong forms, surrogates and out-of-range values are not characters.
  if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    return 0;

  return len;
}

bool is_white_space(char32_t cp)
{
  if (cp == 0x20 || (cp >= 0x09 && cp <= 0x0D))
    return true;

  if (cp < 0x85)
    return false;

  switch (cp) {
  case 0x0085:
  case 0x00A0:
  case 0x1680:
  case 0x2028:
  case 0x2029:
  case 0x202F:
  case 0x205F:
  case 0x3000:
    return true;
  default:
    return cp >= 0x2000 && cp <= 0x200A;
  }
}

size_t skip_white_space(std::string_view text, size_t pos)
{
  size_t start = pos;
  char32_t cp = 0;

  while (pos < text.size()) {
    size_t len = decode(text, pos, cp);
    if (!len || !is_white_space(cp))
      break;
    pos += len;
  }

  return pos - start;
}

} // namespace unicode
} // namespace byteconv
