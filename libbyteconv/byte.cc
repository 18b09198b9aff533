//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include "byte.h"

#include "num_format.h"
#include "num_parse.h"

#include <ostream>

namespace byteconv {

int Byte::compare_to(Byte other) const
{
  return static_cast<int>(value_) - static_cast<int>(other.value_);
}

std::string Byte::to_string() const
{
  return num_format::format(value_);
}

std::string Byte::to_string(const std::string& format) const
{
  return num_format::format(value_, format);
}

std::string Byte::to_string(const Numeric_conventions* conv) const
{
  return num_format::format(value_, std::string(), conv);
}

std::string Byte::to_string(const std::string& format, const Numeric_conventions* conv) const
{
  return num_format::format(value_, format, conv);
}

Byte Byte::parse(const std::string& text, Number_styles styles, const Numeric_conventions* conv)
{
  return Byte(num_parse::parse(text, styles, conv));
}

Byte Byte::parse(const std::string& text, const Numeric_conventions* conv)
{
  return parse(text, Number_styles::Integer, conv);
}

Byte Byte::parse(const char* text, Number_styles styles, const Numeric_conventions* conv)
{
  return Byte(num_parse::parse(text, styles, conv));
}

Byte Byte::parse(const char* text, const Numeric_conventions* conv)
{
  return parse(text, Number_styles::Integer, conv);
}

bool Byte::try_parse(const std::string& text, Byte& result)
{
  return try_parse(text, Number_styles::Integer, nullptr, result);
}

bool Byte::try_parse(
  const std::string& text,
  Number_styles styles,
  const Numeric_conventions* conv,
  Byte& result)
{
  std::uint8_t v = 0;
  result = Byte();
  bool ok = num_parse::try_parse(text, styles, conv, v);
  result = Byte(v);
  return ok;
}

bool Byte::try_parse(const char* text, Byte& result)
{
  return try_parse(text, Number_styles::Integer, nullptr, result);
}

bool Byte::try_parse(
  const char* text,
  Number_styles styles,
  const Numeric_conventions* conv,
  Byte& result)
{
  std::uint8_t v = 0;
  result = Byte();
  bool ok = num_parse::try_parse(text, styles, conv, v);
  result = Byte(v);
  return ok;
}

std::ostream& operator <<(std::ostream& os, Byte b)
{
  return os << static_cast<unsigned>(b.value());
}

} // namespace byteconv
