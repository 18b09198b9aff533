//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef BYTECONV_NUMBER_STYLES_H
#define BYTECONV_NUMBER_STYLES_H

#include "api_export.h"

#include <cstdint>
#include <string>

namespace byteconv {

//! Parsing leniencies. Bit layout matches the runtime this library
//! interoperates with, so raw values can be exchanged unchanged.
enum class Number_styles : std::uint32_t {
  None                  = 0x000,

  Allow_leading_white   = 0x001,
  Allow_trailing_white  = 0x002,
  Allow_leading_sign    = 0x004,
  Allow_trailing_sign   = 0x008,
  Allow_parentheses     = 0x010,
  Allow_decimal_point   = 0x020,
  Allow_thousands       = 0x040,
  Allow_exponent        = 0x080,
  Allow_currency_symbol = 0x100,
  Allow_hex_specifier   = 0x200,

  Integer    = Allow_leading_white | Allow_trailing_white | Allow_leading_sign,
  Hex_number = Allow_leading_white | Allow_trailing_white | Allow_hex_specifier,
  Number     = Integer | Allow_trailing_sign | Allow_decimal_point | Allow_thousands,
  Float      = Integer | Allow_decimal_point | Allow_exponent,
  Currency   = Number | Allow_parentheses | Allow_currency_symbol,
  Any        = Currency | Allow_exponent
};

inline constexpr Number_styles operator |(Number_styles a, Number_styles b)
{
  return static_cast<Number_styles>(
    static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

inline constexpr Number_styles operator &(Number_styles a, Number_styles b)
{
  return static_cast<Number_styles>(
    static_cast<std::uint32_t>(a) & static_cast<std::uint32_t>(b));
}

inline constexpr Number_styles operator ~(Number_styles a)
{
  return static_cast<Number_styles>(~static_cast<std::uint32_t>(a));
}

inline Number_styles& operator |=(Number_styles& a, Number_styles b)
{
  a = a | b;
  return a;
}

//! True when every bit of flag is set in styles.
inline constexpr bool has_flag(Number_styles styles, Number_styles flag)
{
  return (styles & flag) == flag;
}

//! Throws Invalid_style when styles has undefined bits set or combines
//! the hex specifier with anything but the white space flags.
LIBBYTECONV_API void validate_styles(Number_styles styles);

//! Parses a style expression: composite or flag names
//! ("Integer", "Allow_thousands", case-insensitive, underscores optional)
//! joined with '|' or ',', or a decimal/0x-prefixed raw value.
//! Throws Invalid_style for unknown names. The result is not validated.
LIBBYTECONV_API Number_styles styles_from_string(const std::string& expr);

//! Renders styles as a composite name when one matches exactly,
//! otherwise as flag names joined with " | ".
LIBBYTECONV_API std::string to_string(Number_styles styles);

} // namespace byteconv

#endif
