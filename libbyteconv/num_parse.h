//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef LIBBYTECONV_NUM_PARSE_H
#define LIBBYTECONV_NUM_PARSE_H

#include "api_export.h"
#include "conventions.h"
#include "number_styles.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace byteconv {
namespace num_parse {

//! Outcome of the non-throwing parser core.
enum class Parse_status {
  ok,
  format,    //!< text layout does not match the styles
  overflow   //!< well-formed, but outside [0, 255]
};

//! Parser core. Styles must already be validated; never throws.
/*! On ok stores the value into result, otherwise leaves it untouched.
    Accepted layout, in order:
    [ws] [sign | '('] [currency] digits [exponent] [currency] [sign] [')'] [ws]
*/
LIBBYTECONV_API Parse_status parse_byte(
  std::string_view text,
  Number_styles styles,
  const Numeric_conventions& conv,
  std::uint8_t& result);

//! Returns the length of token matched at text[pos], 0 if no match.
//! Empty tokens never match. A no-break space in token matches ' '.
LIBBYTECONV_API size_t match_token(
  std::string_view text, size_t pos, const std::string& token);

//! Parse text or throw Null_argument, Invalid_style, Format_error
//! or Overflow_error. nullptr conventions means the current snapshot.
LIBBYTECONV_API std::uint8_t parse(
  const char* text,
  Number_styles styles = Number_styles::Integer,
  const Numeric_conventions* conv = nullptr);

LIBBYTECONV_API std::uint8_t parse(
  const std::string& text,
  Number_styles styles = Number_styles::Integer,
  const Numeric_conventions* conv = nullptr);

//! Same as parse() but reports failures by returning false and setting
//! result to 0. Still throws Invalid_style for malformed styles.
LIBBYTECONV_API bool try_parse(
  const char* text,
  Number_styles styles,
  const Numeric_conventions* conv,
  std::uint8_t& result);

LIBBYTECONV_API bool try_parse(
  const std::string& text,
  Number_styles styles,
  const Numeric_conventions* conv,
  std::uint8_t& result);

} // namespace num_parse
} // namespace byteconv

#endif // LIBBYTECONV_NUM_PARSE_H
