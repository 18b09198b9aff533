//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef LIBBYTECONV_NUM_FORMAT_H
#define LIBBYTECONV_NUM_FORMAT_H

#include "api_export.h"
#include "conventions.h"

#include <cstdint>
#include <string>

namespace byteconv {
namespace num_format {

//! Standard numeric format: letter plus optional precision.
struct Format_spec {
  char letter;     //!< as written; case selects hex digit/exponent case
  int precision;   //!< 0..99, or -1 when omitted
};

//! Splits a format token. Empty token means "G".
//! Throws Invalid_format for unknown letters or malformed precision.
LIBBYTECONV_API Format_spec parse_format_spec(const std::string& token);

//! Formats an unsigned magnitude with G, D, E, F, N or X.
//! nullptr conventions means the current snapshot.
LIBBYTECONV_API std::string format_unsigned(
  std::uint32_t value,
  const std::string& token,
  const Numeric_conventions* conv = nullptr);

inline std::string format(
  std::uint8_t value,
  const std::string& token = std::string(),
  const Numeric_conventions* conv = nullptr)
{
  return format_unsigned(value, token, conv);
}

} // namespace num_format
} // namespace byteconv

#endif // LIBBYTECONV_NUM_FORMAT_H
