//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2011 Anton Dedov

#ifndef BYTECONV_EXCEPT_H
#define BYTECONV_EXCEPT_H

#include "api_export.h"

#include <stdexcept>
#include <string>

namespace byteconv
{

//! Closed set of conversion error kinds.
enum class errc {
  null_input = 1,
  invalid_style,
  format,
  overflow,
  invalid_format
};

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable: 4275)
#endif

//! Base class for byteconv exceptions.
class LIBBYTECONV_API Exception: public std::runtime_error {
  errc ex_code;

public:
  Exception( const std::string& i, errc c ):
    runtime_error( i ), ex_code(c) {}

  virtual errc code() const { return ex_code; }
};

#ifdef _MSC_VER
#pragma warning(pop)
#endif

//! Text argument was absent.
class LIBBYTECONV_API Null_argument: public Exception {
public:
  explicit Null_argument( const std::string& arg ):
    Exception("Value cannot be null. Parameter name: " + arg, errc::null_input) {}
};

//! Number_styles value is not a valid combination of flags.
class LIBBYTECONV_API Invalid_style: public Exception {
public:
  explicit Invalid_style( const std::string& d ):
    Exception(std::string("Invalid number styles. ") += d, errc::invalid_style) {}
};

//! Input text does not have a correct numeric layout.
class LIBBYTECONV_API Format_error: public Exception {
public:
  Format_error():
    Exception("Input string was not in a correct format.", errc::format) {}
};

//! Parsed magnitude cannot be represented by the target type.
class LIBBYTECONV_API Overflow_error: public Exception {
public:
  Overflow_error():
    Exception("Value was either too large or too small for an unsigned byte.",
              errc::overflow) {}
};

//! Format specifier is not recognized.
class LIBBYTECONV_API Invalid_format: public Exception {
public:
  explicit Invalid_format( const std::string& spec ):
    Exception("Format specifier was invalid: '" + sanitize(spec) + "'", errc::invalid_format) {}

private:
  //! Keep the message printable and bounded.
  static std::string sanitize(const std::string& spec) {
    constexpr size_t MAX_SPEC_LEN = 32;
    std::string result;

    for (size_t i = 0; i < spec.length() && result.length() < MAX_SPEC_LEN; ++i) {
      char c = spec[i];
      result += (c >= 0x20 && c < 0x7f) ? c : '?';
    }

    if (spec.length() > MAX_SPEC_LEN) {
      result += "...";
    }
    return result;
  }
};

} // namespace byteconv

#endif
