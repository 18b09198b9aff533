//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef BYTECONV_BYTE_H
#define BYTECONV_BYTE_H

#include "api_export.h"
#include "conventions.h"
#include "number_styles.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

namespace byteconv {

//! 8-bit unsigned integer with culture-aware text conversion.
/*! Formatting and parsing overloads that take a Numeric_conventions
    pointer treat nullptr as "use Numeric_conventions::current()".
*/
class LIBBYTECONV_API Byte {
public:
  static constexpr std::uint8_t Min_value = 0;
  static constexpr std::uint8_t Max_value = 0xFF;

  Byte(): value_(0) {}
  Byte(std::uint8_t v): value_(v) {}

  std::uint8_t value() const { return value_; }

  //! Negative, zero or positive as this is less, equal or greater.
  int compare_to(Byte other) const;
  bool equals(Byte other) const { return value_ == other.value_; }
  //! Equals the numeric value.
  int hash_code() const { return value_; }

  std::string to_string() const;
  std::string to_string(const std::string& format) const;
  std::string to_string(const Numeric_conventions* conv) const;
  std::string to_string(const std::string& format, const Numeric_conventions* conv) const;

  //! \throws Null_argument, Invalid_style, Format_error, Overflow_error
  static Byte parse(
    const std::string& text,
    Number_styles styles = Number_styles::Integer,
    const Numeric_conventions* conv = nullptr);
  static Byte parse(const std::string& text, const Numeric_conventions* conv);

  static Byte parse(
    const char* text,
    Number_styles styles = Number_styles::Integer,
    const Numeric_conventions* conv = nullptr);
  static Byte parse(const char* text, const Numeric_conventions* conv);

  //! Returns false and sets result to 0 on failure.
  //! \throws Invalid_style for a malformed styles value
  static bool try_parse(const std::string& text, Byte& result);
  static bool try_parse(
    const std::string& text,
    Number_styles styles,
    const Numeric_conventions* conv,
    Byte& result);

  static bool try_parse(const char* text, Byte& result);
  static bool try_parse(
    const char* text,
    Number_styles styles,
    const Numeric_conventions* conv,
    Byte& result);

private:
  std::uint8_t value_;
};

inline bool operator ==(Byte a, Byte b) { return a.equals(b); }
inline bool operator !=(Byte a, Byte b) { return !a.equals(b); }
inline bool operator <(Byte a, Byte b)  { return a.compare_to(b) < 0; }
inline bool operator <=(Byte a, Byte b) { return a.compare_to(b) <= 0; }
inline bool operator >(Byte a, Byte b)  { return a.compare_to(b) > 0; }
inline bool operator >=(Byte a, Byte b) { return a.compare_to(b) >= 0; }

//! Writes the value as decimal digits.
LIBBYTECONV_API std::ostream& operator <<(std::ostream&, Byte);

} // namespace byteconv

namespace std {

template <>
struct hash<byteconv::Byte> {
  size_t operator()(byteconv::Byte b) const
  {
    return static_cast<size_t>(b.hash_code());
  }
};

} // namespace std

#endif
