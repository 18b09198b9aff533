//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2011 Anton Dedov

#ifndef _libbyteconv_safe_math_h_
#define _libbyteconv_safe_math_h_

#include "api_export.h"

#include <limits>
#include <stdexcept>
#include <type_traits>

namespace byteconv {

//! Exception thrown when an integer overflow is detected.
class LIBBYTECONV_API Integer_overflow: public std::overflow_error {
public:
  Integer_overflow():
    std::overflow_error("Integer overflow detected") {}

  explicit Integer_overflow(const char* msg):
    std::overflow_error(msg) {}
};

namespace safe_math {

//! Check if addition of two non-negative values would overflow without throwing.
template <class T>
inline bool would_overflow_add(T a, T b)
{
  static_assert(std::is_integral_v<T>, "safe_math requires integral type");
  return b > std::numeric_limits<T>::max() - a;
}

//! Check if multiplication of two non-negative values would overflow without throwing.
template <class T>
inline bool would_overflow_mul(T a, T b)
{
  static_assert(std::is_integral_v<T>, "safe_math requires integral type");
  return a != 0 && b > std::numeric_limits<T>::max() / a;
}

//! Safely add two non-negative values, throwing Integer_overflow on overflow.
template <class T>
inline T add(T a, T b)
{
  if (would_overflow_add(a, b)) {
    throw Integer_overflow("Addition overflow");
  }
  return a + b;
}

//! Safely multiply two non-negative values, throwing Integer_overflow on overflow.
template <class T>
inline T mul(T a, T b)
{
  if (would_overflow_mul(a, b)) {
    throw Integer_overflow("Multiplication overflow");
  }
  return a * b;
}

//! Shift one digit into accumulator: acc = acc * base + digit.
//! Returns false and leaves acc untouched when the result does not fit.
template <class T>
inline bool push_digit(T& acc, T base, T digit)
{
  if (would_overflow_mul(acc, base))
    return false;

  T shifted = acc * base;
  if (would_overflow_add(shifted, digit))
    return false;

  acc = shifted + digit;
  return true;
}

} // namespace safe_math
} // namespace byteconv

#endif
// vim:ts=2:sw=2:et
