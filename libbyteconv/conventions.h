//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef BYTECONV_CONVENTIONS_H
#define BYTECONV_CONVENTIONS_H

#include "api_export.h"

#include <memory>
#include <stdexcept>
#include <string>

namespace byteconv {

//! Sign, separator and currency tokens used for formatting and parsing.
/*! Objects are plain values while being configured. Once published through
    set_current() or handed to another thread they must be treated as
    immutable: install a new snapshot instead of changing a shared one.
*/
class LIBBYTECONV_API Numeric_conventions {
public:
  class Bad_value;

  //! Largest precision accepted by format specifiers and number_decimal_digits.
  static constexpr int max_precision = 99;

  //! Invariant profile: "-", "+", ".", ",", "$" and 2 decimal digits.
  Numeric_conventions();

  const std::string& negative_sign() const { return negative_sign_; }
  const std::string& positive_sign() const { return positive_sign_; }
  const std::string& decimal_separator() const { return decimal_separator_; }
  const std::string& group_separator() const { return group_separator_; }
  const std::string& currency_symbol() const { return currency_symbol_; }
  int number_decimal_digits() const { return number_decimal_digits_; }

  void set_negative_sign(const std::string& s) { negative_sign_ = s; }
  void set_positive_sign(const std::string& s) { positive_sign_ = s; }
  void set_decimal_separator(const std::string& s) { decimal_separator_ = s; }
  void set_group_separator(const std::string& s) { group_separator_ = s; }
  void set_currency_symbol(const std::string& s) { currency_symbol_ = s; }

  //! Throws Bad_value unless 0 <= n <= max_precision.
  void set_number_decimal_digits(int n);

  bool operator==(const Numeric_conventions&) const;
  bool operator!=(const Numeric_conventions& other) const { return !(*this == other); }

  //! Shared read-only invariant profile.
  static std::shared_ptr<const Numeric_conventions> invariant();

  //! Snapshot used when a caller passes no conventions.
  //! Each call returns one consistent snapshot; never nullptr.
  static std::shared_ptr<const Numeric_conventions> current();

  //! Installs a new current snapshot. nullptr restores the invariant profile.
  static void set_current(std::shared_ptr<const Numeric_conventions>);

  //! Returns *explicit_conv, or loads current() into holder and returns it.
  static const Numeric_conventions& resolve(
    const Numeric_conventions* explicit_conv,
    std::shared_ptr<const Numeric_conventions>& holder);

private:
  std::string negative_sign_;
  std::string positive_sign_;
  std::string decimal_separator_;
  std::string group_separator_;
  std::string currency_symbol_;
  int number_decimal_digits_;
};

//! Rejected convention setting.
class LIBBYTECONV_API Numeric_conventions::Bad_value: public std::invalid_argument {
public:
  explicit Bad_value(const std::string& what):
    std::invalid_argument("byteconv::Numeric_conventions: " + what) {}
};

} // namespace byteconv

#endif
