//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2014 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include <atomic>
#include <utility>

#include "conventions.h"

namespace byteconv {

namespace ConventionsOptions {
  // Readers and writers go through std::atomic_load/std::atomic_store on the
  // shared_ptr, so a reader always gets a complete snapshot together with a
  // reference that keeps it alive. Published objects are never modified.
  std::shared_ptr<const Numeric_conventions>& current_ptr()
  {
    static std::shared_ptr<const Numeric_conventions> ptr =
      Numeric_conventions::invariant();
    return ptr;
  }
}

Numeric_conventions::Numeric_conventions():
  negative_sign_("-"),
  positive_sign_("+"),
  decimal_separator_("."),
  group_separator_(","),
  currency_symbol_("$"),
  number_decimal_digits_(2)
{
}

void Numeric_conventions::set_number_decimal_digits(int n)
{
  if (n < 0 || n > max_precision)
    throw Bad_value("number_decimal_digits must be in range [0, 99], got " +
                    std::to_string(n));

  number_decimal_digits_ = n;
}

bool Numeric_conventions::operator==(const Numeric_conventions& o) const
{
  return negative_sign_ == o.negative_sign_ &&
         positive_sign_ == o.positive_sign_ &&
         decimal_separator_ == o.decimal_separator_ &&
         group_separator_ == o.group_separator_ &&
         currency_symbol_ == o.currency_symbol_ &&
         number_decimal_digits_ == o.number_decimal_digits_;
}

std::shared_ptr<const Numeric_conventions> Numeric_conventions::invariant()
{
  static const std::shared_ptr<const Numeric_conventions> inv =
    std::make_shared<const Numeric_conventions>();
  return inv;
}

std::shared_ptr<const Numeric_conventions> Numeric_conventions::current()
{
  return std::atomic_load(&ConventionsOptions::current_ptr());
}

void Numeric_conventions::set_current(std::shared_ptr<const Numeric_conventions> c)
{
  if (!c)
    c = invariant();

  std::atomic_store(&ConventionsOptions::current_ptr(), std::move(c));
}

const Numeric_conventions& Numeric_conventions::resolve(
  const Numeric_conventions* explicit_conv,
  std::shared_ptr<const Numeric_conventions>& holder)
{
  if (explicit_conv)
    return *explicit_conv;

  holder = current();
  return *holder;
}

} // namespace byteconv
