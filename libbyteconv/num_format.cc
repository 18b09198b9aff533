//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include "num_format.h"

#include "except.h"
#include "safe_math.h"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace byteconv {
namespace num_format {

namespace {

constexpr int default_exp_precision = 6;
constexpr size_t group_size = 3;

//! Digits without leading zeros; value = 0.digits * 10^scale.
struct Digits {
  std::string digits;
  int scale = 0;
};

std::string to_chars_string(std::uint32_t value, int base)
{
  char buf[16];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, base);
  (void)ec;  // 16 bytes always hold a 32-bit value
  return std::string(buf, ptr);
}

Digits make_digits(std::uint32_t value)
{
  Digits d;
  if (value) {
    d.digits = to_chars_string(value, 10);
    d.scale = static_cast<int>(d.digits.size());
  }
  return d;
}

// Round half up to pos significant digits, dropping trailing zeros.
void round_digits(Digits& num, size_t pos)
{
  std::string& d = num.digits;
  size_t i = std::min(pos, d.size());

  if (i == pos && i < d.size() && d[i] >= '5') {
    while (i > 0 && d[i - 1] == '9')
      --i;

    if (i > 0) {
      ++d[i - 1];
    } else {
      ++num.scale;
      d[0] = '1';
      i = 1;
    }
  } else {
    while (i > 0 && d[i - 1] == '0')
      --i;
  }

  if (i == 0)
    num.scale = 0;

  d.resize(i);
}

void append_padded(std::string& out, std::string digits, size_t min_len)
{
  if (digits.size() < min_len)
    out.append(min_len - digits.size(), '0');
  out += digits;
}

void append_exponent(std::string& out, int exp, char exp_char,
                     const Numeric_conventions& conv, size_t min_digits)
{
  out += exp_char;
  if (exp < 0) {
    out += conv.negative_sign();
    exp = -exp;
  } else {
    out += conv.positive_sign();
  }
  append_padded(out, to_chars_string(static_cast<std::uint32_t>(exp), 10), min_digits);
}

void append_fraction(std::string& out, int precision, const Numeric_conventions& conv)
{
  if (precision > 0) {
    out += conv.decimal_separator();
    out.append(static_cast<size_t>(precision), '0');
  }
}

std::string format_general(std::uint32_t value, const Format_spec& spec,
                           const Numeric_conventions& conv)
{
  std::string plain = to_chars_string(value, 10);
  if (spec.precision <= 0 || static_cast<size_t>(spec.precision) >= plain.size())
    return plain;

  Digits num = make_digits(value);
  round_digits(num, static_cast<size_t>(spec.precision));

  // More integral digits than precision: scientific form.
  std::string out(1, num.digits[0]);
  if (num.digits.size() > 1) {
    out += conv.decimal_separator();
    out.append(num.digits, 1, std::string::npos);
  }

  char exp_char = std::isupper(static_cast<unsigned char>(spec.letter)) ? 'E' : 'e';
  append_exponent(out, num.scale - 1, exp_char, conv, 2);
  return out;
}

std::string format_scientific(std::uint32_t value, const Format_spec& spec,
                              const Numeric_conventions& conv)
{
  int precision = spec.precision < 0 ? default_exp_precision : spec.precision;

  Digits num = make_digits(value);
  round_digits(num, static_cast<size_t>(precision) + 1);

  const std::string& d = num.digits;
  std::string out(1, d.empty() ? '0' : d[0]);

  if (precision > 0) {
    out += conv.decimal_separator();
    for (int i = 1; i <= precision; ++i)
      out += static_cast<size_t>(i) < d.size() ? d[i] : '0';
  }

  int exp = d.empty() ? 0 : num.scale - 1;
  append_exponent(out, exp, spec.letter == 'E' ? 'E' : 'e', conv, 3);
  return out;
}

std::string format_number(std::uint32_t value, int precision,
                          const Numeric_conventions& conv)
{
  const std::string digits = to_chars_string(value, 10);
  const std::string& sep = conv.group_separator();

  size_t groups = (digits.size() - 1) / group_size;
  std::string out;
  out.reserve(safe_math::add(digits.size(), safe_math::mul(groups, sep.size())));

  size_t first = digits.size() - groups * group_size;
  out.append(digits, 0, first);

  for (size_t i = first; i < digits.size(); i += group_size) {
    out += sep;
    out.append(digits, i, group_size);
  }

  append_fraction(out, precision, conv);
  return out;
}

} // anonymous namespace

Format_spec parse_format_spec(const std::string& token)
{
  if (token.empty())
    return Format_spec{'G', -1};

  const char ch = token[0];
  if (!std::isalpha(static_cast<unsigned char>(ch)) ||
      static_cast<unsigned char>(ch) >= 0x80)
  {
    throw Invalid_format(token);
  }

  size_t p = 1;
  int n = -1;
  if (p < token.size() && std::isdigit(static_cast<unsigned char>(token[p]))) {
    n = token[p++] - '0';
    while (p < token.size() && std::isdigit(static_cast<unsigned char>(token[p]))) {
      n = n * 10 + (token[p++] - '0');
      if (n >= 10)
        break;
    }
  }

  if (p != token.size())
    throw Invalid_format(token);

  switch (std::toupper(static_cast<unsigned char>(ch))) {
  case 'D':
  case 'E':
  case 'F':
  case 'G':
  case 'N':
  case 'X':
    return Format_spec{ch, n};
  default:
    throw Invalid_format(token);
  }
}

std::string format_unsigned(
  std::uint32_t value,
  const std::string& token,
  const Numeric_conventions* explicit_conv)
{
  const Format_spec spec = parse_format_spec(token);

  std::shared_ptr<const Numeric_conventions> holder;
  const Numeric_conventions& conv = Numeric_conventions::resolve(explicit_conv, holder);

  const size_t min_digits = spec.precision < 0 ? 0 : static_cast<size_t>(spec.precision);
  const int fraction = spec.precision < 0 ? conv.number_decimal_digits() : spec.precision;
  std::string out;

  switch (std::toupper(static_cast<unsigned char>(spec.letter))) {
  case 'G':
    return format_general(value, spec, conv);

  case 'D':
    append_padded(out, to_chars_string(value, 10), min_digits);
    return out;

  case 'E':
    return format_scientific(value, spec, conv);

  case 'F':
    out = to_chars_string(value, 10);
    append_fraction(out, fraction, conv);
    return out;

  case 'N':
    return format_number(value, fraction, conv);

  case 'X': {
    std::string hex = to_chars_string(value, 16);
    if (spec.letter == 'X')
      std::transform(hex.begin(), hex.end(), hex.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    append_padded(out, hex, min_digits);
    return out;
  }

  default:
    throw Invalid_format(token);
  }
}

} // namespace num_format
} // namespace byteconv
