//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include "num_parse.h"

#include "except.h"
#include "safe_math.h"
#include "unicode.h"

#include <limits>

namespace byteconv {
namespace num_parse {

namespace {

// Decimal digits of INT32_MAX; a longer integral part cannot fit.
constexpr int int32_precision = 10;
constexpr int max_exponent = 1000;

//! Decimal number in digit/scale form: value = 0.digits * 10^scale.
struct Number_buffer {
  std::string digits;   // significant digits, no leading zeros
  int scale = 0;
  bool negative = false;
};

inline bool is_digit(char c)
{
  return c >= '0' && c <= '9';
}

inline int hex_value(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

class Scanner {
public:
  Scanner(std::string_view text, Number_styles styles, const Numeric_conventions& conv):
    text_(text), styles_(styles), conv_(conv) {}

  Parse_status run(std::uint8_t& result);

private:
  bool allow(Number_styles flag) const { return has_flag(styles_, flag); }
  char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

  bool eat(const std::string& token)
  {
    size_t n = match_token(text_, pos_, token);
    pos_ += n;
    return n != 0;
  }

  bool eat_sign();
  void scan_leading();
  bool scan_hex_digits();
  bool scan_decimal_digits();
  void scan_exponent();
  bool scan_trailing();

  Parse_status hex_result(std::uint8_t& result) const;
  Parse_status decimal_result(std::uint8_t& result);

  std::string_view text_;
  Number_styles styles_;
  const Numeric_conventions& conv_;
  size_t pos_ = 0;

  Number_buffer number_;
  bool sign_seen_ = false;
  bool parens_ = false;
  bool currency_seen_ = false;

  std::uint32_t hex_value_ = 0;
  bool hex_overflow_ = false;
};

bool Scanner::eat_sign()
{
  if (eat(conv_.positive_sign())) {
    sign_seen_ = true;
    return true;
  }

  if (eat(conv_.negative_sign())) {
    sign_seen_ = true;
    number_.negative = true;
    return true;
  }

  return false;
}

void Scanner::scan_leading()
{
  if (allow(Number_styles::Allow_leading_white))
    pos_ += unicode::skip_white_space(text_, pos_);

  bool signed_text = allow(Number_styles::Allow_leading_sign) && eat_sign();

  if (!signed_text && allow(Number_styles::Allow_parentheses) && peek() == '(') {
    ++pos_;
    parens_ = true;
    number_.negative = true;
  }

  if (allow(Number_styles::Allow_currency_symbol))
    currency_seen_ = eat(conv_.currency_symbol());
}

bool Scanner::scan_hex_digits()
{
  size_t start = pos_;

  for (int d; (d = hex_value(peek())) >= 0; ++pos_) {
    if (!hex_overflow_ &&
        !safe_math::push_digit<std::uint32_t>(hex_value_, 16, static_cast<std::uint32_t>(d)))
    {
      hex_overflow_ = true;
    }
  }

  return pos_ != start;
}

bool Scanner::scan_decimal_digits()
{
  bool digits_seen = false;
  bool in_fraction = false;

  while (pos_ < text_.size()) {
    char c = peek();

    if (is_digit(c)) {
      digits_seen = true;
      if (c != '0' || !number_.digits.empty()) {
        number_.digits += c;
        if (!in_fraction)
          ++number_.scale;
      } else if (in_fraction) {
        --number_.scale;
      }
      ++pos_;
    }
    else if (allow(Number_styles::Allow_decimal_point) && !in_fraction &&
             eat(conv_.decimal_separator()))
    {
      in_fraction = true;
    }
    else if (allow(Number_styles::Allow_thousands) && digits_seen && !in_fraction &&
             eat(conv_.group_separator()))
    {
      // Group sizes are not checked.
    }
    else {
      break;
    }
  }

  // Trailing zeros carry no value once the scale is fixed.
  size_t end = number_.digits.find_last_not_of('0');
  number_.digits.erase(end == std::string::npos ? 0 : end + 1);

  return digits_seen;
}

void Scanner::scan_exponent()
{
  char c = peek();
  if (c != 'e' && c != 'E')
    return;

  size_t saved = pos_++;
  bool negative = false;

  if (!eat(conv_.positive_sign()))
    negative = eat(conv_.negative_sign());

  if (!is_digit(peek())) {
    pos_ = saved;
    return;
  }

  int exp = 0;
  for (; is_digit(peek()); ++pos_) {
    if (exp <= max_exponent)
      exp = exp * 10 + (peek() - '0');
  }

  // Any exponent beyond the cap shifts every digit out of range anyway.
  if (exp > max_exponent)
    exp = 9999;

  number_.scale += negative ? -exp : exp;
}

bool Scanner::scan_trailing()
{
  if (allow(Number_styles::Allow_currency_symbol) && !currency_seen_)
    currency_seen_ = eat(conv_.currency_symbol());

  if (allow(Number_styles::Allow_trailing_sign) && !sign_seen_ && !parens_)
    eat_sign();

  if (parens_) {
    if (peek() != ')')
      return false;
    ++pos_;
  }

  if (allow(Number_styles::Allow_trailing_white))
    pos_ += unicode::skip_white_space(text_, pos_);

  return pos_ == text_.size();
}

Parse_status Scanner::hex_result(std::uint8_t& result) const
{
  if (hex_overflow_ || hex_value_ > std::numeric_limits<std::uint8_t>::max())
    return Parse_status::overflow;

  result = static_cast<std::uint8_t>(hex_value_);
  return Parse_status::ok;
}

Parse_status Scanner::decimal_result(std::uint8_t& result)
{
  const std::string& digits = number_.digits;

  if (digits.empty()) {
    result = 0;
    return Parse_status::ok;
  }

  // A significant digit right of the decimal point has no byte representation.
  if (number_.scale < static_cast<int>(digits.size()))
    return Parse_status::format;

  if (number_.scale > int32_precision)
    return Parse_status::overflow;

  // Accumulate as Int32 first, then narrow.
  std::int32_t wide = 0;
  for (int i = 0; i < number_.scale; ++i) {
    std::int32_t d = i < static_cast<int>(digits.size()) ? digits[i] - '0' : 0;
    if (!safe_math::push_digit<std::int32_t>(wide, 10, d))
      return Parse_status::overflow;
  }

  if (number_.negative && wide != 0)
    return Parse_status::overflow;

  if (wide > std::numeric_limits<std::uint8_t>::max())
    return Parse_status::overflow;

  result = static_cast<std::uint8_t>(wide);
  return Parse_status::ok;
}

Parse_status Scanner::run(std::uint8_t& result)
{
  if (allow(Number_styles::Allow_hex_specifier)) {
    if (allow(Number_styles::Allow_leading_white))
      pos_ += unicode::skip_white_space(text_, pos_);

    if (!scan_hex_digits())
      return Parse_status::format;

    if (allow(Number_styles::Allow_trailing_white))
      pos_ += unicode::skip_white_space(text_, pos_);

    if (pos_ != text_.size())
      return Parse_status::format;

    return hex_result(result);
  }

  scan_leading();

  if (!scan_decimal_digits())
    return Parse_status::format;

  if (allow(Number_styles::Allow_exponent))
    scan_exponent();

  if (!scan_trailing())
    return Parse_status::format;

  return decimal_result(result);
}

void throw_status(Parse_status st)
{
  switch (st) {
  case Parse_status::format:
    throw Format_error();
  case Parse_status::overflow:
    throw Overflow_error();
  case Parse_status::ok:
    break;
  }
}

} // anonymous namespace

size_t match_token(std::string_view text, size_t pos, const std::string& token)
{
  if (token.empty() || pos > text.size())
    return 0;

  size_t i = 0;
  size_t j = pos;

  while (i < token.size()) {
    if (j >= text.size())
      return 0;

    // U+00A0 in a separator cannot be typed on most keyboards; accept U+0020.
    if (token.compare(i, 2, "\xC2\xA0") == 0 && text[j] == ' ') {
      i += 2;
      ++j;
      continue;
    }

    if (token[i] != text[j])
      return 0;

    ++i;
    ++j;
  }

  return j - pos;
}

Parse_status parse_byte(
  std::string_view text,
  Number_styles styles,
  const Numeric_conventions& conv,
  std::uint8_t& result)
{
  Scanner scanner(text, styles, conv);
  return scanner.run(result);
}

std::uint8_t parse(const char* text, Number_styles styles, const Numeric_conventions* conv)
{
  if (!text)
    throw Null_argument("text");

  return parse(std::string(text), styles, conv);
}

std::uint8_t parse(const std::string& text, Number_styles styles, const Numeric_conventions* conv)
{
  validate_styles(styles);

  std::shared_ptr<const Numeric_conventions> holder;
  const Numeric_conventions& c = Numeric_conventions::resolve(conv, holder);

  std::uint8_t result = 0;
  Parse_status st = parse_byte(text, styles, c, result);
  throw_status(st);

  return result;
}

bool try_parse(
  const char* text,
  Number_styles styles,
  const Numeric_conventions* conv,
  std::uint8_t& result)
{
  result = 0;
  validate_styles(styles);

  if (!text)
    return false;

  return try_parse(std::string(text), styles, conv, result);
}

bool try_parse(
  const std::string& text,
  Number_styles styles,
  const Numeric_conventions* conv,
  std::uint8_t& result)
{
  result = 0;
  validate_styles(styles);

  std::shared_ptr<const Numeric_conventions> holder;
  const Numeric_conventions& c = Numeric_conventions::resolve(conv, holder);

  std::uint8_t value = 0;
  if (parse_byte(text, styles, c, value) != Parse_status::ok)
    return false;

  result = value;
  return true;
}

} // namespace num_parse
} // namespace byteconv
