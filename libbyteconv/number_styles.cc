//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include "number_styles.h"

#include "except.h"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace byteconv {

namespace {

struct Style_name {
  const char* name;
  Number_styles value;
};

// Composites first: to_string() prefers them for exact matches.
const Style_name composite_names[] = {
  { "None",       Number_styles::None },
  { "Integer",    Number_styles::Integer },
  { "HexNumber",  Number_styles::Hex_number },
  { "Number",     Number_styles::Number },
  { "Float",      Number_styles::Float },
  { "Currency",   Number_styles::Currency },
  { "Any",        Number_styles::Any }
};

const Style_name flag_names[] = {
  { "AllowLeadingWhite",   Number_styles::Allow_leading_white },
  { "AllowTrailingWhite",  Number_styles::Allow_trailing_white },
  { "AllowLeadingSign",    Number_styles::Allow_leading_sign },
  { "AllowTrailingSign",   Number_styles::Allow_trailing_sign },
  { "AllowParentheses",    Number_styles::Allow_parentheses },
  { "AllowDecimalPoint",   Number_styles::Allow_decimal_point },
  { "AllowThousands",      Number_styles::Allow_thousands },
  { "AllowExponent",       Number_styles::Allow_exponent },
  { "AllowCurrencySymbol", Number_styles::Allow_currency_symbol },
  { "AllowHexSpecifier",   Number_styles::Allow_hex_specifier }
};

constexpr std::uint32_t defined_bits = 0x3FF;

// Lowercase, drop underscores and blanks: "Allow_thousands" == "AllowThousands".
std::string normalize(const std::string& s)
{
  std::string out;
  out.reserve(s.size());
  for (unsigned char c: s) {
    if (c == '_' || std::isspace(c))
      continue;
    out += static_cast<char>(std::tolower(c));
  }
  return out;
}

Number_styles lookup(const std::string& token)
{
  const std::string key = normalize(token);

  for (const auto& n: composite_names)
    if (normalize(n.name) == key)
      return n.value;

  for (const auto& n: flag_names)
    if (normalize(n.name) == key)
      return n.value;

  // Raw numeric value, as printed by to_string() for undefined bits.
  if (!key.empty() && std::isdigit(static_cast<unsigned char>(key[0]))) {
    bool hex = key.size() > 2 && key[0] == '0' && key[1] == 'x';
    std::uint32_t raw = 0;
    const char* first = key.data() + (hex ? 2 : 0);
    const char* last = key.data() + key.size();
    auto [ptr, ec] = std::from_chars(first, last, raw, hex ? 16 : 10);
    if (ec == std::errc() && ptr == last)
      return static_cast<Number_styles>(raw);
  }

  throw Invalid_style("Unknown style name '" + token + "'.");
}

} // anonymous namespace

void validate_styles(Number_styles styles)
{
  const auto raw = static_cast<std::uint32_t>(styles);

  if (raw & ~defined_bits)
    throw Invalid_style("Undefined style bits are set.");

  if (has_flag(styles, Number_styles::Allow_hex_specifier) &&
      (styles & ~Number_styles::Hex_number) != Number_styles::None)
  {
    throw Invalid_style(
      "AllowHexSpecifier may only be combined with white space flags.");
  }
}

Number_styles styles_from_string(const std::string& expr)
{
  Number_styles result = Number_styles::None;
  size_t start = 0;

  while (start <= expr.size()) {
    size_t end = expr.find_first_of("|,", start);
    if (end == std::string::npos)
      end = expr.size();

    std::string token = expr.substr(start, end - start);
    if (normalize(token).empty())
      throw Invalid_style("Empty style name in '" + expr + "'.");

    result |= lookup(token);
    start = end + 1;
  }

  return result;
}

std::string to_string(Number_styles styles)
{
  for (const auto& n: composite_names)
    if (n.value == styles)
      return n.name;

  std::string out;
  auto raw = static_cast<std::uint32_t>(styles);

  for (const auto& n: flag_names) {
    if (!has_flag(styles, n.value))
      continue;
    if (!out.empty())
      out += " | ";
    out += n.name;
    raw &= ~static_cast<std::uint32_t>(n.value);
  }

  if (raw) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%X", raw);
    if (!out.empty())
      out += " | ";
    out += buf;
  }

  return out;
}

} // namespace byteconv
