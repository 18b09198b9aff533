// Unit tests for number_styles.h - flag algebra, validation and naming

#define BOOST_TEST_MODULE number_styles_tests
#include <boost/test/unit_test.hpp>

#include "libbyteconv/except.h"
#include "libbyteconv/number_styles.h"

#include <cstdint>

using namespace byteconv;

namespace {

std::uint32_t raw(Number_styles s)
{
  return static_cast<std::uint32_t>(s);
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(bit_layout_tests)

BOOST_AUTO_TEST_CASE(composite_values)
{
  BOOST_CHECK_EQUAL(raw(Number_styles::None), 0x000u);
  BOOST_CHECK_EQUAL(raw(Number_styles::Integer), 0x007u);
  BOOST_CHECK_EQUAL(raw(Number_styles::Hex_number), 0x203u);
  BOOST_CHECK_EQUAL(raw(Number_styles::Number), 0x06Fu);
  BOOST_CHECK_EQUAL(raw(Number_styles::Float), 0x0A7u);
  BOOST_CHECK_EQUAL(raw(Number_styles::Currency), 0x17Fu);
  BOOST_CHECK_EQUAL(raw(Number_styles::Any), 0x1FFu);
}

BOOST_AUTO_TEST_CASE(flag_operators)
{
  Number_styles s = Number_styles::Allow_leading_white;
  s |= Number_styles::Allow_trailing_white;

  BOOST_CHECK(has_flag(s, Number_styles::Allow_leading_white));
  BOOST_CHECK(has_flag(s, Number_styles::Allow_trailing_white));
  BOOST_CHECK(!has_flag(s, Number_styles::Allow_leading_sign));
  BOOST_CHECK(has_flag(Number_styles::Integer, s));
  BOOST_CHECK(!has_flag(s, Number_styles::Integer));
  BOOST_CHECK(has_flag(s, Number_styles::None));

  BOOST_CHECK((Number_styles::Currency & ~Number_styles::Number) ==
              (Number_styles::Allow_parentheses | Number_styles::Allow_currency_symbol));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(validation_tests)

BOOST_AUTO_TEST_CASE(defined_combinations_are_valid)
{
  for (std::uint32_t v = 0; v <= 0x1FF; ++v)
    BOOST_CHECK_NO_THROW(validate_styles(static_cast<Number_styles>(v)));

  BOOST_CHECK_NO_THROW(validate_styles(Number_styles::Hex_number));
  BOOST_CHECK_NO_THROW(validate_styles(Number_styles::Allow_hex_specifier));
  BOOST_CHECK_NO_THROW(validate_styles(
    Number_styles::Allow_hex_specifier | Number_styles::Allow_leading_white));
}

BOOST_AUTO_TEST_CASE(hex_with_other_flags_is_invalid)
{
  const Number_styles others[] = {
    Number_styles::Allow_leading_sign,
    Number_styles::Allow_trailing_sign,
    Number_styles::Allow_parentheses,
    Number_styles::Allow_decimal_point,
    Number_styles::Allow_thousands,
    Number_styles::Allow_exponent,
    Number_styles::Allow_currency_symbol
  };

  for (Number_styles f: others) {
    BOOST_TEST_CONTEXT("flag " << to_string(f)) {
      BOOST_CHECK_THROW(validate_styles(Number_styles::Hex_number | f), Invalid_style);
    }
  }
}

BOOST_AUTO_TEST_CASE(undefined_bits_are_invalid)
{
  BOOST_CHECK_THROW(validate_styles(static_cast<Number_styles>(0x400)), Invalid_style);
  BOOST_CHECK_THROW(validate_styles(static_cast<Number_styles>(0x80000000u)), Invalid_style);
  BOOST_CHECK_THROW(validate_styles(static_cast<Number_styles>(0xFFFFFC00u)), Invalid_style);
}

BOOST_AUTO_TEST_CASE(invalid_style_code)
{
  try {
    validate_styles(static_cast<Number_styles>(0x800));
    BOOST_ERROR("Invalid_style not thrown");
  }
  catch (const Exception& e) {
    BOOST_CHECK(e.code() == errc::invalid_style);
  }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(naming_tests)

BOOST_AUTO_TEST_CASE(composite_names)
{
  BOOST_CHECK_EQUAL(to_string(Number_styles::None), "None");
  BOOST_CHECK_EQUAL(to_string(Number_styles::Integer), "Integer");
  BOOST_CHECK_EQUAL(to_string(Number_styles::Hex_number), "HexNumber");
  BOOST_CHECK_EQUAL(to_string(Number_styles::Currency), "Currency");
  BOOST_CHECK_EQUAL(to_string(Number_styles::Any), "Any");
}

BOOST_AUTO_TEST_CASE(flag_lists)
{
  BOOST_CHECK_EQUAL(to_string(Number_styles::Allow_thousands), "AllowThousands");
  BOOST_CHECK_EQUAL(
    to_string(Number_styles::Allow_leading_white | Number_styles::Allow_exponent),
    "AllowLeadingWhite | AllowExponent");
  BOOST_CHECK_EQUAL(
    to_string(Number_styles::Allow_parentheses | static_cast<Number_styles>(0x1000)),
    "AllowParentheses | 0x1000");
}

BOOST_AUTO_TEST_CASE(parse_names)
{
  BOOST_CHECK(styles_from_string("Integer") == Number_styles::Integer);
  BOOST_CHECK(styles_from_string("hexnumber") == Number_styles::Hex_number);
  BOOST_CHECK(styles_from_string("Hex_Number") == Number_styles::Hex_number);
  BOOST_CHECK(styles_from_string("Allow_thousands") == Number_styles::Allow_thousands);
  BOOST_CHECK(styles_from_string("AllowLeadingWhite|AllowTrailingWhite") ==
              (Number_styles::Allow_leading_white | Number_styles::Allow_trailing_white));
  BOOST_CHECK(styles_from_string("Integer, AllowThousands") ==
              (Number_styles::Integer | Number_styles::Allow_thousands));
}

BOOST_AUTO_TEST_CASE(parse_raw_values)
{
  BOOST_CHECK(styles_from_string("7") == Number_styles::Integer);
  BOOST_CHECK(styles_from_string("0x203") == Number_styles::Hex_number);
  BOOST_CHECK(styles_from_string("0X1FF") == Number_styles::Any);

  // Not validated here
  BOOST_CHECK_EQUAL(raw(styles_from_string("0x400")), 0x400u);
}

BOOST_AUTO_TEST_CASE(parse_rejects_unknown_and_empty)
{
  BOOST_CHECK_THROW(styles_from_string(""), Invalid_style);
  BOOST_CHECK_THROW(styles_from_string("Integer|"), Invalid_style);
  BOOST_CHECK_THROW(styles_from_string("Integer||Float"), Invalid_style);
  BOOST_CHECK_THROW(styles_from_string("Decimal"), Invalid_style);
  BOOST_CHECK_THROW(styles_from_string("0xZZ"), Invalid_style);
  BOOST_CHECK_THROW(styles_from_string("99999999999"), Invalid_style);
}

BOOST_AUTO_TEST_CASE(names_round_trip)
{
  for (std::uint32_t v = 0; v <= 0x3FF; ++v) {
    const auto s = static_cast<Number_styles>(v);
    if (raw(styles_from_string(to_string(s))) != v) {
      BOOST_ERROR("round trip failed for 0x" << std::hex << v);
      return;
    }
  }
}

BOOST_AUTO_TEST_SUITE_END()
