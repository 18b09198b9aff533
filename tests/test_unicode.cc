// Unit tests for unicode.h - UTF-8 decoding and white space classification

#define BOOST_TEST_MODULE unicode_tests
#include <boost/test/unit_test.hpp>

#include "libbyteconv/unicode.h"

#include <string>

using namespace byteconv;

BOOST_AUTO_TEST_SUITE(decode_tests)

BOOST_AUTO_TEST_CASE(sequence_lengths)
{
  char32_t cp = 0;

  BOOST_CHECK_EQUAL(unicode::decode("A", 0, cp), 1u);
  BOOST_CHECK(cp == U'A');

  BOOST_CHECK_EQUAL(unicode::decode("\xC2\xA0", 0, cp), 2u);
  BOOST_CHECK(cp == 0xA0);

  BOOST_CHECK_EQUAL(unicode::decode("\xE3\x80\x80", 0, cp), 3u);
  BOOST_CHECK(cp == 0x3000);

  BOOST_CHECK_EQUAL(unicode::decode("\xF0\x9F\x98\x80", 0, cp), 4u);
  BOOST_CHECK(cp == 0x1F600);
}

BOOST_AUTO_TEST_CASE(decode_at_offset)
{
  char32_t cp = 0;
  std::string s = "1\xE2\x80\x83" "2";
  BOOST_CHECK_EQUAL(unicode::decode(s, 1, cp), 3u);
  BOOST_CHECK(cp == 0x2003);
  BOOST_CHECK_EQUAL(unicode::decode(s, 4, cp), 1u);
  BOOST_CHECK_EQUAL(unicode::decode(s, 5, cp), 0u);
}

BOOST_AUTO_TEST_CASE(malformed_sequences)
{
  char32_t cp = 0;
  BOOST_CHECK_EQUAL(unicode::decode("\x80", 0, cp), 0u);           // lone continuation
  BOOST_CHECK_EQUAL(unicode::decode("\xC2", 0, cp), 0u);           // truncated
  BOOST_CHECK_EQUAL(unicode::decode("\xC2" "A", 0, cp), 0u);       // bad continuation
  BOOST_CHECK_EQUAL(unicode::decode("\xC0\xA0", 0, cp), 0u);       // overlong space
  BOOST_CHECK_EQUAL(unicode::decode("\xE0\x80\xA0", 0, cp), 0u);   // overlong space
  BOOST_CHECK_EQUAL(unicode::decode("\xED\xA0\x80", 0, cp), 0u);   // surrogate
  BOOST_CHECK_EQUAL(unicode::decode("\xF4\x90\x80\x80", 0, cp), 0u); // above U+10FFFF
  BOOST_CHECK_EQUAL(unicode::decode("\xFF", 0, cp), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(white_space_tests)

BOOST_AUTO_TEST_CASE(white_space_set)
{
  const char32_t white[] = {
    0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x20, 0x85, 0xA0, 0x1680,
    0x2000, 0x2005, 0x200A, 0x2028, 0x2029, 0x202F, 0x205F, 0x3000
  };
  for (char32_t cp: white)
    BOOST_CHECK_MESSAGE(unicode::is_white_space(cp), "U+" << std::hex << static_cast<unsigned>(cp));

  const char32_t other[] = {
    0x00, 0x08, 0x0E, 0x1F, U'0', U'A', 0x84, 0x180E, 0x200B, 0xFEFF, 0x3001
  };
  for (char32_t cp: other)
    BOOST_CHECK_MESSAGE(!unicode::is_white_space(cp), "U+" << std::hex << static_cast<unsigned>(cp));
}

BOOST_AUTO_TEST_CASE(skip_runs)
{
  std::string s = " \t\xC2\xA0\xE3\x80\x80" "12 ";
  BOOST_CHECK_EQUAL(unicode::skip_white_space(s, 0), 7u);
  BOOST_CHECK_EQUAL(unicode::skip_white_space(s, 7), 0u);
  BOOST_CHECK_EQUAL(unicode::skip_white_space(s, 9), 1u);
  BOOST_CHECK_EQUAL(unicode::skip_white_space(s, s.size()), 0u);
}

BOOST_AUTO_TEST_CASE(skip_stops_at_malformed_byte)
{
  std::string s = "  \xC2";
  BOOST_CHECK_EQUAL(unicode::skip_white_space(s, 0), 2u);
}

BOOST_AUTO_TEST_SUITE_END()
