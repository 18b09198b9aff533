//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef BYTECONV_UNICODE_H
#define BYTECONV_UNICODE_H

#include "api_export.h"

#include <cstddef>
#include <string_view>

namespace byteconv {
namespace unicode {

//! Decodes one UTF-8 sequence at text[pos].
//! Returns the sequence length and stores the code point into cp,
//! or returns 0 when the bytes at pos are not well-formed UTF-8.
LIBBYTECONV_API size_t decode(std::string_view text, size_t pos, char32_t& cp);

//! Unicode White_Space property (ASCII controls 9-13, space, NEL, NBSP,
//! Ogham mark, U+2000..U+200A, line/paragraph separators, narrow NBSP,
//! medium mathematical space and ideographic space).
LIBBYTECONV_API bool is_white_space(char32_t cp);

//! Length of the white space run starting at pos.
LIBBYTECONV_API size_t skip_white_space(std::string_view text, size_t pos);

} // namespace unicode
} // namespace byteconv

#endif
