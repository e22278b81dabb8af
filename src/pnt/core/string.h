// string.h created on 2018-03-23 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2018–2023 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_CORE_STRING_H
#define PNT_CORE_STRING_H

#include <string_view>
#include <string>
#include <utility>

namespace pnt::core {


/// Escape non-printable characters with C escape sequences (eg. '\n')
/// \param str          The string to be escaped. May contains '\0'.
/// \param keep_utf8    Copy valid multi-byte UTF-8 sequences as they are,
///                     otherwise escape every byte >= 0x80 as "\xNN".
std::string escape(std::string_view str, bool keep_utf8 = false);

/// Decode one UTF-8 character from the beginning of the input.
/// Overlong forms, surrogates and code points above U+10FFFF are rejected.
/// \returns    {length, codepoint}; length 0 means the input
///             is empty or doesn't start with a well-formed character.
std::pair<int, char32_t> utf8_codepoint_and_length(std::string_view utf8);

/// Check that the whole string is well-formed UTF-8.
/// \returns    offset of the first byte of the first ill-formed sequence,
///             or std::string_view::npos when the string is valid.
size_t utf8_invalid_offset(std::string_view utf8);

inline bool utf8_is_valid(std::string_view utf8) { return utf8_invalid_offset(utf8) == std::string_view::npos; }


} // namespace pnt::core

#endif // PNT_CORE_STRING_H
