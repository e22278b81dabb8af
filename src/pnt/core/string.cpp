// string.cpp created on 2018-03-23 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2018–2023 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "string.h"

#include <fmt/core.h>

#include <cctype>

namespace pnt::core {

using std::string_view;


std::string escape(string_view str, bool keep_utf8)
{
    std::string out;
    out.reserve(str.size());
    while (!str.empty()) {
        const char ch = str.front();
        if (keep_utf8 && (ch & 0x80) != 0) {
            const auto [len, _] = utf8_codepoint_and_length(str);
            if (len > 1) {
                out += str.substr(0, len);
                str.remove_prefix(len);
                continue;
            }
        }
        switch (ch) {
            case '\a': out += "\\a"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\v': out += "\\v"; break;
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            default: {
                auto chnum = (int)(unsigned char)(ch);
                if (chnum < 0x80 && std::isprint(chnum))
                    out += ch;
                else
                    out += fmt::format("\\x{:02x}", chnum);
                break;
            }
        }
        str.remove_prefix(1);
    }
    return out;
}


std::pair<int, char32_t> utf8_codepoint_and_length(string_view utf8)
{
    if (utf8.empty())
        return {0, 0};
    const auto c0 = (unsigned char) utf8[0];
    if ((c0 & 0x80) == 0) {
        // 0xxxxxxx -> 1 byte
        return {1, char32_t(c0)};
    }

    int len;
    char32_t cp;
    char32_t min_cp;
    if ((c0 & 0xe0) == 0xc0) {
        // 110xxxxx -> 2 bytes
        len = 2; cp = c0 & 0x1f; min_cp = 0x80;
    } else if ((c0 & 0xf0) == 0xe0) {
        // 1110xxxx -> 3 bytes
        len = 3; cp = c0 & 0x0f; min_cp = 0x800;
    } else if ((c0 & 0xf8) == 0xf0) {
        // 11110xxx -> 4 bytes
        len = 4; cp = c0 & 0x07; min_cp = 0x10000;
    } else {
        // continuation byte or 0xF8..0xFF
        return {0, 0};
    }

    if (utf8.size() < size_t(len))
        return {0, 0};
    for (int i = 1; i != len; ++i) {
        const auto c = (unsigned char) utf8[i];
        if ((c & 0xc0) != 0x80)
            return {0, 0};
        cp = (cp << 6) | (c & 0x3f);
    }

    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return {0, 0};
    return {len, cp};
}


size_t utf8_invalid_offset(string_view utf8)
{
    size_t pos = 0;
    while (pos != utf8.size()) {
        // fast path for ASCII
        if ((utf8[pos] & 0x80) == 0) {
            ++pos;
            continue;
        }
        const auto [len, _] = utf8_codepoint_and_length(utf8.substr(pos));
        if (len == 0)
            return pos;
        pos += size_t(len);
    }
    return string_view::npos;
}


} // namespace pnt::core
