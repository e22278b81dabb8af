// int128.h created on 2023-09-06 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2023 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

// References:
// - https://quuxplusone.github.io/blog/2019/02/28/is-int128-integral/

#ifndef PNT_COMPAT_INT128_H
#define PNT_COMPAT_INT128_H

#include <string>
#include <algorithm>

#if defined(__GNUC__)

using uint128 = __uint128_t;

#else

#error "Unsupported compiler"

#endif

namespace pnt {


/// Format unsigned 128-bit integer in decimal.
/// Decimal mantissa is 96-bit at most, so this is not on a hot path.
inline std::string uint128_to_string(uint128 v)
{
    if (v == 0)
        return "0";
    std::string res;
    while (v != 0) {
        res += char('0' + int(v % 10));
        v /= 10;
    }
    std::reverse(res.begin(), res.end());
    return res;
}


} // namespace pnt

#endif // include guard
