// endian.h created on 2018-11-11 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2018, 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_COMPAT_ENDIAN_H
#define PNT_COMPAT_ENDIAN_H

#include <cstdint>
#include <type_traits>

#ifdef __APPLE__

    #include <libkern/OSByteOrder.h>

    #define htole16(x) OSSwapHostToLittleInt16(x)
    #define le16toh(x) OSSwapLittleToHostInt16(x)
    #define htole32(x) OSSwapHostToLittleInt32(x)
    #define le32toh(x) OSSwapLittleToHostInt32(x)
    #define htole64(x) OSSwapHostToLittleInt64(x)
    #define le64toh(x) OSSwapLittleToHostInt64(x)

#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__) || defined(__DragonFly__)

    #include <sys/types.h>
    #include <sys/endian.h>

#else

    // Linux
    #include <endian.h>

#endif


// Sanity check - order macros are defined:
#if !defined(BYTE_ORDER) || !defined(LITTLE_ENDIAN) || !defined(BIG_ENDIAN)
#error "Endian macros are not available!"
#endif


namespace pnt {


/// Convert unsigned integer between host and little-endian byte order.
/// The conversion is symmetric, so the same function works both ways.
template <typename T>
requires std::is_integral_v<T> && std::is_unsigned_v<T>
inline T host_le(T v) noexcept
{
    if constexpr (sizeof(T) == 1)
        return v;
    else if constexpr (sizeof(T) == 2)
        return T(htole16(v));
    else if constexpr (sizeof(T) == 4)
        return T(htole32(v));
    else {
        static_assert(sizeof(T) == 8);
        return T(htole64(v));
    }
}


} // namespace pnt

#endif // include guard
