// bit.h created on 2018-11-11 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2018–2021 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)
//
// ------------------------------------------------------------------
// Bitwise operations - copying bits in and out of byte buffers,
// with explicit little-endian variants for the wire format.
// ------------------------------------------------------------------

#ifndef PNT_COMPAT_BIT_H
#define PNT_COMPAT_BIT_H

#include "endian.h"

#include <type_traits>
#include <cstring>
#include <cstdint>

namespace pnt {


/// Unsigned integer type of the same size as T.
template <typename T> struct uint_of_size;
template <typename T> requires (sizeof(T) == 1) struct uint_of_size<T> { using type = uint8_t; };
template <typename T> requires (sizeof(T) == 2) struct uint_of_size<T> { using type = uint16_t; };
template <typename T> requires (sizeof(T) == 4) struct uint_of_size<T> { using type = uint32_t; };
template <typename T> requires (sizeof(T) == 8) struct uint_of_size<T> { using type = uint64_t; };
template <typename T> using uint_of_size_t = typename uint_of_size<T>::type;


/// Similar to C++20 bit_cast, but copy bits from void*, char*, byte* etc.
/// Does not check type sizes. Useful to emulate file reading from memory buffer.
///
/// Example:
///
///     vector<byte> buf;
///     auto ptr = buf.data();
///     auto a = bit_copy<int32_t>(ptr);
///     auto b = bit_copy<uint16_t>(ptr + 4);

template <class To, class From>
requires std::is_trivially_copyable_v<From> && std::is_trivial_v<To> &&
         (!std::is_pointer_v<From>) && (sizeof(From) == 1)
To bit_copy(const From* src) noexcept
{
    To dst;
    std::memcpy(&dst, src, sizeof(To));
    return dst;
}


/// Read little-endian value from pointer to std::byte or other 1-byte type.
/// Advance the pointer by number of bytes read.
///
///     const std::byte* p = buf.data();
///     auto flags = le_read<uint32_t>(p);
///     auto size = le_read<uint64_t>(p);

template <typename OutT, typename InT>
requires std::is_trivially_copyable_v<OutT> && (sizeof(InT) == 1)
OutT le_read(const InT*& iter) noexcept
{
    using U = uint_of_size_t<OutT>;
    const U u = host_le(bit_copy<U>(iter));
    iter += sizeof(OutT);
    OutT dst;
    std::memcpy(&dst, &u, sizeof(OutT));
    return dst;
}


/// Write value in little-endian order to pointer to std::byte or other 1-byte type.
/// Advance the pointer by number of bytes written.

template <typename InT, typename OutT>
requires std::is_trivially_copyable_v<InT> && (sizeof(OutT) == 1)
void le_write(OutT*& iter, const InT& value) noexcept
{
    using U = uint_of_size_t<InT>;
    U u;
    std::memcpy(&u, &value, sizeof(U));
    u = host_le(u);
    std::memcpy(iter, &u, sizeof(U));
    iter += sizeof(InT);
}


} // namespace pnt

#endif // include guard
