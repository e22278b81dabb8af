// leb128.h created on 2020-06-09 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_DATA_CODING_LEB128_H
#define PNT_DATA_CODING_LEB128_H

#include <cstdint>
#include <iterator>
#include <limits>
#include <type_traits>

/// Implements unsigned [LEB128](https://en.wikipedia.org/wiki/LEB128) encoding,
/// the variable-length integer used for all lengths and counts in PNT format.

namespace pnt::data {


/// Maximum number of bytes needed for LEB128 encoding of OutT.
template <typename T>
constexpr unsigned leb128_max_bytes() { return (sizeof(T) * 8 + 6) / 7; }


/// Number of bytes `leb128_encode` produces for the value.
template <typename InT>
requires std::is_integral_v<InT> && std::is_unsigned_v<InT>
constexpr unsigned leb128_length(InT value)
{
    unsigned n = 1;
    while (value >= 0x80) {
        value >>= 7;
        ++n;
    }
    return n;
}


/// Encode unsigned integer as LEB128 and write it to output iterator.
/// \param iter         Output iterator. Element should be byte/char. Must support ++, * operations.
/// \param value        Integral value to be written.
template <typename InT, typename OutIter,
          typename OutT = typename std::iterator_traits<OutIter>::value_type>
requires std::is_integral_v<InT> && std::is_unsigned_v<InT>
void leb128_encode(OutIter& iter, InT value)
{
    do {
        uint8_t b = value & InT{0x7f};
        value >>= 7;
        if (value != 0)
            b |= 0x80;
        *iter = OutT(b);
        ++iter;
    } while (value != 0);
}


/// Decode LEB128 from input iterator (of bytes) to unsigned integer.
/// The decoder stops as soon as overflow is detected.
/// Following bytes are not read even if they still have set the continuation bit.
/// \param iter         Input iterator. Must support ++ (pre-increment), * (get).
/// \param max_bytes    Maximum number of groups. When the last allowed group
///                     still has the continuation bit, the input is rejected.
/// \return             The decoded integer, or OutT::max if the input won't fit
template <typename OutT, typename InIter>
requires std::is_integral_v<OutT> && std::is_unsigned_v<OutT>
OutT leb128_decode(InIter& iter, unsigned max_bytes = leb128_max_bytes<OutT>())
{
    OutT result = uint8_t(*iter) & 0x7f;
    unsigned shift = 0;
    unsigned n_bytes = 1;
    while (uint8_t(*iter) > 0x7f) {
        ++iter;
        if (n_bytes++ == max_bytes) {
            // too many groups
            return std::numeric_limits<OutT>::max();
        }
        shift += 7;
        const uint8_t in_bits = uint8_t(*iter) & 0x7f;
        if (shift + 7 > sizeof(OutT) * 8) {
            // possible overflow
            const unsigned bits_fit = sizeof(OutT) * 8 - shift;
            const uint8_t mask = uint8_t(0xFF << bits_fit);
            if ((in_bits & mask) != 0) {
                // overflow confirmed
                ++iter;
                return std::numeric_limits<OutT>::max();
            }
        }
        result |= OutT(in_bits) << shift;
    }
    ++iter;
    return result;
}


} // namespace pnt::data

#endif // include guard
