// Header.h created on 2026-10-18 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_DATA_HEADER_H
#define PNT_DATA_HEADER_H

#include "BinaryBase.h"

#include <array>
#include <cstddef>
#include <cstdint>

namespace pnt::data {


/// The 64-byte preamble of every PNT stream.
///
/// Layout (all integers little-endian):
///
///     [0, 4)    magic "PNT\0"
///     [4, 7)    version major, minor, patch
///     [7, 11)   flags
///     [11, 19)  data_offset
///     [19, 27)  index_offset
///     [27, 35)  data_size
///     [35, 43)  index_size
///     [43, 47)  CRC-32 of [0, 43)
///     [47, 64)  reserved (zero)
///
struct Header {
    uint8_t version_major = BinaryBase::VersionMajor;
    uint8_t version_minor = BinaryBase::VersionMinor;
    uint8_t version_patch = BinaryBase::VersionPatch;
    uint32_t flags = 0;
    uint64_t data_offset = BinaryBase::HeaderSize;
    uint64_t index_offset = 0;
    uint64_t data_size = 0;
    uint64_t index_size = 0;

    // Filled by encode_header / decode_header, not compared.
    uint32_t checksum = 0;

    bool has_flag(BinaryBase::Flags flag) const { return (flags & flag) != 0; }
    void set_flag(BinaryBase::Flags flag, bool value = true) {
        if (value)
            flags |= flag;
        else
            flags &= ~uint32_t(flag);
    }

    bool operator==(const Header& rhs) const {
        return version_major == rhs.version_major
            && version_minor == rhs.version_minor
            && version_patch == rhs.version_patch
            && flags == rhs.flags
            && data_offset == rhs.data_offset
            && index_offset == rhs.index_offset
            && data_size == rhs.data_size
            && index_size == rhs.index_size;
    }
};


using HeaderBytes = std::array<std::byte, BinaryBase::HeaderSize>;

/// Serialize the header, compute and fill in the checksum.
HeaderBytes encode_header(const Header& header);

/// Check the magic (BadMagic), then the checksum (BadChecksum)
/// and parse the layout fields. Reserved bytes are ignored.
Header decode_header(const HeaderBytes& bytes);

/// Check only the magic part (first 4 bytes)
bool is_valid_magic(const std::byte* magic);


} // namespace pnt::data

#endif // include guard
