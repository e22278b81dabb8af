// Header.cpp created on 2026-10-18 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Header.h"
#include "Crc32.h"
#include <pnt/compat/bit.h>

#include <algorithm>
#include <cstring>

namespace pnt::data {


bool is_valid_magic(const std::byte* magic)
{
    return std::memcmp(magic, BinaryBase::Magic, BinaryBase::MagicSize) == 0;
}


HeaderBytes encode_header(const Header& header)
{
    HeaderBytes bytes {};  // reserved part stays zero
    std::byte* p = bytes.data();
    p = std::copy_n(BinaryBase::Magic, BinaryBase::MagicSize, p);
    le_write(p, header.version_major);
    le_write(p, header.version_minor);
    le_write(p, header.version_patch);
    le_write(p, header.flags);
    le_write(p, header.data_offset);
    le_write(p, header.index_offset);
    le_write(p, header.data_size);
    le_write(p, header.index_size);
    const uint32_t crc = Crc32::calculate(std::span<const std::byte>(bytes.data(), BinaryBase::ChecksumOffset));
    le_write(p, crc);
    return bytes;
}


Header decode_header(const HeaderBytes& bytes)
{
    if (!is_valid_magic(bytes.data()))
        throw BadMagic(0);

    const std::byte* p = bytes.data() + BinaryBase::ChecksumOffset;
    const auto stored = le_read<uint32_t>(p);
    const auto computed = Crc32::calculate(std::span<const std::byte>(bytes.data(), BinaryBase::ChecksumOffset));
    if (stored != computed)
        throw BadChecksum(stored, computed);

    Header header;
    p = bytes.data() + BinaryBase::MagicSize;
    header.version_major = le_read<uint8_t>(p);
    header.version_minor = le_read<uint8_t>(p);
    header.version_patch = le_read<uint8_t>(p);
    header.flags = le_read<uint32_t>(p);
    header.data_offset = le_read<uint64_t>(p);
    header.index_offset = le_read<uint64_t>(p);
    header.data_size = le_read<uint64_t>(p);
    header.index_size = le_read<uint64_t>(p);
    header.checksum = stored;
    return header;
}


} // namespace pnt::data
