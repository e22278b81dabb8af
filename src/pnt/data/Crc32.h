// Crc32.h created on 2020-06-07 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2019, 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_DATA_CRC32_H
#define PNT_DATA_CRC32_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace pnt::data {


/// Running CRC-32 checksum (CRC-32/ISO-HDLC, as in zlib, PNG, Ethernet).
///
///     Crc32 crc;
///     crc.feed(header.data(), 43);
///     crc.feed(more_data);
///     uint32_t r = crc.as_uint32();
///
/// One-shot:
///
///     uint32_t r = Crc32::calculate(bytes);
///
class Crc32 {
public:
    Crc32();

    static uint32_t calculate(std::span<const std::byte> data);
    static uint32_t calculate(std::string_view data) { return calculate(std::as_bytes(std::span(data))); }

    template<typename T> requires requires(T t) { t.data(); t.size(); } && (sizeof(*std::declval<T>().data()) == 1)
    uint32_t operator() (const T& buffer) { feed(buffer.data(), buffer.size()); return m_crc; }

    void reset();
    void feed(const std::byte* data, size_t size);
    void feed(const char* data, size_t size) { feed(reinterpret_cast<const std::byte*>(data), size); }
    void feed(std::byte b) { feed(&b, 1); }

    uint32_t as_uint32() const { return m_crc; }

private:
    uint32_t m_crc;
};


} // namespace pnt::data

#endif // include guard
