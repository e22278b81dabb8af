// BinaryReader.cpp created on 2019-03-14 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2019, 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "BinaryReader.h"
#include <pnt/data/coding/leb128.h>
#include <pnt/compat/bit.h>
#include <pnt/core/log.h>
#include <pnt/core/string.h>

#include <algorithm>
#include <limits>

namespace pnt::data {

using namespace pnt::core;

// Huge claimed lengths (without byte budget) are read in pieces,
// so the memory grows only with the data actually present.
static constexpr uint64_t c_read_chunk_size = 64 * 1024;

// Upper bound for reserving Array / Object capacity in advance
static constexpr uint64_t c_max_reserve = 1024;


BinaryReader::BinaryReader(Source& source, const ReaderOptions& options)
    : m_options(options),
      m_stream(source, options.buffer_size)
{}


BinaryReader::BinaryReader(std::istream& is, const ReaderOptions& options)
    : m_options(options),
      m_own_source(std::make_unique<IstreamSource>(is)),
      m_stream(*m_own_source, options.buffer_size)
{}


Header BinaryReader::read_header()
{
    const auto offset = position();
    HeaderBytes bytes;
    m_stream.read(bytes.data(), BinaryBase::MagicSize);
    if (!is_valid_magic(bytes.data()))
        throw BadMagic(offset);
    m_stream.read(bytes.data() + BinaryBase::MagicSize,
                  BinaryBase::HeaderSize - BinaryBase::MagicSize);

    Header header = decode_header(bytes);
    log::debug("Read header: version {}.{}.{}, flags {:#x}, data {}+{}, index {}+{}",
               header.version_major, header.version_minor, header.version_patch,
               header.flags, header.data_offset, header.data_size,
               header.index_offset, header.index_size);
    if (header.version_major != BinaryBase::VersionMajor)
        log::warning("Unexpected PNT version {}.{}.{} (expected {}.x.x), decoding anyway",
                     header.version_major, header.version_minor, header.version_patch,
                     BinaryBase::VersionMajor);
    return header;
}


uint64_t BinaryReader::read_length()
{
    class ReadIter {
    public:
        explicit ReadIter(BufferedReader& reader) : m_reader(reader) {}
        void operator++() { (void) m_reader.get_byte(); }
        std::byte operator*() { return m_reader.peek_byte(); }
    private:
        BufferedReader& m_reader;
    };

    const auto offset = position();
    auto iter = ReadIter(m_stream);
    const auto length = leb128_decode<uint64_t>(iter, BinaryBase::MaxLengthBytes);
    if (length == std::numeric_limits<uint64_t>::max())
        throw FormatError("Length too long", offset);
    return length;
}


Bytes BinaryReader::read_raw(uint64_t size)
{
    Bytes bytes;
    read_payload(bytes, size);
    return bytes;
}


void BinaryReader::skip_to(uint64_t target)
{
    const auto pos = position();
    if (target < pos)
        throw FormatError(fmt::format("Can't seek back to offset {}", target), pos);
    m_stream.skip(target - pos);
}


template <typename T>
T BinaryReader::read_le()
{
    std::byte buf[sizeof(T)];
    m_stream.read(buf, sizeof(T));
    const std::byte* p = buf;
    return le_read<T>(p);
}


template <class C>
void BinaryReader::read_payload(C& out, uint64_t size)
{
    const auto remaining = m_stream.remaining();
    if (remaining && size > *remaining)
        throw TruncationError(position(), size);

    size_t done = 0;
    while (done < size) {
        const auto n = size_t(std::min(size - done, c_read_chunk_size));
        out.resize(done + n);
        m_stream.read(reinterpret_cast<std::byte*>(out.data()) + done, n);
        done += n;
    }
}


void BinaryReader::check_count(uint64_t count, unsigned min_item_size)
{
    const auto remaining = m_stream.remaining();
    if (remaining && count > *remaining / min_item_size)
        throw TruncationError(position(), count * min_item_size);
}


std::string BinaryReader::read_string()
{
    const auto length = read_length();
    const auto offset = position();
    std::string str;
    read_payload(str, length);
    const auto invalid = utf8_invalid_offset(str);
    if (invalid != std::string::npos)
        throw FormatError("Invalid UTF-8 in string", offset + invalid);
    return str;
}


Value BinaryReader::read_value()
{
    return read_value(0);
}


Value BinaryReader::read_value(unsigned depth)
{
    using Type = BinaryBase::Type;
    const auto offset = position();
    const auto tag = uint8_t(m_stream.get_byte());
    if (!BinaryBase::is_valid_type(tag))
        throw UnknownTypeTag(tag, offset);

    switch (Type(tag)) {
        case Type::Null:
            return Null{};
        case Type::Bool:
            return m_stream.get_byte() != std::byte{0};
        case Type::Int8:
            return read_le<int8_t>();
        case Type::Int16:
            return read_le<int16_t>();
        case Type::Int32:
            return read_le<int32_t>();
        case Type::Int64:
            return read_le<int64_t>();
        case Type::UInt8:
            return read_le<uint8_t>();
        case Type::UInt16:
            return read_le<uint16_t>();
        case Type::UInt32:
            return read_le<uint32_t>();
        case Type::UInt64:
            return read_le<uint64_t>();
        case Type::Float32:
            return read_le<float>();
        case Type::Float64:
            return read_le<double>();
        case Type::String:
            return read_string();
        case Type::Bytes:
            return read_raw(read_length());
        case Type::Array: {
            if (depth >= m_options.max_depth)
                throw NestingTooDeep(m_options.max_depth, offset);
            const auto count = read_length();
            check_count(count, 1);  // tag
            Array array;
            array.reserve(size_t(std::min(count, c_max_reserve)));
            for (uint64_t i = 0; i != count; ++i)
                array.push_back(read_value(depth + 1));
            return array;
        }
        case Type::Object: {
            if (depth >= m_options.max_depth)
                throw NestingTooDeep(m_options.max_depth, offset);
            const auto count = read_length();
            check_count(count, 2);  // key length + tag
            Object object;
            object.reserve(size_t(std::min(count, c_max_reserve)));
            for (uint64_t i = 0; i != count; ++i) {
                const auto key_offset = position();
                auto key = read_string();
                if (object.contains(key))
                    throw FormatError(fmt::format("Duplicate key \"{}\"", escape(key)), key_offset);
                auto value = read_value(depth + 1);
                object.add(std::move(key), std::move(value));
            }
            return object;
        }
        case Type::Timestamp:
            return Timestamp(Ticks(read_le<int64_t>()));
        case Type::Duration:
            return Duration(read_le<int64_t>());
        case Type::Reference:
            return Reference{read_le<uint64_t>()};
        case Type::Decimal: {
            Decimal dec;
            dec.lo = read_le<uint32_t>();
            dec.mid = read_le<uint32_t>();
            dec.hi = read_le<uint32_t>();
            dec.flags = read_le<uint32_t>();
            if (!dec.is_valid())
                throw FormatError(fmt::format("Invalid decimal flags {:#010x}", dec.flags), offset);
            return dec;
        }
    }
    throw UnknownTypeTag(tag, offset);
}


} // namespace pnt::data
