// BinaryWriter.cpp created on 2019-03-13 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2019, 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "BinaryWriter.h"
#include <pnt/data/coding/leb128.h>
#include <pnt/compat/bit.h>
#include <pnt/core/log.h>
#include <pnt/core/string.h>

namespace pnt::data {

using namespace pnt::core;


BinaryWriter::BinaryWriter(Sink& sink, const WriterOptions& options)
    : m_options(options),
      m_stream(sink, options.buffer_size)
{}


BinaryWriter::BinaryWriter(std::ostream& os, const WriterOptions& options)
    : m_options(options),
      m_own_sink(std::make_unique<OstreamSink>(os)),
      m_stream(*m_own_sink, options.buffer_size)
{}


void BinaryWriter::write_header(const Header& header)
{
    const auto bytes = encode_header(header);
    m_stream.write(bytes.data(), bytes.size());
    log::debug("Wrote header: version {}.{}.{}, flags {:#x}, data {}+{}, index {}+{}",
               header.version_major, header.version_minor, header.version_patch,
               header.flags, header.data_offset, header.data_size,
               header.index_offset, header.index_size);
}


void BinaryWriter::write_length(uint64_t length)
{
    if (length > BinaryBase::MaxLength)
        throw EncodingError(fmt::format("Length {} too large (max {})", length, BinaryBase::MaxLength));
    std::byte buf[BinaryBase::MaxLengthBytes];
    std::byte* p = buf;
    leb128_encode(p, length);
    m_stream.write(buf, size_t(p - buf));
}


template <typename T>
void BinaryWriter::write_le(T value)
{
    std::byte buf[sizeof(T)];
    std::byte* p = buf;
    le_write(p, value);
    m_stream.write(buf, sizeof(T));
}


void BinaryWriter::write_string(std::string_view str)
{
    write_length(str.size());
    m_stream.write(reinterpret_cast<const std::byte*>(str.data()), str.size());
}


static void check_string(std::string_view str)
{
    const auto invalid = utf8_invalid_offset(str);
    if (invalid != std::string_view::npos)
        throw EncodingError(fmt::format("Invalid UTF-8 in string \"{}\" at byte {}",
                                        escape(str), invalid));
    if (str.size() > BinaryBase::MaxLength)
        throw EncodingError(fmt::format("String too long ({} bytes)", str.size()));
}


static void check_length(uint64_t length, const char* what)
{
    if (length > BinaryBase::MaxLength)
        throw EncodingError(fmt::format("{} too long ({})", what, length));
}


void BinaryWriter::write_value(const Value& value)
{
    write_value(value, 0);
}


void BinaryWriter::write_value(const Value& value, unsigned depth)
{
    using Type = BinaryBase::Type;
    const auto type = value.type();
    switch (type) {
        case Type::Null:
            write_tag(type);
            break;
        case Type::Bool:
            write_tag(type);
            m_stream.put_byte(value.as_bool() ? std::byte{1} : std::byte{0});
            break;
        case Type::Int8:
            write_tag(type);
            write_le(value.as<int8_t>());
            break;
        case Type::Int16:
            write_tag(type);
            write_le(value.as<int16_t>());
            break;
        case Type::Int32:
            write_tag(type);
            write_le(value.as<int32_t>());
            break;
        case Type::Int64:
            write_tag(type);
            write_le(value.as<int64_t>());
            break;
        case Type::UInt8:
            write_tag(type);
            write_le(value.as<uint8_t>());
            break;
        case Type::UInt16:
            write_tag(type);
            write_le(value.as<uint16_t>());
            break;
        case Type::UInt32:
            write_tag(type);
            write_le(value.as<uint32_t>());
            break;
        case Type::UInt64:
            write_tag(type);
            write_le(value.as<uint64_t>());
            break;
        case Type::Float32:
            write_tag(type);
            write_le(value.as<float>());
            break;
        case Type::Float64:
            write_tag(type);
            write_le(value.as<double>());
            break;
        case Type::String: {
            const auto& str = value.as_string();
            check_string(str);
            write_tag(type);
            write_string(str);
            break;
        }
        case Type::Bytes: {
            const auto& bytes = value.as_bytes();
            check_length(bytes.size(), "Bytes");
            write_tag(type);
            write_length(bytes.size());
            m_stream.write(bytes.data(), bytes.size());
            break;
        }
        case Type::Array: {
            const auto& array = value.as_array();
            if (depth >= m_options.max_depth)
                throw EncodingError(fmt::format("Nesting deeper than {} levels", m_options.max_depth));
            check_length(array.size(), "Array");
            write_tag(type);
            write_length(array.size());
            for (const auto& item : array)
                write_value(item, depth + 1);
            break;
        }
        case Type::Object: {
            const auto& object = value.as_object();
            if (depth >= m_options.max_depth)
                throw EncodingError(fmt::format("Nesting deeper than {} levels", m_options.max_depth));
            check_length(object.size(), "Object");
            write_tag(type);
            write_length(object.size());
            for (const auto& [key, item] : object) {
                check_string(key);
                write_string(key);
                write_value(item, depth + 1);
            }
            break;
        }
        case Type::Timestamp:
            write_tag(type);
            write_le(int64_t(value.as<Timestamp>().time_since_epoch().count()));
            break;
        case Type::Duration:
            write_tag(type);
            write_le(int64_t(value.as<Duration>().count()));
            break;
        case Type::Reference:
            write_tag(type);
            write_le(value.as<Reference>().id);
            break;
        case Type::Decimal: {
            const auto& dec = value.as<Decimal>();
            if (!dec.is_valid())
                throw EncodingError(fmt::format("Invalid decimal flags {:#010x}", dec.flags));
            write_tag(type);
            write_le(dec.lo);
            write_le(dec.mid);
            write_le(dec.hi);
            write_le(dec.flags);
            break;
        }
    }
}


uint64_t encoded_size(const Value& value)
{
    using Type = BinaryBase::Type;
    const auto type = value.type();
    const auto fixed_size = BinaryBase::size_by_type(type);
    if (fixed_size != size_t(-1))
        return 1 + fixed_size;

    switch (type) {
        case Type::String: {
            const uint64_t len = value.as_string().size();
            return 1 + leb128_length(len) + len;
        }
        case Type::Bytes: {
            const uint64_t len = value.as_bytes().size();
            return 1 + leb128_length(len) + len;
        }
        case Type::Array: {
            const auto& array = value.as_array();
            uint64_t size = 1 + leb128_length(uint64_t(array.size()));
            for (const auto& item : array)
                size += encoded_size(item);
            return size;
        }
        case Type::Object: {
            const auto& object = value.as_object();
            uint64_t size = 1 + leb128_length(uint64_t(object.size()));
            for (const auto& [key, item] : object)
                size += leb128_length(uint64_t(key.size())) + key.size() + encoded_size(item);
            return size;
        }
        default:
            return 1;
    }
}


} // namespace pnt::data
