// BinaryBase.h created on 2019-03-14 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2019, 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_DATA_BINARY_BASE_H
#define PNT_DATA_BINARY_BASE_H

#include <pnt/core/error.h>

#include <fmt/core.h>

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

namespace pnt::data {


/// Base of all encode/decode errors.
class CodecError : public core::Error {
public:
    explicit CodecError(std::string msg) : core::Error(std::move(msg)) {}
};


/// The input is not PNT data, or it is structurally invalid:
/// bad magic, unknown type tag, malformed length, invalid payload.
class FormatError : public CodecError {
public:
    explicit FormatError(std::string msg) : CodecError(std::move(msg)) {}
    FormatError(std::string_view msg, uint64_t offset)
        : CodecError(fmt::format("{} (at offset {})", msg, offset)) {}
};

class BadMagic : public FormatError {
public:
    explicit BadMagic(uint64_t offset) : FormatError("Bad magic", offset) {}
};

class UnknownTypeTag : public FormatError {
public:
    UnknownTypeTag(uint8_t tag, uint64_t offset)
        : FormatError(fmt::format("Unknown type tag 0x{:02X}", tag), offset), m_tag(tag) {}
    uint8_t tag() const { return m_tag; }
private:
    uint8_t m_tag;
};

class NestingTooDeep : public FormatError {
public:
    NestingTooDeep(unsigned max_depth, uint64_t offset)
        : FormatError(fmt::format("Nesting deeper than {} levels", max_depth), offset) {}
};


/// Header checksum (or footer checksum) doesn't match the data.
class CorruptionError : public CodecError {
public:
    explicit CorruptionError(std::string msg) : CodecError(std::move(msg)) {}
};

class BadChecksum : public CorruptionError {
public:
    BadChecksum(uint32_t stored, uint32_t computed)
        : CorruptionError(fmt::format("Bad checksum (stored {:08X}, computed {:08X})", stored, computed)) {}
};


/// The input ended before the value was complete.
class TruncationError : public CodecError {
public:
    explicit TruncationError(uint64_t offset)
        : CodecError(fmt::format("Unexpected end of data (at offset {})", offset)) {}
    TruncationError(uint64_t offset, uint64_t requested)
        : CodecError(fmt::format("Unexpected end of data (at offset {}, {} more bytes expected)",
                                 offset, requested)) {}
};


/// The value can't be represented in PNT format.
class EncodingError : public CodecError {
public:
    explicit EncodingError(std::string msg) : CodecError(std::move(msg)) {}
};


/// Underlying stream failed (I/O error) or was already closed.
class StreamError : public CodecError {
public:
    explicit StreamError(std::string msg) : CodecError(std::move(msg)) {}
};


struct BinaryBase {

    // magic: "PNT\0"
    static constexpr std::byte Magic[4] { std::byte{0x50}, std::byte{0x4E}, std::byte{0x54}, std::byte{0x00} };

    // default version written by encoder
    static constexpr uint8_t VersionMajor = 1;
    static constexpr uint8_t VersionMinor = 0;
    static constexpr uint8_t VersionPatch = 0;

    // header layout
    static constexpr size_t HeaderSize = 64;
    static constexpr size_t MagicSize = 4;
    static constexpr size_t ChecksumOffset = 43;  // CRC32 covers [0, ChecksumOffset)
    static constexpr size_t ReservedOffset = 47;

    // footer layout: MAGIC:4, FILE_SIZE:4, CRC32:4, RESERVED:4
    static constexpr std::byte FooterMagic[4] { std::byte{0x00}, std::byte{0x54}, std::byte{0x4E}, std::byte{0x50} };
    static constexpr size_t FooterSize = 16;

    static constexpr size_t DefaultBufferSize = 8192;
    static constexpr unsigned DefaultMaxDepth = 64;

    // Lengths are capped to 5 LEB128 groups (35 bits)
    static constexpr unsigned MaxLengthBytes = 5;
    static constexpr uint64_t MaxLength = (uint64_t(1) << (7 * MaxLengthBytes)) - 1;

    // Header flags - opaque to the codec, named for the consumers
    enum Flags: uint32_t {
        FlagCompressed  = 1u << 0,
        FlagEncrypted   = 1u << 1,
        FlagIndexed     = 1u << 2,
        FlagValidated   = 1u << 3,  // document has footer with file CRC
        FlagStreaming   = 1u << 4,
    };

    // Type tag, the first byte of every value.
    enum class Type: uint8_t {
        Null        = 0x00,
        Bool        = 0x01,
        Int8        = 0x02,
        Int16       = 0x03,
        Int32       = 0x04,
        Int64       = 0x05,
        UInt8       = 0x06,
        UInt16      = 0x07,
        UInt32      = 0x08,
        UInt64      = 0x09,
        Float32     = 0x0A,
        Float64     = 0x0B,
        String      = 0x0C,
        Bytes       = 0x0D,
        Array       = 0x0E,
        Object      = 0x0F,
        Timestamp   = 0x10,
        Duration    = 0x11,
        Reference   = 0x12,
        Decimal     = 0x13,
    };

    static constexpr uint8_t LastType = uint8_t(Type::Decimal);

    static constexpr bool is_valid_type(uint8_t tag) { return tag <= LastType; }

    /// Size of fixed payload, or size_t(-1) for types with length prefix
    static constexpr size_t size_by_type(Type type) {
        switch (type) {
            case Type::Null:
                return 0;
            case Type::Bool:
            case Type::Int8:
            case Type::UInt8:
                return 1;
            case Type::Int16:
            case Type::UInt16:
                return 2;
            case Type::Int32:
            case Type::UInt32:
            case Type::Float32:
                return 4;
            case Type::Int64:
            case Type::UInt64:
            case Type::Float64:
            case Type::Timestamp:
            case Type::Duration:
            case Type::Reference:
                return 8;
            case Type::Decimal:
                return 16;
            default:
                return size_t(-1);
        }
    }

    static constexpr bool type_has_len(Type type) {
        return type == Type::String || type == Type::Bytes || type == Type::Array || type == Type::Object;
    }
};


const char* type_to_cstr(BinaryBase::Type type);


struct ReaderOptions {
    size_t buffer_size = BinaryBase::DefaultBufferSize;
    unsigned max_depth = BinaryBase::DefaultMaxDepth;  // nesting of Array / Object
};


struct WriterOptions {
    size_t buffer_size = BinaryBase::DefaultBufferSize;
    unsigned max_depth = BinaryBase::DefaultMaxDepth;
};


} // namespace pnt::data

#endif // include guard
