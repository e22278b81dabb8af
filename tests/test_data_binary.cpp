// test_data_binary.cpp created on 2020-06-20 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#define CATCH_CONFIG_FAST_COMPILE
#include <catch2/catch.hpp>

#include "test_util.h"

#include <pnt/data/BinaryWriter.h>
#include <pnt/data/BinaryReader.h>
#include <pnt/data/Dumper.h>
#include <pnt/data/coding/leb128.h>
#include <pnt/compat/bit.h>

#include <chrono>
#include <limits>
#include <sstream>
#include <string>

using namespace pnt::data;
using namespace pnt::test;
using namespace std::string_literals;


static Bytes encode(const Value& value, const WriterOptions& options = {})
{
    Bytes out;
    VectorSink sink(out);
    BinaryWriter writer(sink, options);
    writer.write_value(value);
    writer.close();
    return out;
}


static Value decode(const Bytes& data, const ReaderOptions& options = {})
{
    MemorySource source(data);
    BinaryReader reader(source, options);
    auto value = reader.read_value();
    CHECK(reader.at_end());
    return value;
}


static std::vector<Value> sample_values()
{
    using lim8 = std::numeric_limits<int8_t>;
    using lim16 = std::numeric_limits<int16_t>;
    using lim32 = std::numeric_limits<int32_t>;
    using lim64 = std::numeric_limits<int64_t>;
    return {
        Null{},
        false, true,
        lim8::min(), lim8::max(), int8_t(0),
        lim16::min(), lim16::max(),
        lim32::min(), lim32::max(), 0,
        lim64::min(), lim64::max(),
        uint8_t(0), std::numeric_limits<uint8_t>::max(),
        std::numeric_limits<uint16_t>::max(),
        std::numeric_limits<uint32_t>::max(),
        std::numeric_limits<uint64_t>::max(),
        0.0f, -1.5f, std::numeric_limits<float>::max(), std::numeric_limits<float>::infinity(),
        0.0, 3.141592653589793, std::numeric_limits<double>::lowest(),
        std::numeric_limits<double>::denorm_min(),
        "", "svc", "Červeňoučký 🦞", std::string(300, 'x'), "with\0null"s,
        Bytes{}, make_bytes({0x00, 0xFF, 0x80}),
        Array{}, Array{Null{}, 1, "two"},
        Object{}, Object{{"", Null{}}, {"key", Array{}}},
        Timestamp{}, Timestamp(Ticks(638'000'000'000'000'000)), Timestamp(Ticks(-1)),
        Duration(0), Duration(-10'000'000), Duration(lim64::max()),
        Reference{0}, Reference{std::numeric_limits<uint64_t>::max()},
        Decimal{}, Decimal::from_int(-12345, 2), Decimal::from_int(1, 28),
        Decimal::from_parts(0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF, true, 0),
    };
}


TEST_CASE( "Round-trip all value types", "[BinaryWriter][BinaryReader]" )
{
    const size_t buffer_size = GENERATE(1, 7, 8192);
    const bool chunked = GENERATE(false, true);
    CAPTURE(buffer_size, chunked);

    for (const auto& value : sample_values()) {
        INFO(to_string(value));
        const auto data = encode(value, {buffer_size});
        CHECK(data.size() == encoded_size(value));
        CHECK(data == encode(value));  // independent of buffer size

        ChunkedSource chunked_source(data, 1);
        MemorySource memory_source(data);
        Source& source = chunked ? static_cast<Source&>(chunked_source) : memory_source;
        BinaryReader reader(source, {buffer_size});
        const auto decoded = reader.read_value();
        CHECK(decoded == value);
        CHECK(decoded.type() == value.type());
        CHECK(reader.at_end());
    }
}


TEST_CASE( "Value encoding", "[BinaryWriter]" )
{
    SECTION( "fixed-size scalars" ) {
        CHECK(encode(Null{}) == make_bytes({0x00}));
        CHECK(encode(true) == make_bytes({0x01, 0x01}));
        CHECK(encode(false) == make_bytes({0x01, 0x00}));
        CHECK(encode(int8_t(-1)) == make_bytes({0x02, 0xFF}));
        CHECK(encode(int16_t(-2)) == make_bytes({0x03, 0xFE, 0xFF}));
        CHECK(encode(int32_t(0x01020304)) == make_bytes({0x04, 0x04, 0x03, 0x02, 0x01}));
        CHECK(encode(int64_t(-1)) == make_bytes({0x05, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}));
        CHECK(encode(uint8_t(200)) == make_bytes({0x06, 0xC8}));
        CHECK(encode(uint16_t(8080)) == make_bytes({0x07, 0x90, 0x1F}));
        CHECK(encode(uint32_t(1)) == make_bytes({0x08, 0x01, 0x00, 0x00, 0x00}));
        CHECK(encode(uint64_t(0x0102030405060708)) == make_bytes({0x09, 0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01}));
        CHECK(encode(1.0f) == make_bytes({0x0A, 0x00, 0x00, 0x80, 0x3F}));
        CHECK(encode(1.0) == make_bytes({0x0B, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0, 0x3F}));
        CHECK(encode(Timestamp(Ticks(1))) == make_bytes({0x10, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
        CHECK(encode(Duration(-1)) == make_bytes({0x11, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}));
        CHECK(encode(Reference{2}) == make_bytes({0x12, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
        CHECK(encode(Decimal::from_int(-12345, 2)) == make_bytes({
            0x13,
            0x39, 0x30, 0x00, 0x00,     // lo = 12345
            0x00, 0x00, 0x00, 0x00,     // mid
            0x00, 0x00, 0x00, 0x00,     // hi
            0x00, 0x00, 0x02, 0x80,     // scale 2, negative
        }));
    }

    SECTION( "variable-size" ) {
        CHECK(encode("") == make_bytes({0x0C, 0x00}));
        CHECK(encode("ab") == make_bytes({0x0C, 0x02, 'a', 'b'}));
        CHECK(encode(make_bytes({0xAA})) == make_bytes({0x0D, 0x01, 0xAA}));
        CHECK(encode(Array{}) == make_bytes({0x0E, 0x00}));
        CHECK(encode(Array{true, Null{}}) == make_bytes({0x0E, 0x02, 0x01, 0x01, 0x00}));
        CHECK(encode(Object{}) == make_bytes({0x0F, 0x00}));

        // 128-byte string has 2-byte length
        const auto data = encode(std::string(128, 'a'));
        REQUIRE(data.size() == 1 + 2 + 128);
        CHECK(data[1] == std::byte{0x80});
        CHECK(data[2] == std::byte{0x01});
    }

    SECTION( "minimal config" ) {
        const Value config = Object{
            {"name", "svc"},
            {"port", uint16_t(8080)},
            {"enabled", true},
        };
        const auto expected = make_bytes({
            0x0F, 0x03,
            0x04, 'n', 'a', 'm', 'e', 0x0C, 0x03, 's', 'v', 'c',
            0x04, 'p', 'o', 'r', 't', 0x07, 0x90, 0x1F,
            0x07, 'e', 'n', 'a', 'b', 'l', 'e', 'd', 0x01, 0x01,
        });
        const auto data = encode(config);
        CHECK(data == expected);

        const auto decoded = decode(expected);
        REQUIRE(decoded.is_object());
        const auto& obj = decoded.as_object();
        CHECK(obj.size() == 3);
        CHECK(obj.at("name") == Value("svc"));
        CHECK(obj.at("port") == Value(uint16_t(8080)));
        CHECK(obj.at("enabled") == Value(true));
        CHECK(decoded == config);
    }

    SECTION( "non-zero bool byte reads as true" ) {
        CHECK(decode(make_bytes({0x01, 0x02})) == Value(true));
        CHECK(decode(make_bytes({0x01, 0xFF})) == Value(true));
    }

    SECTION( "std::ostream / std::istream" ) {
        std::stringstream ss;
        {
            BinaryWriter writer(ss);
            writer.write_value(Array{1, 2});
            writer.write_value("x");
        }
        BinaryReader reader(ss);
        CHECK(reader.read_value() == Value(Array{1, 2}));
        CHECK(reader.read_value() == Value("x"));
        CHECK(reader.at_end());
    }
}


TEST_CASE( "Varint length", "[BinaryWriter][BinaryReader]" )
{
    SECTION( "boundaries" ) {
        const uint64_t length = GENERATE(as<uint64_t>{}, 0, 127, 128, 16383, 16384, 0xFFFFFFFF,
                                         (uint64_t(1) << 35) - 1);
        CAPTURE(length);
        Bytes data;
        {
            VectorSink sink(data);
            BinaryWriter writer(sink);
            writer.write_length(length);
        }
        CHECK(data.size() == pnt::data::leb128_length(length));
        MemorySource source(data);
        BinaryReader reader(source);
        CHECK(reader.read_length() == length);
        CHECK(reader.at_end());
    }

    SECTION( "length too large to encode" ) {
        Bytes data;
        VectorSink sink(data);
        BinaryWriter writer(sink);
        CHECK_THROWS_AS(writer.write_length(uint64_t(1) << 35), EncodingError);
        CHECK_THROWS_AS(writer.write_length(std::numeric_limits<uint64_t>::max()), EncodingError);
    }

    SECTION( "5th group with continuation bit" ) {
        const auto data = make_bytes({0x80, 0x80, 0x80, 0x80, 0x80, 0x00});
        MemorySource source(data);
        BinaryReader reader(source);
        CHECK_THROWS_AS(reader.read_length(), FormatError);

        // inside a value
        CHECK_THROWS_AS(decode(make_bytes({0x0C, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01})), FormatError);
    }

    SECTION( "truncated length" ) {
        CHECK_THROWS_AS(decode(make_bytes({0x0C, 0x80})), TruncationError);
    }
}


TEST_CASE( "Decoding errors", "[BinaryReader]" )
{
    SECTION( "unknown type tag" ) {
        CHECK_THROWS_AS(decode(make_bytes({0x14})), FormatError);
        CHECK_THROWS_AS(decode(make_bytes({0xFF})), UnknownTypeTag);
        try {
            decode(make_bytes({0x0E, 0x02, 0x00, 0x14}));
            FAIL("expected UnknownTypeTag");
        } catch (const UnknownTypeTag& e) {
            CHECK(e.tag() == 0x14);
            CHECK_THAT(e.what(), Catch::Contains("0x14") && Catch::Contains("offset 3"));
        }
    }

    SECTION( "empty input" ) {
        CHECK_THROWS_AS(decode(Bytes{}), TruncationError);
    }

    SECTION( "truncated fixed-size payload" ) {
        CHECK_THROWS_AS(decode(make_bytes({0x01})), TruncationError);
        CHECK_THROWS_AS(decode(make_bytes({0x05, 0x01, 0x02, 0x03})), TruncationError);
        CHECK_THROWS_AS(decode(make_bytes({0x13, 0x00, 0x00})), TruncationError);
    }

    SECTION( "declared length beyond input" ) {
        CHECK_THROWS_AS(decode(make_bytes({0x0C, 0x05, 'a', 'b'})), TruncationError);
        CHECK_THROWS_AS(decode(make_bytes({0x0D, 0x0A, 0x01})), TruncationError);
        CHECK_THROWS_AS(decode(make_bytes({0x0E, 0x03, 0x00, 0x00})), TruncationError);
        CHECK_THROWS_AS(decode(make_bytes({0x0F, 0x02, 0x01, 'a', 0x00})), TruncationError);
        // huge claimed length, no byte budget
        CHECK_THROWS_AS(decode(make_bytes({0x0D, 0xFF, 0xFF, 0xFF, 0xFF, 0x0F, 0x01})), TruncationError);
    }

    SECTION( "byte budget rejects length before reading" ) {
        const auto data = make_bytes({0x0D, 0xFF, 0xFF, 0xFF, 0xFF, 0x0F, 0x01, 0x02});
        MemorySource source(data);
        BinaryReader reader(source);
        reader.set_limit(data.size());
        CHECK_THROWS_AS(reader.read_value(), TruncationError);
        CHECK(reader.position() == 6);  // tag and length consumed, payload untouched

        const auto array = make_bytes({0x0E, 0xFF, 0xFF, 0xFF, 0x7F, 0x00});
        MemorySource array_source(array);
        BinaryReader array_reader(array_source);
        array_reader.set_limit(array.size());
        CHECK_THROWS_AS(array_reader.read_value(), TruncationError);
    }

    SECTION( "invalid UTF-8" ) {
        CHECK_THROWS_AS(decode(make_bytes({0x0C, 0x02, 0xC3, 0x28})), FormatError);
        CHECK_THROWS_AS(decode(make_bytes({0x0F, 0x01, 0x01, 0xFF, 0x00})), FormatError);
    }

    SECTION( "invalid decimal flags" ) {
        auto data = encode(Decimal::from_int(1));
        data[13] = std::byte{0x01};  // flags bit 0
        CHECK_THROWS_AS(decode(data), FormatError);
        data[13] = std::byte{0x00};
        data[15] = std::byte{29};  // scale 29
        CHECK_THROWS_AS(decode(data), FormatError);
    }

    SECTION( "duplicate object key" ) {
        const auto data = make_bytes({0x0F, 0x02, 0x01, 'k', 0x00, 0x01, 'k', 0x01, 0x01});
        CHECK_THROWS_AS(decode(data), FormatError);
    }
}


TEST_CASE( "Encoding errors", "[BinaryWriter]" )
{
    SECTION( "invalid UTF-8" ) {
        CHECK_THROWS_AS(encode("\xC3\x28"), EncodingError);
        CHECK_THROWS_AS(encode(Object{{"\xFF", 1}}), EncodingError);
        CHECK_THROWS_AS(encode(Array{"ok", "\xED\xA0\x80"}), EncodingError);
    }

    SECTION( "invalid decimal" ) {
        CHECK_THROWS_AS(encode(Decimal{1, 0, 0, 0x0000'0100}), EncodingError);
        CHECK_THROWS_AS(encode(Decimal::from_int(1, 29)), EncodingError);
    }

    SECTION( "nothing written for rejected value" ) {
        Bytes out;
        VectorSink sink(out);
        BinaryWriter writer(sink);
        CHECK_THROWS_AS(writer.write_value("\xFF"), EncodingError);
        writer.close();
        CHECK(out.empty());
    }
}


TEST_CASE( "Nesting", "[BinaryWriter][BinaryReader]" )
{
    // Array > Object > Array
    const Value nested = Array{
        Object{
            {"list", Array{1, 2, Array{}}},
            {"name", "inner"},
        },
        Null{},
    };

    SECTION( "round-trip" ) {
        CHECK(decode(encode(nested)) == nested);
        CHECK(decode(encode(nested, {.max_depth = 4}), {.max_depth = 4}) == nested);
    }

    SECTION( "depth limit on read" ) {
        const auto data = encode(nested);
        CHECK_THROWS_AS(decode(data, {.max_depth = 3}), NestingTooDeep);
        CHECK_THROWS_AS(decode(data, {.max_depth = 0}), FormatError);
    }

    SECTION( "depth limit on write" ) {
        CHECK_THROWS_AS(encode(nested, {.max_depth = 3}), EncodingError);
    }

    SECTION( "deeply nested input fails cleanly" ) {
        Bytes data;
        for (int i = 0; i != 100'000; ++i) {
            data.push_back(std::byte{0x0E});
            data.push_back(std::byte{0x01});
        }
        data.push_back(std::byte{0x00});
        CHECK_THROWS_AS(decode(data), NestingTooDeep);
    }
}


TEST_CASE( "Header", "[BinaryWriter][BinaryReader]" )
{
    Header header;
    header.flags = BinaryBase::FlagIndexed | BinaryBase::FlagStreaming;
    header.data_offset = 64;
    header.data_size = 0x0102030405060708;
    header.index_offset = std::numeric_limits<uint64_t>::max();
    header.index_size = 17;

    const auto bytes = encode_header(header);

    SECTION( "layout" ) {
        CHECK(bytes[0] == std::byte{0x50});
        CHECK(bytes[1] == std::byte{0x4E});
        CHECK(bytes[2] == std::byte{0x54});
        CHECK(bytes[3] == std::byte{0x00});
        CHECK(bytes[4] == std::byte{1});  // version 1.0.0
        CHECK(bytes[5] == std::byte{0});
        CHECK(bytes[6] == std::byte{0});
        const std::byte* p = bytes.data() + 7;
        CHECK(pnt::le_read<uint32_t>(p) == header.flags);
        CHECK(pnt::le_read<uint64_t>(p) == 64);
        CHECK(pnt::le_read<uint64_t>(p) == header.index_offset);
        CHECK(pnt::le_read<uint64_t>(p) == header.data_size);
        CHECK(pnt::le_read<uint64_t>(p) == 17);
        CHECK(pnt::le_read<uint32_t>(p) ==
              Crc32::calculate(std::span<const std::byte>(bytes.data(), 43)));
        for (size_t i = 47; i != 64; ++i)
            CHECK(bytes[i] == std::byte{0});
    }

    SECTION( "round-trip" ) {
        const auto decoded = decode_header(bytes);
        CHECK(decoded == header);
        CHECK(decoded.checksum == Crc32::calculate(std::span<const std::byte>(bytes.data(), 43)));

        Bytes data;
        {
            VectorSink sink(data);
            BinaryWriter writer(sink, {1});
            writer.write_header(header);
        }
        REQUIRE(data.size() == 64);
        ChunkedSource source(data, 1);
        BinaryReader reader(source, {1});
        CHECK(reader.read_header() == header);
        CHECK(reader.position() == 64);
    }

    SECTION( "non-default version is accepted" ) {
        Header h2 = header;
        h2.version_major = 2;
        h2.version_minor = 255;
        h2.version_patch = 7;
        CHECK(decode_header(encode_header(h2)) == h2);
        CHECK(decode_header(encode_header(h2)) != header);
    }

    SECTION( "checksum sensitivity" ) {
        for (size_t i = 0; i != 64; ++i) {
            for (unsigned bit = 0; bit != 8; ++bit) {
                CAPTURE(i, bit);
                auto corrupted = bytes;
                corrupted[i] ^= std::byte(1u << bit);
                if (i < 4) {
                    CHECK_THROWS_AS(decode_header(corrupted), BadMagic);
                } else if (i < 47) {
                    CHECK_THROWS_AS(decode_header(corrupted), CorruptionError);
                } else {
                    // reserved bytes are ignored
                    CHECK(decode_header(corrupted) == header);
                }
            }
        }
    }

    SECTION( "magic is checked before checksum" ) {
        // wrong magic with valid checksum over it
        auto corrupted = bytes;
        corrupted[0] = std::byte{'X'};
        const auto crc = Crc32::calculate(std::span<const std::byte>(corrupted.data(), 43));
        std::byte* p = corrupted.data() + 43;
        pnt::le_write(p, crc);
        CHECK_THROWS_AS(decode_header(corrupted), FormatError);

        Bytes data(corrupted.begin(), corrupted.end());
        MemorySource source(data);
        BinaryReader reader(source);
        CHECK_THROWS_AS(reader.read_header(), BadMagic);
    }

    SECTION( "4-byte stream" ) {
        {
            const auto data = make_bytes({'P', 'N', 'G', 0x00});
            MemorySource source(data);
            BinaryReader reader(source);
            CHECK_THROWS_AS(reader.read_header(), FormatError);
        }
        {
            const auto data = make_bytes({'P', 'N', 'T', 0x00});
            MemorySource source(data);
            BinaryReader reader(source);
            CHECK_THROWS_AS(reader.read_header(), TruncationError);
        }
    }

    SECTION( "stream shorter than magic" ) {
        const auto data = make_bytes({'P', 'N'});
        MemorySource source(data);
        BinaryReader reader(source);
        CHECK_THROWS_AS(reader.read_header(), TruncationError);
    }

    SECTION( "dump" ) {
        CHECK_THAT(to_string(header), Catch::StartsWith("PNT 1.0.0\nflags: 0x00000014 (Indexed, Streaming)\n"));
    }
}
