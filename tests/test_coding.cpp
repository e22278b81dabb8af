// test_coding.cpp created on 2020-06-10 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#define CATCH_CONFIG_FAST_COMPILE
#include <catch2/catch.hpp>

#include <pnt/data/coding/leb128.h>
#include <pnt/data/Crc32.h>
#include <pnt/compat/bit.h>

#include <bit>
#include <limits>
#include <string>

using namespace pnt::data;
using namespace pnt;


TEST_CASE( "LEB128", "[coding]" )
{
    std::byte buffer[10] {};

    SECTION( "encode & decode 7bit value" ) {
        uint32_t v_in = GENERATE(0lu, 1lu, 42lu, 0x0Flu, 0x7Flu);
        auto* iter = buffer;
        leb128_encode(iter, v_in);
        CHECK(iter - buffer == 1);  // encoded in 1B
        CHECK(unsigned(buffer[0]) < 0x80);    // high-order bit not set
        iter = buffer;
        auto v_out = leb128_decode<uint32_t>(iter);
        CHECK(v_in == v_out);
        CHECK(iter - buffer == 1);  // decoded 1B
    }

    SECTION( "encode & decode big value" ) {
        uint64_t v_in = GENERATE(0x80llu, 0xFFllu, 0xAAAllu, 0xABCDEF12llu, 0xFFFFFFFFllu,
                               std::numeric_limits<uint64_t>::max());
        unsigned v_bits = 64 - std::countl_zero(v_in);
        CAPTURE(v_in, v_bits);
        CHECK(v_bits >= 8);
        auto* iter = buffer;
        leb128_encode(iter, v_in);
        auto b_in = iter - buffer;
        CHECK(b_in == (v_bits + 6) / 7);
        CHECK(b_in == leb128_length(v_in));
        CHECK(unsigned(buffer[0]) >= 0x80);    // high-order bit is set
        iter = buffer;
        auto v_out = leb128_decode<uint64_t>(iter);
        auto b_out = iter - buffer;
        CHECK(v_in == v_out);
        CHECK(b_out == b_in);
    }

    SECTION( "length boundaries" ) {
        struct { uint64_t value; unsigned bytes; } const cases[] = {
            {0, 1}, {127, 1}, {128, 2}, {16383, 2}, {16384, 3}, {0xFFFFFFFF, 5},
            {(uint64_t(1) << 35) - 1, 5},
        };
        for (const auto& c : cases) {
            CAPTURE(c.value);
            auto* iter = buffer;
            leb128_encode(iter, c.value);
            CHECK(unsigned(iter - buffer) == c.bytes);
            CHECK(leb128_length(c.value) == c.bytes);
            iter = buffer;
            CHECK(leb128_decode<uint64_t>(iter, 5) == c.value);
        }
    }

    SECTION( "exact bytes" ) {
        auto* iter = buffer;
        leb128_encode(iter, 128u);
        CHECK(buffer[0] == std::byte{0x80});
        CHECK(buffer[1] == std::byte{0x01});
        iter = buffer;
        leb128_encode(iter, 300u);
        CHECK(buffer[0] == std::byte{0xAC});
        CHECK(buffer[1] == std::byte{0x02});
    }

    SECTION( "too many groups" ) {
        // 5 groups, the last one still has continuation bit
        for (int i = 0; i < 5; ++i)
            buffer[i] = std::byte(0x80);
        buffer[5] = std::byte(0x00);
        auto* iter = buffer;
        CHECK(leb128_decode<uint64_t>(iter, 5) == std::numeric_limits<uint64_t>::max());
        CHECK(iter - buffer == 5);  // the 6th byte is not read
        // the same with 6 groups allowed is fine
        iter = buffer;
        CHECK(leb128_decode<uint64_t>(iter, 6) == 0);
    }

    SECTION( "overflow" ) {
        for (int i = 0; i < 9; ++i)
            buffer[i] = std::byte(0xF0 + i);
        buffer[9] = std::byte(0x7F);
        auto* iter = buffer;
        CHECK(leb128_decode<uint32_t>(iter) == std::numeric_limits<uint32_t>::max());
        iter = buffer;
        CHECK(leb128_decode<uint64_t>(iter) == std::numeric_limits<uint64_t>::max());
    }
}


TEST_CASE( "CRC-32", "[coding]" )
{
    SECTION( "check value" ) {
        CHECK(Crc32::calculate(std::string_view("123456789")) == 0xCBF43926);
        CHECK(Crc32::calculate(std::string_view("")) == 0);
        CHECK(Crc32().as_uint32() == 0);
    }

    SECTION( "running checksum gives the same result" ) {
        const std::string data = "The quick brown fox jumps over the lazy dog";
        Crc32 crc;
        crc.feed(data.data(), 10);
        crc.feed(data.data() + 10, 0);
        crc.feed(data.data() + 10, data.size() - 10);
        CHECK(crc.as_uint32() == Crc32::calculate(data));
        CHECK(crc.as_uint32() == 0x414FA339);

        crc.reset();
        for (char c : data)
            crc.feed(std::byte(c));
        CHECK(crc.as_uint32() == 0x414FA339);

        crc.reset();
        CHECK(crc(data) == 0x414FA339);
    }
}


TEST_CASE( "Little-endian read/write", "[coding]" )
{
    std::byte buffer[8] {};
    std::byte* w = buffer;
    le_write(w, uint32_t(0x11223344));
    le_write(w, uint16_t(0xAABB));
    CHECK(w - buffer == 6);
    CHECK(buffer[0] == std::byte{0x44});
    CHECK(buffer[3] == std::byte{0x11});
    CHECK(buffer[4] == std::byte{0xBB});

    const std::byte* r = buffer;
    CHECK(le_read<uint32_t>(r) == 0x11223344);
    CHECK(le_read<uint16_t>(r) == 0xAABB);
    CHECK(r - buffer == 6);

    w = buffer;
    le_write(w, -2.5);
    r = buffer;
    CHECK(le_read<double>(r) == -2.5);
}
