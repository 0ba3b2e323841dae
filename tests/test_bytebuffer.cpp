/**
 * @file test_bytebuffer.cpp
 * @brief Unit tests for ByteBuffer class.
 */

#include <catch2/catch_test_macros.hpp>
#include <rawrfid/bytebuffer.hpp>

#include <vector>

using namespace rawrfid;

TEST_CASE("ByteBuffer initialization", "[bytebuffer]") {
    ByteBuffer bb;
    REQUIRE(bb.size() == 0);
    REQUIRE(bb.empty());
}

TEST_CASE("ByteBuffer append", "[bytebuffer]") {
    ByteBuffer bb;

    SECTION("single bytes") {
        bb.append_byte(0xAA);
        bb.append_byte(0x55);
        REQUIRE(bb.bytes() == std::vector<std::uint8_t>{0xAA, 0x55});
    }

    SECTION("u32 little-endian") {
        bb.append_u32_le(0x4C464952U);
        REQUIRE(bb.bytes() == std::vector<std::uint8_t>{'R', 'I', 'F', 'L'});
    }

    SECTION("f32 little-endian") {
        bb.append_f32_le(125000.0F);
        REQUIRE(bb.bytes() == std::vector<std::uint8_t>{0x00, 0x24, 0xF4, 0x47});
    }

    SECTION("raw bytes and other buffer") {
        std::uint8_t raw[] = {1, 2, 3};
        bb.append_bytes(raw, sizeof(raw));

        ByteBuffer other;
        other.append_byte(4);
        bb.append_buffer(other);

        REQUIRE(bb.bytes() == std::vector<std::uint8_t>{1, 2, 3, 4});
    }
}

TEST_CASE("ByteBuffer patch_u32_le", "[bytebuffer]") {
    ByteBuffer bb;
    bb.append_byte(0xFF);
    bb.append_u32_le(0);
    bb.append_byte(0xEE);

    SECTION("overwrites in place") {
        REQUIRE(bb.patch_u32_le(1, 0x01020304U) == Error::Ok);
        REQUIRE(bb.bytes() == std::vector<std::uint8_t>{0xFF, 0x04, 0x03, 0x02, 0x01, 0xEE});
    }

    SECTION("field past the end is rejected") {
        REQUIRE(bb.patch_u32_le(3, 1) == Error::InvalidArg);
        REQUIRE(bb.patch_u32_le(100, 1) == Error::InvalidArg);
        REQUIRE(bb.size() == 6);
    }
}

TEST_CASE("ByteBuffer clear and release", "[bytebuffer]") {
    ByteBuffer bb;
    bb.append_u32_le(7);

    SECTION("clear") {
        bb.clear();
        REQUIRE(bb.empty());
    }

    SECTION("release moves bytes out") {
        std::vector<std::uint8_t> out = bb.release();
        REQUIRE(out.size() == 4);
        REQUIRE(out[0] == 7);
        REQUIRE(bb.empty());
    }
}
