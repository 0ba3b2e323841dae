/**
 * @file test_bytereader.cpp
 * @brief Unit tests for ByteReader class and little-endian loads.
 */

#include <catch2/catch_test_macros.hpp>
#include <rawrfid/bytereader.hpp>

using namespace rawrfid;

TEST_CASE("ByteReader construction", "[bytereader]") {
    std::uint8_t data[] = {0xAB, 0xCD};

    ByteReader reader(data, sizeof(data));
    REQUIRE(reader.remaining() == 2);
    REQUIRE(reader.position() == 0);
    REQUIRE(reader.data() == data);
}

TEST_CASE("ByteReader read_byte", "[bytereader]") {
    std::uint8_t data[] = {0x00, 0x7F, 0xFF};
    ByteReader reader(data, sizeof(data));

    SECTION("reads bytes in order") {
        REQUIRE(reader.read_byte() == 0x00);
        REQUIRE(reader.read_byte() == 0x7F);
        REQUIRE(reader.read_byte() == 0xFF);
        REQUIRE(reader.position() == 3);
    }

    SECTION("read past end returns -1") {
        for (int i = 0; i < 3; ++i) {
            reader.read_byte();
        }
        REQUIRE(reader.read_byte() == -1);
        REQUIRE(reader.remaining() == 0);
    }
}

TEST_CASE("ByteReader read_u32_le", "[bytereader]") {
    SECTION("least significant byte first") {
        std::uint8_t data[] = {0x52, 0x49, 0x46, 0x4C};
        ByteReader reader(data, sizeof(data));

        std::uint32_t value = 0;
        REQUIRE(reader.read_u32_le(value) == Error::Ok);
        REQUIRE(value == 0x4C464952U);
        REQUIRE(reader.remaining() == 0);
    }

    SECTION("short read leaves position and value unchanged") {
        std::uint8_t data[] = {0x01, 0x02, 0x03};
        ByteReader reader(data, sizeof(data));

        std::uint32_t value = 99;
        REQUIRE(reader.read_u32_le(value) == Error::TruncatedInput);
        REQUIRE(value == 99);
        REQUIRE(reader.position() == 0);
    }
}

TEST_CASE("ByteReader read_f32_le", "[bytereader]") {
    // 125000.0f
    std::uint8_t data[] = {0x00, 0x24, 0xF4, 0x47, 0x00, 0x00, 0x00, 0x3F};
    ByteReader reader(data, sizeof(data));

    float frequency = 0.0F;
    float duty = 0.0F;
    REQUIRE(reader.read_f32_le(frequency) == Error::Ok);
    REQUIRE(reader.read_f32_le(duty) == Error::Ok);
    REQUIRE(frequency == 125000.0F);
    REQUIRE(duty == 0.5F);

    float extra = 1.0F;
    REQUIRE(reader.read_f32_le(extra) == Error::TruncatedInput);
    REQUIRE(extra == 1.0F);
}

TEST_CASE("ByteReader take and skip", "[bytereader]") {
    std::uint8_t data[] = {1, 2, 3, 4, 5, 6};
    ByteReader reader(data, sizeof(data));

    SECTION("take splits off a bounded reader") {
        REQUIRE(reader.skip(1) == Error::Ok);

        ByteReader sub(nullptr, 0);
        REQUIRE(reader.take(3, sub) == Error::Ok);
        REQUIRE(sub.remaining() == 3);
        REQUIRE(sub.read_byte() == 2);
        REQUIRE(sub.read_byte() == 3);
        REQUIRE(sub.read_byte() == 4);
        REQUIRE(sub.read_byte() == -1);

        REQUIRE(reader.position() == 4);
        REQUIRE(reader.read_byte() == 5);
    }

    SECTION("take more than remaining fails") {
        ByteReader sub(nullptr, 0);
        REQUIRE(reader.take(7, sub) == Error::TruncatedInput);
        REQUIRE(reader.position() == 0);
    }

    SECTION("skip exact size") {
        REQUIRE(reader.skip(6) == Error::Ok);
        REQUIRE(reader.remaining() == 0);
        REQUIRE(reader.skip(1) == Error::TruncatedInput);
    }
}

TEST_CASE("Little-endian store and load", "[bytereader]") {
    std::uint8_t bytes[4] = {};

    store_u32_le(bytes, 0x00000800U);
    REQUIRE(bytes[0] == 0x00);
    REQUIRE(bytes[1] == 0x08);
    REQUIRE(bytes[2] == 0x00);
    REQUIRE(bytes[3] == 0x00);
    REQUIRE(load_u32_le(bytes) == 2048U);

    store_f32_le(bytes, 0.5F);
    REQUIRE(bytes[3] == 0x3F);
    REQUIRE(load_f32_le(bytes) == 0.5F);
}
