/**
 * @file test_api.cpp
 * @brief Tests for the throwing high-level API.
 */

#include <rawrfid/rawrfid.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

using namespace rawrfid;

#if !RAWRFID_NO_EXCEPTIONS

TEST_CASE("version", "[api]") {
    REQUIRE(std::strcmp(version(), "1.0.0") == 0);
}

TEST_CASE("decode throws FormatException", "[api]") {
    std::vector<std::uint8_t> bytes = encode(Container(Header{}, {{3, 5}}));

    SECTION("valid input") {
        Container container = decode(bytes);
        REQUIRE(container.pairs() == PairList{{3, 5}});
    }

    SECTION("bad magic") {
        bytes[0] = 0xC0;
        try {
            (void)decode(bytes);
            FAIL("expected FormatException");
        } catch (const FormatException& e) {
            REQUIRE(e.code() == Error::BadMagic);
            REQUIRE(std::string(e.what()) == "Not a RIFL file: at byte offset 0");
        }
    }

    SECTION("dangling byte") {
        bytes.push_back(0x00);
        try {
            (void)decode(bytes);
            FAIL("expected FormatException");
        } catch (const FormatException& e) {
            REQUIRE(e.code() == Error::MisalignedPairData);
            REQUIRE(std::string(e.what()).find("at byte offset 26") != std::string::npos);
        }
    }

    SECTION("lenient params") {
        std::vector<std::uint8_t> lenient = encode(Container(Header{}, {{5, 3}}));
        REQUIRE_THROWS_AS(decode(lenient), FormatException);

        DecodeParams params;
        params.strict_pairs = false;
        REQUIRE(decode(lenient, &params).pairs() == PairList{{5, 3}});
    }
}

TEST_CASE("load throws IoException", "[api]") {
    const std::string path =
        (std::filesystem::temp_directory_path() / "rawrfid_test_api_missing.raw").string();
    REQUIRE_THROWS_AS(load(path), IoException);
}

TEST_CASE("load of a directory throws IoException", "[api]") {
    const std::string dir = std::filesystem::temp_directory_path().string();
    try {
        (void)load(dir);
        FAIL("expected IoException");
    } catch (const IoException& e) {
        REQUIRE(e.code() == Error::Io);
    }
}

TEST_CASE("encode throws on oversized pair", "[api]") {
    Header header;
    header.max_buffer_size = 2;
    Container container(header, {{300, 1500}});

    try {
        (void)encode(container);
        FAIL("expected FormatException");
    } catch (const FormatException& e) {
        REQUIRE(e.code() == Error::BufferTooLarge);
    }
}

TEST_CASE("signal conversion throws", "[api]") {
    REQUIRE_THROWS_AS(to_signal(PairList{{5, 3}}), FormatException);
    REQUIRE_THROWS_AS(to_signal(PairList{{0, 0xFFFFFFFFU}}), OverflowException);

    Signal signal = to_signal(PairList{{3, 5}, {2, 4}});
    REQUIRE(signal.size() == 9);
    REQUIRE(to_pairs(signal) == PairList{{3, 5}, {2, 4}});
}

TEST_CASE("exceptions share a base class", "[api]") {
    REQUIRE_THROWS_AS(to_signal(PairList{{5, 3}}), RawRfidException);
    REQUIRE_THROWS_AS(throw_error(Error::InvalidArg), InvalidArgumentException);
    REQUIRE_THROWS_AS(throw_error(Error::Io, "x"), IoException);
}

#endif // !RAWRFID_NO_EXCEPTIONS
