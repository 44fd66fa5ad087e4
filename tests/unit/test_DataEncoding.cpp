#include <doctest/doctest.h>

#include "converters/data_encoding.h"

#include <random>

TEST_SUITE("HexCodec") {
    TEST_CASE("Encodes lowercase pairs") {
        CHECK(HexCodec::encode(Bytes{0xde, 0xad, 0x01, 0xff}) == "dead01ff");
        CHECK(HexCodec::encode(Bytes{}) == "");
    }

    TEST_CASE("Decodes either case and skips whitespace") {
        auto decoded = HexCodec::try_decode("DE ad\n01 Ff");
        REQUIRE(decoded);
        CHECK(*decoded == Bytes{0xde, 0xad, 0x01, 0xff});
    }

    TEST_CASE("Empty text is an empty buffer") {
        auto decoded = HexCodec::try_decode("  ");
        REQUIRE(decoded);
        CHECK(decoded->empty());
    }

    TEST_CASE("Rejects odd length and foreign characters") {
        CHECK_FALSE(HexCodec::try_decode("abc"));
        CHECK_FALSE(HexCodec::try_decode("zz"));
        CHECK_FALSE(HexCodec::try_decode("0x12"));
    }
}

TEST_SUITE("Base64Codec") {
    TEST_CASE("Encodes with padding") {
        CHECK(Base64Codec::encode(Bytes{'M', 'a', 'n'}) == "TWFu");
        CHECK(Base64Codec::encode(Bytes{'M', 'a'}) == "TWE=");
        CHECK(Base64Codec::encode(Bytes{'M'}) == "TQ==");
        CHECK(Base64Codec::encode(Bytes{}) == "");
    }

    TEST_CASE("Decodes padded input") {
        CHECK(*Base64Codec::try_decode("TWFu") == Bytes{'M', 'a', 'n'});
        CHECK(*Base64Codec::try_decode("TWE=") == Bytes{'M', 'a'});
        CHECK(*Base64Codec::try_decode("TQ==") == Bytes{'M'});
        CHECK(*Base64Codec::try_decode("TWFu\nTWE=") == Bytes{'M', 'a', 'n', 'M', 'a'});
    }

    TEST_CASE("Rejects malformed input") {
        CHECK_FALSE(Base64Codec::try_decode("TQ"));
        CHECK_FALSE(Base64Codec::try_decode("TQ=A"));
        CHECK_FALSE(Base64Codec::try_decode("TQ==TWFu"));
        CHECK_FALSE(Base64Codec::try_decode("T$Fu"));
        CHECK_FALSE(Base64Codec::try_decode("T==="));
    }
}

TEST_CASE("Decoding an encoding returns the original bytes") {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> byte(0, 255);
    for (size_t length = 0; length < 64; ++length) {
        Bytes data(length);
        for (auto& b : data) {
            b = static_cast<uint8_t>(byte(rng));
        }
        CHECK(HexCodec::try_decode(HexCodec::encode(data)) == data);
        CHECK(Base64Codec::try_decode(Base64Codec::encode(data)) == data);
    }
}
