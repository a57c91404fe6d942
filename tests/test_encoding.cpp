#include <doctest/doctest.h>
#include "hideez/encoding.hpp"

using namespace hideez;

TEST_CASE("Hex encodes lowercase and decodes either case") {
    const Bytes v{0x00, 0x0f, 0xab, 0xff};
    CHECK(to_hex(v) == "000fabff");

    Bytes out;
    REQUIRE(from_hex("000FabFF", out));
    CHECK(out == v);
    REQUIRE(from_hex("0x000fabff", out));
    CHECK(out == v);
    REQUIRE(from_hex("", out));
    CHECK(out.empty());
}

TEST_CASE("Hex rejects odd length and non-hex digits without touching the output") {
    Bytes out{1, 2, 3};
    CHECK(!from_hex("abc", out));
    CHECK(!from_hex("zz", out));
    CHECK(!from_hex("0x1", out));
    CHECK(out == Bytes{1, 2, 3});
}

TEST_CASE("Base64 matches RFC 4648 test vectors") {
    CHECK(to_base64(to_bytes("")) == "");
    CHECK(to_base64(to_bytes("f")) == "Zg==");
    CHECK(to_base64(to_bytes("fo")) == "Zm8=");
    CHECK(to_base64(to_bytes("foo")) == "Zm9v");
    CHECK(to_base64(to_bytes("foobar")) == "Zm9vYmFy");

    Bytes out;
    REQUIRE(from_base64("Zm9vYg==", out));
    CHECK(to_string(out) == "foob");
    REQUIRE(from_base64("Zm9v\nYmFy", out));    // whitespace skipped
    CHECK(to_string(out) == "foobar");
}

TEST_CASE("Base64 rejects garbage, data after padding and a dangling group") {
    Bytes out;
    CHECK(!from_base64("Zm9v!", out));
    CHECK(!from_base64("Zg==Zg==", out));
    CHECK(!from_base64("Zm9vY", out));
}

TEST_CASE("Base64 decoding requires canonical padded quanta") {
    Bytes out = to_bytes("untouched");
    CHECK(!from_base64("QQ", out));          // unpadded
    CHECK(!from_base64("Zm9vYg", out));
    CHECK(!from_base64("QUJD=", out));       // length not a multiple of 4
    CHECK(!from_base64("QR==", out));        // leftover bits set
    CHECK(!from_base64("Zm9=", out));
    CHECK(!from_base64("Q===", out));        // three pad characters
    CHECK(!from_base64("Z=9v", out));        // '=' in the middle
    CHECK(to_string(out) == "untouched");

    REQUIRE(from_base64("QQ==", out));
    CHECK(to_string(out) == "A");
    REQUIRE(from_base64("QUI=", out));
    CHECK(to_string(out) == "AB");
    REQUIRE(from_base64("", out));
    CHECK(out.empty());
}

TEST_CASE("Binary payloads survive hex and base64 decoding") {
    Bytes all;
    for (int i = 0; i < 256; ++i) all.push_back(static_cast<uint8_t>(i));

    Bytes back;
    REQUIRE(from_hex(to_hex(all), back));
    CHECK(back == all);
    REQUIRE(from_base64(to_base64(all), back));
    CHECK(back == all);
}
