#include <catch2/catch_test_macros.hpp>

#include "base64.hpp"

#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return {s.begin(), s.end()};
}

} // namespace

TEST_CASE("base64", "[base64]") {

    SECTION("Rfc4648Vectors") {
        REQUIRE(base64::encode(bytes("")) == "");
        REQUIRE(base64::encode(bytes("f")) == "Zg==");
        REQUIRE(base64::encode(bytes("fo")) == "Zm8=");
        REQUIRE(base64::encode(bytes("foo")) == "Zm9v");
        REQUIRE(base64::encode(bytes("foobar")) == "Zm9vYmFy");
    }

    SECTION("DecodeVectors") {
        REQUIRE(base64::decode("Zg==") == bytes("f"));
        REQUIRE(base64::decode("Zm8=") == bytes("fo"));
        REQUIRE(base64::decode("Zm9vYmFy") == bytes("foobar"));
        REQUIRE(base64::decode("")->empty());
    }

    SECTION("BinaryPayload") {
        std::vector<uint8_t> audio = {0x00, 0xFF, 0x80, 0x7F, 0xFE, 0x01, 0x10};
        REQUIRE(base64::decode(base64::encode(audio)) == audio);
    }

    SECTION("RejectsBadInput") {
        REQUIRE_FALSE(base64::decode("Zm9v!").has_value());
        REQUIRE_FALSE(base64::decode("Z").has_value());
        REQUIRE_FALSE(base64::decode("Zm 9v").has_value());
    }
}
