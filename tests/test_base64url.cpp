#include <doctest/doctest.h>
#include "xtoc/base64url.hpp"

#include <vector>

using namespace xtoc;

TEST_CASE("Base64URL encodes without padding and with the URL alphabet") {
    CHECK(encode_base64url(std::vector<uint8_t>{}) == "");
    CHECK(encode_base64url(std::vector<uint8_t>{'f'}) == "Zg");
    CHECK(encode_base64url(std::vector<uint8_t>{'f','o'}) == "Zm8");
    CHECK(encode_base64url(std::vector<uint8_t>{'f','o','o'}) == "Zm9v");
    CHECK(encode_base64url(std::vector<uint8_t>{0xFB, 0xFF}) == "-_8");
}

TEST_CASE("Base64URL decode accepts what encode produced") {
    const std::vector<uint8_t> rec{0x01,0x00,0x0c,0x00,0x00,0x02,0x00,0x01,0xb0,0x55,0x15,0x00};
    const std::string text = encode_base64url(rec);
    CHECK(text == "AQAMAAACAAGwVRUA");

    std::vector<uint8_t> back;
    REQUIRE(decode_base64url(text, back) == ErrorCode::Ok);
    CHECK(back == rec);
}

TEST_CASE("Base64URL decode refuses padded input") {
    std::vector<uint8_t> out;
    CHECK(decode_base64url("Zm8=", out) == ErrorCode::InvalidEncoding);
    REQUIRE(decode_base64url("Zm8", out) == ErrorCode::Ok);
    CHECK(out == std::vector<uint8_t>{'f','o'});
}

TEST_CASE("Base64URL rejects characters outside the alphabet") {
    std::vector<uint8_t> out;
    CHECK(decode_base64url("Zm9v+", out) == ErrorCode::InvalidEncoding);
    CHECK(decode_base64url("Zm/v", out) == ErrorCode::InvalidEncoding);
    CHECK(decode_base64url("Zm 9v", out) == ErrorCode::InvalidEncoding);
    CHECK(decode_base64url("Zm9v.", out) == ErrorCode::InvalidEncoding);
    CHECK_FALSE(is_base64url("ab.c"));
    CHECK(is_base64url("AQAMAAACAAGwVRUA"));
}

TEST_CASE("Base64URL rejects an impossible length") {
    std::vector<uint8_t> out;
    CHECK(decode_base64url("Zm9vY", out) == ErrorCode::InvalidEncoding);
}

TEST_CASE("Base64URL decode into a bounded buffer reports overflow") {
    etl::vector<uint8_t, 2> small;
    CHECK(decode_base64url("Zm9v", small) == ErrorCode::MalformedBuffer);

    etl::vector<uint8_t, 4> fits;
    REQUIRE(decode_base64url("Zm9v", fits) == ErrorCode::Ok);
    CHECK(fits.size() == 3);
}
