#include <doctest/doctest.h>
#include "xtoc/secure_envelope.hpp"
#include "xtoc/base64url.hpp"

#include <vector>

using namespace xtoc;

static std::vector<uint8_t> envelope_bytes(uint8_t version, size_t nonce, size_t body) {
    std::vector<uint8_t> b;
    b.push_back(version);
    for (size_t i = 0; i < nonce; ++i) b.push_back(static_cast<uint8_t>(0xA0 + i));
    for (size_t i = 0; i < body; ++i) b.push_back(static_cast<uint8_t>(i));
    return b;
}

TEST_CASE("Envelope v1 carries a 24-byte nonce") {
    SecureEnvelope env;
    REQUIRE(split_secure_envelope(envelope_bytes(1, 24, 20), env) == ErrorCode::Ok);
    CHECK(env.version == 1);
    CHECK(env.nonce.size() == 24);
    CHECK(env.nonce[0] == 0xA0);
    CHECK(env.ciphertext.size() == 20);
}

TEST_CASE("Envelope v2 carries a 12-byte nonce") {
    SecureEnvelope env;
    REQUIRE(split_secure_envelope(envelope_bytes(2, 12, 16), env) == ErrorCode::Ok);
    CHECK(env.nonce.size() == 12);
    CHECK(env.ciphertext.size() == 16);
}

TEST_CASE("Envelope refuses short input and unknown versions") {
    SecureEnvelope env;
    CHECK(split_secure_envelope(envelope_bytes(2, 12, 15), env) == ErrorCode::MalformedBuffer);
    CHECK(split_secure_envelope(envelope_bytes(1, 24, 3), env) == ErrorCode::MalformedBuffer);
    CHECK(split_secure_envelope(envelope_bytes(7, 24, 20), env) == ErrorCode::UnsupportedVersion);
}

TEST_CASE("Envelope joins back into the payload it came from") {
    const std::string b64 = encode_base64url(envelope_bytes(2, 12, 30));
    SecureEnvelope env;
    REQUIRE(split_secure_payload(b64, env) == ErrorCode::Ok);

    std::string again;
    REQUIRE(join_secure_payload(env, again) == ErrorCode::Ok);
    CHECK(again == b64);

    env.nonce.pop_back();
    CHECK(join_secure_payload(env, again) == ErrorCode::FieldOutOfRange);
    CHECK(split_secure_payload("not base64!", env) == ErrorCode::InvalidEncoding);
}
