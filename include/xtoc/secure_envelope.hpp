/**
 * @file secure_envelope.hpp
 * @brief Layout of a Secure-mode payload, without the cryptography.
 *
 * A Secure wrapper carries `base64url(version || nonce || ciphertext+tag)`.
 * The cipher itself lives outside this library; what the protocol engine
 * owns is the framing around it, so a receiver can tell a truncated or
 * unknown envelope apart before handing bytes to the key store.
 *
 *   version 1: 24-byte nonce (XChaCha20-Poly1305)
 *   version 2: 12-byte nonce (ChaCha20-Poly1305, compact)
 *
 * Every envelope is at least 1 + 12 + 16 bytes; a version 1 envelope at
 * least 1 + 24 + 16.
 */
#ifndef XTOC_SECURE_ENVELOPE_HPP
#define XTOC_SECURE_ENVELOPE_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include "errors.hpp"

namespace xtoc {

static constexpr uint8_t SECURE_VERSION         = 1;
static constexpr uint8_t SECURE_VERSION_COMPACT = 2;
static constexpr size_t  SECURE_NONCE_LEN         = 24;
static constexpr size_t  SECURE_NONCE_LEN_COMPACT = 12;
static constexpr size_t  SECURE_TAG_LEN           = 16;

struct SecureEnvelope {
  uint8_t version{SECURE_VERSION_COMPACT};
  std::vector<uint8_t> nonce;
  std::vector<uint8_t> ciphertext;   ///< includes the authentication tag
};

/// Split decoded envelope bytes. MalformedBuffer if short,
/// UnsupportedVersion for an unknown version byte.
ErrorCode split_secure_envelope(const std::vector<uint8_t>& bytes, SecureEnvelope& out);

/// Decode base64url text then split.
ErrorCode split_secure_payload(const std::string& payload_b64, SecureEnvelope& out);

/// Inverse of split: version || nonce || ciphertext as base64url.
/// UnsupportedVersion for an unknown version, FieldOutOfRange if the nonce
/// length does not match it or the ciphertext is shorter than a tag.
ErrorCode join_secure_payload(const SecureEnvelope& env, std::string& out_b64);

} // namespace xtoc

#endif // XTOC_SECURE_ENVELOPE_HPP
