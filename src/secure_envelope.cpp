// -----------------------------------------------------------------------------
// secure_envelope.cpp - version/nonce/ciphertext framing of S-mode payloads.
// -----------------------------------------------------------------------------
#include "xtoc/secure_envelope.hpp"

#include "xtoc/base64url.hpp"

namespace xtoc {

namespace {

size_t nonce_len_for(uint8_t version) {
  if (version == SECURE_VERSION) return SECURE_NONCE_LEN;
  if (version == SECURE_VERSION_COMPACT) return SECURE_NONCE_LEN_COMPACT;
  return 0;
}

} // namespace

ErrorCode split_secure_envelope(const std::vector<uint8_t>& bytes, SecureEnvelope& out) {
  if (bytes.size() < 1 + SECURE_NONCE_LEN_COMPACT + SECURE_TAG_LEN) return ErrorCode::MalformedBuffer;

  const uint8_t version = bytes[0];
  const size_t nonce_len = nonce_len_for(version);
  if (nonce_len == 0) return ErrorCode::UnsupportedVersion;
  if (bytes.size() < 1 + nonce_len + SECURE_TAG_LEN) return ErrorCode::MalformedBuffer;

  out.version = version;
  out.nonce.assign(bytes.begin() + 1, bytes.begin() + 1 + nonce_len);
  out.ciphertext.assign(bytes.begin() + 1 + nonce_len, bytes.end());
  return ErrorCode::Ok;
}

ErrorCode split_secure_payload(const std::string& payload_b64, SecureEnvelope& out) {
  std::vector<uint8_t> bytes;
  const ErrorCode rc = decode_base64url(payload_b64, bytes);
  if (rc != ErrorCode::Ok) return rc;
  return split_secure_envelope(bytes, out);
}

ErrorCode join_secure_payload(const SecureEnvelope& env, std::string& out_b64) {
  const size_t nonce_len = nonce_len_for(env.version);
  if (nonce_len == 0) return ErrorCode::UnsupportedVersion;
  if (env.nonce.size() != nonce_len) return ErrorCode::FieldOutOfRange;
  if (env.ciphertext.size() < SECURE_TAG_LEN) return ErrorCode::FieldOutOfRange;

  std::vector<uint8_t> bytes;
  bytes.reserve(1 + env.nonce.size() + env.ciphertext.size());
  bytes.push_back(env.version);
  bytes.insert(bytes.end(), env.nonce.begin(), env.nonce.end());
  bytes.insert(bytes.end(), env.ciphertext.begin(), env.ciphertext.end());
  out_b64 = encode_base64url(bytes);
  return ErrorCode::Ok;
}

} // namespace xtoc
