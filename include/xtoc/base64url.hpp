/**
 * @file base64url.hpp
 * @brief Base64URL transcoder (RFC 4648 section 5, no padding).
 *
 * XTOC payloads travel as plain text over carriers that mangle anything
 * outside a conservative character set. Records are therefore rendered in
 * the URL-safe alphabet (`A-Z a-z 0-9 - _`) with the `=` padding removed.
 *
 * Decoding is strict: any character outside the alphabet (padding and
 * whitespace included) fails with ErrorCode::InvalidEncoding, as does a
 * text length that leaves a dangling 6-bit group (length % 4 == 1).
 * The decoded length is always exactly the original byte length.
 *
 * Pure functions. No state, no allocation beyond the returned string.
 */
#ifndef XTOC_BASE64URL_HPP
#define XTOC_BASE64URL_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include "etl/vector.h"
#include "errors.hpp"

namespace xtoc {

/// Encode `len` bytes to unpadded base64url text.
std::string encode_base64url(const uint8_t* data, size_t len);

inline std::string encode_base64url(const etl::ivector<uint8_t>& bytes) {
  return encode_base64url(bytes.data(), bytes.size());
}

inline std::string encode_base64url(const std::vector<uint8_t>& bytes) {
  return encode_base64url(bytes.data(), bytes.size());
}

/// Decode into a bounded ETL buffer. MalformedBuffer if it cannot hold the result.
ErrorCode decode_base64url(const std::string& text, etl::ivector<uint8_t>& out);

/// Decode into a heap buffer (envelopes, tools).
ErrorCode decode_base64url(const std::string& text, std::vector<uint8_t>& out);

/// True if every character belongs to the base64url alphabet.
bool is_base64url(const std::string& text);

} // namespace xtoc

#endif // XTOC_BASE64URL_HPP
