// -----------------------------------------------------------------------------
// base64url.cpp - RFC 4648 §5 transcoder used for every XTOC payload.
//
// Bit-accumulator implementation: bytes are shifted into an integer 8 bits
// at a time and drained 6 bits at a time (and the reverse on decode).
// No padding is emitted and none is accepted.
// -----------------------------------------------------------------------------
#include "xtoc/base64url.hpp"

namespace xtoc {

namespace {

const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int char_value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '-') return 62;
  if (c == '_') return 63;
  return -1;
}

// Shared decode loop; Sink is called once per output byte and returns
// false when the destination is full.
template <typename Sink>
ErrorCode decode_into(const std::string& text, Sink&& sink) {
  // A single leftover character carries only 6 bits: never a whole byte.
  if (text.size() % 4 == 1) return ErrorCode::InvalidEncoding;

  uint32_t value = 0;
  int bits = 0;
  for (char c : text) {
    const int v = char_value(c);
    if (v < 0) return ErrorCode::InvalidEncoding;

    value = ((value << 6) | static_cast<uint32_t>(v)) & 0xFFFFFFu;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      if (!sink(static_cast<uint8_t>((value >> bits) & 0xFF))) {
        return ErrorCode::MalformedBuffer;
      }
    }
  }
  return ErrorCode::Ok;
}

} // namespace

std::string encode_base64url(const uint8_t* data, size_t len) {
  std::string out;
  out.reserve((len * 4 + 2) / 3);

  uint32_t value = 0;
  int bits = 0;
  for (size_t i = 0; i < len; ++i) {
    value = ((value << 8) | data[i]) & 0xFFFFFFu;
    bits += 8;
    while (bits >= 6) {
      bits -= 6;
      out.push_back(kAlphabet[(value >> bits) & 0x3F]);
    }
  }

  // flush the remaining 2 or 4 bits, zero-filled on the right
  if (bits > 0) {
    value <<= (6 - bits);
    out.push_back(kAlphabet[value & 0x3F]);
  }
  return out;
}

ErrorCode decode_base64url(const std::string& text, etl::ivector<uint8_t>& out) {
  out.clear();
  return decode_into(text, [&out](uint8_t b) {
    if (out.full()) return false;
    out.push_back(b);
    return true;
  });
}

ErrorCode decode_base64url(const std::string& text, std::vector<uint8_t>& out) {
  out.clear();
  out.reserve(text.size() * 3 / 4);
  return decode_into(text, [&out](uint8_t b) {
    out.push_back(b);
    return true;
  });
}

bool is_base64url(const std::string& text) {
  for (char c : text) {
    if (char_value(c) < 0) return false;
  }
  return true;
}

} // namespace xtoc
