// -----------------------------------------------------------------------------
// packet.cpp - XTOC wrapper line framing
//
// Grammar, token order and failure rules:
//   see include/xtoc/packet.hpp
// -----------------------------------------------------------------------------
#include "xtoc/packet.hpp"

#include <chrono>
#include <random>
#include <utility>
#include <vector>

#include "xtoc/template_codec.hpp"
#include "xtoc/text.hpp"

namespace xtoc {

namespace {

const std::string kEmpty;

bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

// Plain decimal, no sign, must fit uint32.
bool parse_u32(const std::string& s, uint32_t& out) {
  if (!all_digits(s)) return false;
  uint64_t v = 0;
  for (char c : s) {
    v = v * 10 + static_cast<uint64_t>(c - '0');
    if (v > 0xFFFFFFFFull) return false;
  }
  out = static_cast<uint32_t>(v);
  return true;
}

std::vector<std::string> split_dots(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  for (;;) {
    const size_t dot = s.find('.', start);
    if (dot == std::string::npos) {
      out.push_back(s.substr(start));
      return out;
    }
    out.push_back(s.substr(start, dot - start));
    start = dot + 1;
  }
}

std::string join_from(const std::vector<std::string>& tokens, size_t first) {
  std::string out;
  for (size_t i = first; i < tokens.size(); ++i) {
    if (i > first) out += '.';
    out += tokens[i];
  }
  return out;
}

// "X<digits>" that is not "X1": a wrapper from a newer (or older) station.
bool looks_like_other_version(const std::string& tok) {
  return tok.size() >= 2 && tok[0] == 'X' && all_digits(tok.substr(1)) && tok != WRAPPER_VERSION;
}

// Simple LCG, same shape as the node tooling's callsign generator.
uint32_t lcg_next(uint64_t& state) {
  state = state * 6364136223846793005ull + 1;
  return static_cast<uint32_t>(state >> 33);
}

} // namespace

const std::string& FramedPacket::kid() const {
  if (const auto* s = std::get_if<SecureMode>(&mode)) return s->kid;
  return kEmpty;
}

ErrorCode parse_packet_status(const std::string& line, FramedPacket& out) {
  const std::string trimmed = trim_copy(line);
  const std::vector<std::string> tok = split_dots(trimmed);

  // PRE: version token decides which grammar applies at all
  if (tok[0] != WRAPPER_VERSION) {
    return looks_like_other_version(tok[0]) ? ErrorCode::UnsupportedVersion
                                            : ErrorCode::MalformedWrapper;
  }
  // X1.T.M.ID.P/N.PAYLOAD at minimum
  if (tok.size() < 6) return ErrorCode::MalformedWrapper;

  FramedPacket p;
  if (!parse_u32(tok[1], p.template_id)) return ErrorCode::MalformedWrapper;

  const std::string& mode = tok[2];
  if (mode != "C" && mode != "S") return ErrorCode::MalformedWrapper;

  p.id = tok[3];
  if (p.id.empty()) return ErrorCode::MalformedWrapper;

  // POLICY: exactly one '/', 1 <= part <= total
  const std::string& pn = tok[4];
  const size_t slash = pn.find('/');
  if (slash == std::string::npos) return ErrorCode::MalformedWrapper;
  if (!parse_u32(pn.substr(0, slash), p.part)) return ErrorCode::MalformedWrapper;
  if (!parse_u32(pn.substr(slash + 1), p.total)) return ErrorCode::MalformedWrapper;
  if (p.part < 1 || p.total < p.part) return ErrorCode::MalformedWrapper;

  size_t payload_at = 5;
  if (mode == "S") {
    if (tok.size() < 7 || tok[5].empty()) return ErrorCode::MalformedWrapper;
    p.mode = SecureMode{tok[5]};
    payload_at = 6;
  }

  p.payload = join_from(tok, payload_at);
  if (p.payload.empty()) return ErrorCode::MalformedWrapper;

  p.raw = trimmed;
  out = std::move(p);
  return ErrorCode::Ok;
}

std::optional<FramedPacket> parse_packet(const std::string& line) {
  FramedPacket p;
  if (parse_packet_status(line, p) != ErrorCode::Ok) return std::nullopt;
  return p;
}

std::string build_packet(const FramedPacket& p) {
  std::string out;
  out.reserve(24 + p.id.size() + p.kid().size() + p.payload.size());
  out += WRAPPER_VERSION;
  out += '.';
  out += std::to_string(p.template_id);
  out += '.';
  out += p.mode_char();
  out += '.';
  out += p.id;
  out += '.';
  out += std::to_string(p.part);
  out += '/';
  out += std::to_string(p.total);
  out += '.';
  if (p.is_secure()) {
    out += p.kid();
    out += '.';
  }
  out += p.payload;
  return out;
}

FramedPacket make_frame(uint32_t template_id, const Mode& mode, const std::string& id,
                        uint32_t part, uint32_t total, const std::string& payload) {
  FramedPacket p;
  p.template_id = template_id;
  p.mode = mode;
  p.id = id;
  p.part = part;
  p.total = total;
  p.payload = payload;
  p.raw = build_packet(p);
  return p;
}

bool same_message(const FramedPacket& a, const FramedPacket& b) {
  // version is implied: only X1 lines ever parse
  if (a.template_id != b.template_id) return false;
  if (a.is_secure() != b.is_secure()) return false;
  if (a.id != b.id) return false;
  if (a.total != b.total) return false;
  if (a.is_secure() && a.kid() != b.kid()) return false;
  return true;
}

std::string generate_packet_id(size_t len, uint64_t seed) {
  static const std::string alphabet = PACKET_ID_ALPHABET;
  uint64_t state = seed;
  std::string s;
  s.reserve(len);
  for (size_t i = 0; i < len; ++i) {
    s.push_back(alphabet[lcg_next(state) % alphabet.size()]);
  }
  return s;
}

std::string generate_packet_id(size_t len) {
  std::random_device rd;
  const uint64_t clock = static_cast<uint64_t>(
      std::chrono::high_resolution_clock::now().time_since_epoch().count());
  const uint64_t seed = clock ^ (static_cast<uint64_t>(rd()) << 32) ^ rd();
  return generate_packet_id(len, seed);
}

std::string make_secure_aad(uint32_t template_id, const std::string& id,
                            uint32_t part, uint32_t total, const std::string& kid) {
  return std::string(WRAPPER_VERSION) + "|" + std::to_string(template_id) + "|S|" + id + "|" +
         std::to_string(part) + "|" + std::to_string(total) + "|" + kid;
}

ErrorCode make_clear_packet(const PacketPayload& payload, const std::string& id, std::string& out_line) {
  if (id.empty() || id.find('.') != std::string::npos) return ErrorCode::MalformedWrapper;

  std::string b64;
  const ErrorCode rc = encode_payload_b64(payload, b64);
  if (rc != ErrorCode::Ok) return rc;

  out_line = make_frame(template_id_of(kind_of(payload)), ClearMode{}, id, 1, 1, b64).raw;
  return ErrorCode::Ok;
}

ErrorCode make_secure_packet(uint32_t template_id, const std::string& id, const std::string& kid,
                             const std::string& ciphertext_b64, std::string& out_line) {
  if (id.empty() || id.find('.') != std::string::npos) return ErrorCode::MalformedWrapper;
  if (kid.empty() || kid.find('.') != std::string::npos) return ErrorCode::MalformedWrapper;
  if (ciphertext_b64.empty()) return ErrorCode::MalformedWrapper;

  out_line = make_frame(template_id, SecureMode{kid}, id, 1, 1, ciphertext_b64).raw;
  return ErrorCode::Ok;
}

} // namespace xtoc
