/**
 * @file packet.hpp
 * @brief XTOC wrapper line: build, parse, ids and secure AAD.
 *
 * @details
 * ## Field Brief
 * The wrapper is the only thing an operator ever sees: one line of plain
 * ASCII that can be read aloud, typed into JS8Call, pasted into an email or
 * printed as a QR code. Every line is self-describing:
 *
 * ```
 *   Clear:  X1.<templateId>.C.<id>.<part>/<total>.<payload>
 *   Secure: X1.<templateId>.S.<id>.<part>/<total>.<kid>.<payload>
 *
 *   X1.1.C.7KQ2M9TA.1/1.AQAMAAACAAGwVRUA
 *   │  │ │ │        │   └ base64url record (or ciphertext in S mode)
 *   │  │ │ │        └──── part/total, 1-based
 *   │  │ │ └───────────── correlation id, no '.'
 *   │  │ └─────────────── C = clear, S = secure
 *   │  └───────────────── template id (1 = SITREP ...)
 *   └──────────────────── wrapper version
 * ```
 *
 * In S mode the key id sits after the part/total counter:
 *
 *   X1.<T>.S.<ID>.<P>/<N>.<KID>.<CIPHERTEXT>
 *
 * This is the token order existing XTOC encoders write and parsers read.
 *
 * ---
 *
 * @par Parse rules
 * - Leading/trailing whitespace is ignored; `raw` keeps the trimmed line.
 * - The version token must be `X1`. Any other `X<digits>` is reported as
 *   UnsupportedVersion; everything else that fails is MalformedWrapper.
 * - Template id, part and total are plain decimal digits with
 *   `part >= 1` and `total >= part`. The id and the kid are non-empty.
 * - The payload is everything after the last header token, dots included,
 *   and must not be empty. It is not decoded here.
 *
 * `parse_packet()` returns an empty optional for any failure so callers can
 * filter a pile of candidate lines cheaply. `parse_packet_status()` reports
 * why a line was rejected.
 */
#ifndef XTOC_PACKET_HPP
#define XTOC_PACKET_HPP

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <string>
#include <variant>
#include "errors.hpp"
#include "payload.hpp"

namespace xtoc {

static constexpr const char* WRAPPER_VERSION   = "X1";
static constexpr size_t      PACKET_ID_LEN     = 8;
static constexpr const char* PACKET_ID_ALPHABET = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

struct ClearMode {};

/// Payload is ciphertext; `kid` names the key in the external key store.
struct SecureMode {
  std::string kid;
};

using Mode = std::variant<ClearMode, SecureMode>;

struct FramedPacket {
  uint32_t    template_id{0};
  Mode        mode{ClearMode{}};
  std::string id;
  uint32_t    part{1};
  uint32_t    total{1};
  std::string payload;   ///< base64url text, never decoded by the framer
  std::string raw;       ///< trimmed wrapper line this packet came from / renders to

  bool is_secure() const { return std::holds_alternative<SecureMode>(mode); }

  /// Key id for Secure packets, empty string for Clear ones.
  const std::string& kid() const;

  char mode_char() const { return is_secure() ? 'S' : 'C'; }
};

/// Parse one line. Writes `out` only on success.
ErrorCode parse_packet_status(const std::string& line, FramedPacket& out);

/// Parse one line; empty on any grammar failure.
std::optional<FramedPacket> parse_packet(const std::string& line);

/// Render the wrapper line for `p` (ignores `p.raw`).
std::string build_packet(const FramedPacket& p);

/// Assemble a FramedPacket and fill its `raw` line.
FramedPacket make_frame(uint32_t template_id, const Mode& mode, const std::string& id,
                        uint32_t part, uint32_t total, const std::string& payload);

/// True if both frames belong to the same logical message
/// (version, template, mode, id, total and kid for Secure).
bool same_message(const FramedPacket& a, const FramedPacket& b);

/// Random correlation id from PACKET_ID_ALPHABET.
std::string generate_packet_id(size_t len = PACKET_ID_LEN);

/// Deterministic variant for tests and replay tools.
std::string generate_packet_id(size_t len, uint64_t seed);

/// Associated data bound into a Secure payload by the external cipher:
/// "X1|<templateId>|S|<id>|<part>|<total>|<kid>".
std::string make_secure_aad(uint32_t template_id, const std::string& id,
                            uint32_t part, uint32_t total, const std::string& kid);

/// Encode a typed payload and wrap it as a Clear 1/1 line.
ErrorCode make_clear_packet(const PacketPayload& payload, const std::string& id, std::string& out_line);

/// Wrap caller-supplied ciphertext (base64url) as a Secure 1/1 line.
ErrorCode make_secure_packet(uint32_t template_id, const std::string& id, const std::string& kid,
                             const std::string& ciphertext_b64, std::string& out_line);

} // namespace xtoc

#endif // XTOC_PACKET_HPP
