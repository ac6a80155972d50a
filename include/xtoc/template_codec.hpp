/**
 * @file template_codec.hpp
 * @brief Binary record codec for every XTOC template.
 *
 * @details
 * ## Field Brief
 * A report has to survive a 50-character JS8Call frame, so each template is
 * packed into the smallest byte record that still carries its meaning:
 * big-endian integers, coordinates as `round(deg * 1e5)` in int32, time as
 * whole minutes in uint32, and optional sections gated by a flags byte.
 *
 * ---
 *
 * @par Record shapes (offsets in bytes)
 * ```
 *  SITREP   (12) ver src:2 dst:2 pri status min:4 flags      ext bit 0x04
 *  CONTACT  (13) ver src:2 pri min:4 type count:2 dir flags  ext bit 0x04
 *  TASK     (14) ver src:2 dst:2 pri min:4 action due:2 flags ext bit 0x04
 *  RESOURCE (12) ver src:2 pri min:4 item qty:2 flags        ext bit 0x04
 *  ASSET    (10) ver src:2 cond min:4 type flags             ext bit 0x08
 *  ZONE     (10) ver src:2 threat meaning min:4 flags        ext bit 0x08
 *  CHECKIN  v1 (16) ver=1 unit:2 lat:4 lon:4 min:4 status
 *  CHECKIN  v2      ver=2 n ids:2*n lat:4 lon:4 min:4 status
 * ```
 * Optional sections follow the base record:
 *   - SITREP/CONTACT/TASK/RESOURCE: loc (0x01), note (0x02), ext (0x04)
 *   - ASSET: loc (0x01), label (0x02), note (0x04), ext (0x08)
 *   - ZONE: label (0x01), note (0x02), shape, ext (0x08). Shape is a circle
 *     (0x04: lat:4 lon:4 radius:2) or a polygon (n, then n * lat:4 lon:4).
 *
 * The multi-source extension is always last: one byte holding the number
 * of ADDITIONAL ids, then that many u16 ids. It is written only when the
 * normalized id list holds more than the primary id.
 *
 * ---
 *
 * @par Failure Model
 * - Encode: FieldOutOfRange for a missing primary id or an unusable zone
 *   shape. Everything else is normalized through field_policy.hpp.
 * - Decode: MalformedBuffer when the record is short, a flagged section is
 *   truncated, or the extension count disagrees with the bytes left;
 *   UnsupportedVersion for an unknown record version byte.
 * - MISSION (and unknown template ids) report UnsupportedTemplate.
 *
 * @par Minimal Usage Example
 * @code
 * xtoc::SitrepPayload s;
 * s.src = 12; s.pri = 2; s.t_ms = 1700000000123;
 * xtoc::RecordBuffer rec;
 * if (xtoc::encode_sitrep(s, rec) == xtoc::ErrorCode::Ok) {
 *   // rec.size() == 12
 * }
 * @endcode
 */
#ifndef XTOC_TEMPLATE_CODEC_HPP
#define XTOC_TEMPLATE_CODEC_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include "etl/vector.h"
#include "errors.hpp"
#include "payload.hpp"
#include "record_buffer.hpp"
#include "template_kind.hpp"

namespace xtoc {

// -------- per-template codecs --------

ErrorCode encode_checkin_loc(const CheckinLocPayload& in, etl::ivector<uint8_t>& out);
ErrorCode decode_checkin_loc(const uint8_t* data, size_t len, CheckinLocPayload& out);

ErrorCode encode_sitrep(const SitrepPayload& in, etl::ivector<uint8_t>& out);
ErrorCode decode_sitrep(const uint8_t* data, size_t len, SitrepPayload& out);

ErrorCode encode_contact(const ContactPayload& in, etl::ivector<uint8_t>& out);
ErrorCode decode_contact(const uint8_t* data, size_t len, ContactPayload& out);

ErrorCode encode_task(const TaskPayload& in, etl::ivector<uint8_t>& out);
ErrorCode decode_task(const uint8_t* data, size_t len, TaskPayload& out);

ErrorCode encode_resource(const ResourcePayload& in, etl::ivector<uint8_t>& out);
ErrorCode decode_resource(const uint8_t* data, size_t len, ResourcePayload& out);

ErrorCode encode_asset(const AssetPayload& in, etl::ivector<uint8_t>& out);
ErrorCode decode_asset(const uint8_t* data, size_t len, AssetPayload& out);

ErrorCode encode_zone(const ZonePayload& in, etl::ivector<uint8_t>& out);
ErrorCode decode_zone(const uint8_t* data, size_t len, ZonePayload& out);

// -------- table dispatch over PacketPayload --------

/// Encode whichever template `in` holds.
ErrorCode encode_payload(const PacketPayload& in, etl::ivector<uint8_t>& out);

/// Decode a record known to belong to `kind`.
ErrorCode decode_payload(TemplateKind kind, const uint8_t* data, size_t len, PacketPayload& out);

/// Decode by wire template id; UnsupportedTemplate for unknown ids.
ErrorCode decode_payload(uint32_t template_id, const uint8_t* data, size_t len, PacketPayload& out);

/// True if `kind` has a binary codec (everything but MISSION today).
bool has_codec(TemplateKind kind);

// -------- base64url conveniences (the form carried in a wrapper) --------

ErrorCode encode_payload_b64(const PacketPayload& in, std::string& out_b64);
ErrorCode decode_payload_b64(uint32_t template_id, const std::string& b64, PacketPayload& out);

} // namespace xtoc

#endif // XTOC_TEMPLATE_CODEC_HPP
