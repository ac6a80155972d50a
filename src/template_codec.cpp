// -----------------------------------------------------------------------------
// template_codec.cpp - Implementation of the XTOC record codec
//
// API & record layouts:
//   see include/xtoc/template_codec.hpp
//
// Normalization rules (clamp / truncate / drop / reject):
//   see include/xtoc/field_policy.hpp
//
// NOTE: encoders compute the flags byte up front from the sections that
// will follow, then write the record strictly front to back.
// -----------------------------------------------------------------------------
#include "xtoc/template_codec.hpp"

#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "xtoc/base64url.hpp"
#include "xtoc/field_policy.hpp"

namespace xtoc {

namespace {

// Section flags shared by SITREP / CONTACT / TASK / RESOURCE.
constexpr uint8_t kFlagLoc  = 0x01;
constexpr uint8_t kFlagNote = 0x02;

// ASSET
constexpr uint8_t kAssetFlagLoc   = 0x01;
constexpr uint8_t kAssetFlagLabel = 0x02;
constexpr uint8_t kAssetFlagNote  = 0x04;

// ZONE
constexpr uint8_t kZoneFlagLabel  = 0x01;
constexpr uint8_t kZoneFlagNote   = 0x02;
constexpr uint8_t kZoneFlagCircle = 0x04;

constexpr uint8_t kCheckinSingle = 1;
constexpr uint8_t kCheckinMulti  = 2;
constexpr size_t  kCheckinTail   = 4 + 4 + 4 + 1;   // lat lon minutes status

uint8_t code_u8(int64_t v) {
  return static_cast<uint8_t>(clamp_field(FieldClass::Code, v));
}

uint16_t quantity_u16(int64_t v) {
  return static_cast<uint16_t>(clamp_field(FieldClass::Quantity, v));
}

uint16_t secondary_u16(int64_t v) {
  return static_cast<uint16_t>(clamp_field(FieldClass::SecondaryId, v));
}

ErrorCode finish(const RecordWriter& w) {
  return w.overflow() ? ErrorCode::MalformedBuffer : ErrorCode::Ok;
}

// ---------- shared sections ----------

bool has_location(const std::optional<GeoPoint>& loc) {
  return loc.has_value() && usable_point(*loc);
}

void write_point(RecordWriter& w, const GeoPoint& p) {
  w.i32(quantize_coord(p.lat));
  w.i32(quantize_coord(p.lon));
}

bool read_point(RecordReader& r, GeoPoint& p) {
  int32_t lat = 0;
  int32_t lon = 0;
  if (!(r.i32(lat) && r.i32(lon))) return false;
  p.lat = dequantize_coord(lat);
  p.lon = dequantize_coord(lon);
  return true;
}

void write_extension(RecordWriter& w, const IdList& ids) {
  w.u8(static_cast<uint8_t>(ids.size() - 1));
  for (size_t i = 1; i < ids.size(); ++i) w.u16(ids[i]);
}

// Extension must consume the rest of the record exactly.
ErrorCode read_extension(RecordReader& r, uint16_t primary, std::vector<int64_t>& out) {
  uint8_t extra = 0;
  if (!r.u8(extra)) return ErrorCode::MalformedBuffer;
  if (r.remaining() != static_cast<size_t>(extra) * 2) return ErrorCode::MalformedBuffer;

  std::vector<int64_t> wire;
  wire.reserve(extra);
  for (uint8_t i = 0; i < extra; ++i) {
    uint16_t id = 0;
    if (!r.u16(id)) return ErrorCode::MalformedBuffer;
    wire.push_back(id);
  }

  const IdList ids = normalize_ids(primary, wire);
  out.clear();
  if (ids.size() > 1) out.assign(ids.begin(), ids.end());
  return ErrorCode::Ok;
}

// Checks the minimum length and version byte; leaves the reader past byte 0.
ErrorCode read_version(RecordReader& r, size_t len, TemplateKind kind) {
  const TemplateLayout& layout = layout_of(kind);
  if (len < layout.base_length) return ErrorCode::MalformedBuffer;
  uint8_t ver = 0;
  if (!r.u8(ver)) return ErrorCode::MalformedBuffer;
  if (ver != layout.record_version) return ErrorCode::UnsupportedVersion;
  return ErrorCode::Ok;
}

// Trailing sections of SITREP / CONTACT / TASK / RESOURCE: loc, note, ext.
struct Tail {
  bool has_loc{false};
  std::string note;
  IdList ids;
};

Tail make_tail(int64_t primary, const std::vector<int64_t>& src_ids,
               const std::optional<GeoPoint>& loc, const std::string& note) {
  Tail t;
  t.has_loc = has_location(loc);
  t.note = clip_text(FieldClass::Note, note);
  t.ids = normalize_ids(primary, src_ids);
  return t;
}

uint8_t tail_flags(const Tail& t, const TemplateLayout& layout) {
  uint8_t flags = 0;
  if (t.has_loc) flags |= kFlagLoc;
  if (!t.note.empty()) flags |= kFlagNote;
  if (t.ids.size() > 1) flags |= layout.ext_flag_mask;
  return flags;
}

void write_tail(RecordWriter& w, const Tail& t, const std::optional<GeoPoint>& loc) {
  if (t.has_loc) write_point(w, *loc);
  if (!t.note.empty()) w.text(t.note);
  if (t.ids.size() > 1) write_extension(w, t.ids);
}

ErrorCode read_tail(RecordReader& r, uint8_t flags, const TemplateLayout& layout,
                    uint16_t primary, std::optional<GeoPoint>& loc,
                    std::string& note, std::vector<int64_t>& src_ids) {
  loc.reset();
  note.clear();
  src_ids.clear();

  if (flags & kFlagLoc) {
    GeoPoint p;
    if (!read_point(r, p)) return ErrorCode::MalformedBuffer;
    loc = p;
  }
  if (flags & kFlagNote) {
    if (!r.text(note)) return ErrorCode::MalformedBuffer;
  }
  if (flags & layout.ext_flag_mask) {
    return read_extension(r, primary, src_ids);
  }
  return ErrorCode::Ok;
}

// ---------- dispatch adapters ----------

template <typename P, ErrorCode (*Encode)(const P&, etl::ivector<uint8_t>&)>
ErrorCode encode_as(const PacketPayload& in, etl::ivector<uint8_t>& out) {
  return Encode(std::get<P>(in), out);
}

template <typename P, ErrorCode (*Decode)(const uint8_t*, size_t, P&)>
ErrorCode decode_as(const uint8_t* data, size_t len, PacketPayload& out) {
  P p;
  const ErrorCode rc = Decode(data, len, p);
  if (rc == ErrorCode::Ok) out = std::move(p);
  return rc;
}

struct CodecEntry {
  TemplateKind kind;
  ErrorCode (*encode)(const PacketPayload&, etl::ivector<uint8_t>&);
  ErrorCode (*decode)(const uint8_t*, size_t, PacketPayload&);
};

const CodecEntry kCodecs[] = {
  { TemplateKind::Sitrep,
    encode_as<SitrepPayload, encode_sitrep>,
    decode_as<SitrepPayload, decode_sitrep> },
  { TemplateKind::Contact,
    encode_as<ContactPayload, encode_contact>,
    decode_as<ContactPayload, decode_contact> },
  { TemplateKind::Task,
    encode_as<TaskPayload, encode_task>,
    decode_as<TaskPayload, decode_task> },
  { TemplateKind::CheckinLoc,
    encode_as<CheckinLocPayload, encode_checkin_loc>,
    decode_as<CheckinLocPayload, decode_checkin_loc> },
  { TemplateKind::Resource,
    encode_as<ResourcePayload, encode_resource>,
    decode_as<ResourcePayload, decode_resource> },
  { TemplateKind::Asset,
    encode_as<AssetPayload, encode_asset>,
    decode_as<AssetPayload, decode_asset> },
  { TemplateKind::Zone,
    encode_as<ZonePayload, encode_zone>,
    decode_as<ZonePayload, decode_zone> },
};

const CodecEntry* find_codec(TemplateKind kind) {
  for (const auto& c : kCodecs) {
    if (c.kind == kind) return &c;
  }
  return nullptr;
}

} // namespace

// =============================================================================
// CHECKIN / LOC (template 4)
// =============================================================================

ErrorCode encode_checkin_loc(const CheckinLocPayload& in, etl::ivector<uint8_t>& out) {
  if (!field_accepts(FieldClass::PrimaryId, in.unit_id)) return ErrorCode::FieldOutOfRange;

  const IdList ids = normalize_ids(in.unit_id, in.unit_ids);
  RecordWriter w(out);

  // POLICY: v1 when only the primary unit survives normalization
  if (ids.size() == 1) {
    w.u8(kCheckinSingle);
    w.u16(ids[0]);
  } else {
    // v2 lists every unit, primary first, ahead of the shared position
    w.u8(kCheckinMulti);
    w.u8(static_cast<uint8_t>(ids.size()));
    for (uint16_t id : ids) w.u16(id);
  }

  w.i32(quantize_coord(in.lat));
  w.i32(quantize_coord(in.lon));
  w.u32(quantize_minutes(in.t_ms));
  w.u8(code_u8(in.status));
  return finish(w);
}

ErrorCode decode_checkin_loc(const uint8_t* data, size_t len, CheckinLocPayload& out) {
  if (len < layout_of(TemplateKind::CheckinLoc).base_length) return ErrorCode::MalformedBuffer;

  RecordReader r(data, len);
  uint8_t ver = 0;
  if (!r.u8(ver)) return ErrorCode::MalformedBuffer;

  out.unit_ids.clear();
  if (ver == kCheckinSingle) {
    uint16_t unit = 0;
    if (!r.u16(unit)) return ErrorCode::MalformedBuffer;
    out.unit_id = unit;
  } else if (ver == kCheckinMulti) {
    uint8_t n = 0;
    if (!r.u8(n) || n == 0) return ErrorCode::MalformedBuffer;
    if (r.remaining() < static_cast<size_t>(n) * 2 + kCheckinTail) return ErrorCode::MalformedBuffer;

    std::vector<int64_t> wire;
    wire.reserve(n);
    for (uint8_t i = 0; i < n; ++i) {
      uint16_t id = 0;
      if (!r.u16(id)) return ErrorCode::MalformedBuffer;
      wire.push_back(id);
    }
    out.unit_id = wire.front();
    const IdList ids = normalize_ids(out.unit_id, wire);
    if (ids.size() > 1) out.unit_ids.assign(ids.begin(), ids.end());
  } else {
    return ErrorCode::UnsupportedVersion;
  }

  int32_t lat = 0;
  int32_t lon = 0;
  uint32_t minutes = 0;
  uint8_t status = 0;
  if (!(r.i32(lat) && r.i32(lon) && r.u32(minutes) && r.u8(status))) {
    return ErrorCode::MalformedBuffer;
  }
  out.lat = dequantize_coord(lat);
  out.lon = dequantize_coord(lon);
  out.t_ms = minutes_to_ms(minutes);
  out.status = status;
  return ErrorCode::Ok;
}

// =============================================================================
// SITREP (template 1)
// =============================================================================

ErrorCode encode_sitrep(const SitrepPayload& in, etl::ivector<uint8_t>& out) {
  if (!field_accepts(FieldClass::PrimaryId, in.src)) return ErrorCode::FieldOutOfRange;

  const TemplateLayout& layout = layout_of(TemplateKind::Sitrep);
  // Normalize optional sections first; the flags byte depends on them.
  const Tail tail = make_tail(in.src, in.src_ids, in.loc, in.note);

  RecordWriter w(out);
  w.u8(layout.record_version);            // [0]     record version
  w.u16(static_cast<uint16_t>(in.src));   // [1..2]  primary id (range checked above)
  w.u16(secondary_u16(in.dst));           // [3..4]  destination, 0 = all
  w.u8(code_u8(in.pri));                  // [5]     priority
  w.u8(code_u8(in.status));               // [6]     status code
  w.u32(quantize_minutes(in.t_ms));       // [7..10] whole minutes since epoch
  w.u8(tail_flags(tail, layout));         // [11]    loc | note | ext(0x04)
  write_tail(w, tail, in.loc);            // loc, note, then the extension last
  return finish(w);
}

ErrorCode decode_sitrep(const uint8_t* data, size_t len, SitrepPayload& out) {
  RecordReader r(data, len);
  const ErrorCode rc = read_version(r, len, TemplateKind::Sitrep);
  if (rc != ErrorCode::Ok) return rc;

  uint16_t src = 0, dst = 0;
  uint8_t pri = 0, status = 0, flags = 0;
  uint32_t minutes = 0;
  if (!(r.u16(src) && r.u16(dst) && r.u8(pri) && r.u8(status) && r.u32(minutes) && r.u8(flags))) {
    return ErrorCode::MalformedBuffer;
  }

  out.src = src;
  out.dst = dst;
  out.pri = pri;
  out.status = status;
  out.t_ms = minutes_to_ms(minutes);
  return read_tail(r, flags, layout_of(TemplateKind::Sitrep), src, out.loc, out.note, out.src_ids);
}

// =============================================================================
// CONTACT (template 2)
// =============================================================================

ErrorCode encode_contact(const ContactPayload& in, etl::ivector<uint8_t>& out) {
  if (!field_accepts(FieldClass::PrimaryId, in.src)) return ErrorCode::FieldOutOfRange;

  const TemplateLayout& layout = layout_of(TemplateKind::Contact);
  const Tail tail = make_tail(in.src, in.src_ids, in.loc, in.note);

  RecordWriter w(out);
  w.u8(layout.record_version);
  w.u16(static_cast<uint16_t>(in.src));
  w.u8(code_u8(in.pri));                  // [3]
  w.u32(quantize_minutes(in.t_ms));       // [4..7]
  w.u8(code_u8(in.type_code));            // [8]     what was seen
  w.u16(quantity_u16(in.count));          // [9..10] how many, clamped to 65535
  w.u8(code_u8(in.dir));                  // [11]    heading code
  w.u8(tail_flags(tail, layout));         // [12]    ext bit 0x04
  write_tail(w, tail, in.loc);
  return finish(w);
}

ErrorCode decode_contact(const uint8_t* data, size_t len, ContactPayload& out) {
  RecordReader r(data, len);
  const ErrorCode rc = read_version(r, len, TemplateKind::Contact);
  if (rc != ErrorCode::Ok) return rc;

  uint16_t src = 0, count = 0;
  uint8_t pri = 0, type_code = 0, dir = 0, flags = 0;
  uint32_t minutes = 0;
  if (!(r.u16(src) && r.u8(pri) && r.u32(minutes) && r.u8(type_code) &&
        r.u16(count) && r.u8(dir) && r.u8(flags))) {
    return ErrorCode::MalformedBuffer;
  }

  out.src = src;
  out.pri = pri;
  out.t_ms = minutes_to_ms(minutes);
  out.type_code = type_code;
  out.count = count;
  out.dir = dir;
  return read_tail(r, flags, layout_of(TemplateKind::Contact), src, out.loc, out.note, out.src_ids);
}

// =============================================================================
// TASK (template 3)
// =============================================================================

ErrorCode encode_task(const TaskPayload& in, etl::ivector<uint8_t>& out) {
  if (!field_accepts(FieldClass::PrimaryId, in.src)) return ErrorCode::FieldOutOfRange;

  const TemplateLayout& layout = layout_of(TemplateKind::Task);
  const Tail tail = make_tail(in.src, in.src_ids, in.loc, in.note);

  RecordWriter w(out);
  w.u8(layout.record_version);
  w.u16(static_cast<uint16_t>(in.src));
  w.u16(secondary_u16(in.dst));
  w.u8(code_u8(in.pri));
  w.u32(quantize_minutes(in.t_ms));       // [6..9]
  w.u8(code_u8(in.action_code));          // [10]
  w.u16(quantity_u16(in.due_mins));       // [11..12] minutes from now
  w.u8(tail_flags(tail, layout));         // [13]    ext bit 0x04
  write_tail(w, tail, in.loc);
  return finish(w);
}

ErrorCode decode_task(const uint8_t* data, size_t len, TaskPayload& out) {
  RecordReader r(data, len);
  const ErrorCode rc = read_version(r, len, TemplateKind::Task);
  if (rc != ErrorCode::Ok) return rc;

  uint16_t src = 0, dst = 0, due = 0;
  uint8_t pri = 0, action = 0, flags = 0;
  uint32_t minutes = 0;
  if (!(r.u16(src) && r.u16(dst) && r.u8(pri) && r.u32(minutes) &&
        r.u8(action) && r.u16(due) && r.u8(flags))) {
    return ErrorCode::MalformedBuffer;
  }

  out.src = src;
  out.dst = dst;
  out.pri = pri;
  out.t_ms = minutes_to_ms(minutes);
  out.action_code = action;
  out.due_mins = due;
  return read_tail(r, flags, layout_of(TemplateKind::Task), src, out.loc, out.note, out.src_ids);
}

// =============================================================================
// RESOURCE (template 5)
// =============================================================================

ErrorCode encode_resource(const ResourcePayload& in, etl::ivector<uint8_t>& out) {
  if (!field_accepts(FieldClass::PrimaryId, in.src)) return ErrorCode::FieldOutOfRange;

  const TemplateLayout& layout = layout_of(TemplateKind::Resource);
  const Tail tail = make_tail(in.src, in.src_ids, in.loc, in.note);

  RecordWriter w(out);
  w.u8(layout.record_version);
  w.u16(static_cast<uint16_t>(in.src));
  w.u8(code_u8(in.pri));
  w.u32(quantize_minutes(in.t_ms));
  w.u8(code_u8(in.item_code));            // [8]
  w.u16(quantity_u16(in.qty));            // [9..10]
  w.u8(tail_flags(tail, layout));         // [11]    ext bit 0x04
  write_tail(w, tail, in.loc);
  return finish(w);
}

ErrorCode decode_resource(const uint8_t* data, size_t len, ResourcePayload& out) {
  RecordReader r(data, len);
  const ErrorCode rc = read_version(r, len, TemplateKind::Resource);
  if (rc != ErrorCode::Ok) return rc;

  uint16_t src = 0, qty = 0;
  uint8_t pri = 0, item = 0, flags = 0;
  uint32_t minutes = 0;
  if (!(r.u16(src) && r.u8(pri) && r.u32(minutes) && r.u8(item) && r.u16(qty) && r.u8(flags))) {
    return ErrorCode::MalformedBuffer;
  }

  out.src = src;
  out.pri = pri;
  out.t_ms = minutes_to_ms(minutes);
  out.item_code = item;
  out.qty = qty;
  return read_tail(r, flags, layout_of(TemplateKind::Resource), src, out.loc, out.note, out.src_ids);
}

// =============================================================================
// ASSET (template 6)
// =============================================================================

ErrorCode encode_asset(const AssetPayload& in, etl::ivector<uint8_t>& out) {
  if (!field_accepts(FieldClass::PrimaryId, in.src)) return ErrorCode::FieldOutOfRange;

  const TemplateLayout& layout = layout_of(TemplateKind::Asset);
  const bool has_loc = has_location(in.loc);
  const std::string label = clip_text(FieldClass::Label, in.label);
  const std::string note = clip_text(FieldClass::Note, in.note);
  const IdList ids = normalize_ids(in.src, in.src_ids);

  uint8_t flags = 0;
  if (has_loc) flags |= kAssetFlagLoc;
  if (!label.empty()) flags |= kAssetFlagLabel;
  if (!note.empty()) flags |= kAssetFlagNote;
  if (ids.size() > 1) flags |= layout.ext_flag_mask;

  RecordWriter w(out);
  w.u8(layout.record_version);
  w.u16(static_cast<uint16_t>(in.src));
  w.u8(code_u8(in.condition));
  w.u32(quantize_minutes(in.t_ms));
  w.u8(code_u8(in.type_code));
  w.u8(flags);

  // Section order follows the flag bits: loc, label, note, ext.
  if (has_loc) write_point(w, *in.loc);
  if (!label.empty()) w.text(label);
  if (!note.empty()) w.text(note);
  if (ids.size() > 1) write_extension(w, ids);
  return finish(w);
}

ErrorCode decode_asset(const uint8_t* data, size_t len, AssetPayload& out) {
  RecordReader r(data, len);
  const ErrorCode rc = read_version(r, len, TemplateKind::Asset);
  if (rc != ErrorCode::Ok) return rc;

  uint16_t src = 0;
  uint8_t condition = 0, type_code = 0, flags = 0;
  uint32_t minutes = 0;
  if (!(r.u16(src) && r.u8(condition) && r.u32(minutes) && r.u8(type_code) && r.u8(flags))) {
    return ErrorCode::MalformedBuffer;
  }

  out.src = src;
  out.condition = condition;
  out.t_ms = minutes_to_ms(minutes);
  out.type_code = type_code;
  out.loc.reset();
  out.label.clear();
  out.note.clear();
  out.src_ids.clear();

  if (flags & kAssetFlagLoc) {
    GeoPoint p;
    if (!read_point(r, p)) return ErrorCode::MalformedBuffer;
    out.loc = p;
  }
  if ((flags & kAssetFlagLabel) && !r.text(out.label)) return ErrorCode::MalformedBuffer;
  if ((flags & kAssetFlagNote) && !r.text(out.note)) return ErrorCode::MalformedBuffer;
  if (flags & layout_of(TemplateKind::Asset).ext_flag_mask) {
    return read_extension(r, src, out.src_ids);
  }
  return ErrorCode::Ok;
}

// =============================================================================
// ZONE (template 7)
// =============================================================================

ErrorCode encode_zone(const ZonePayload& in, etl::ivector<uint8_t>& out) {
  if (!field_accepts(FieldClass::PrimaryId, in.src)) return ErrorCode::FieldOutOfRange;

  const bool is_circle = in.circle.has_value();
  const size_t points = in.polygon.size() > ZONE_MAX_POINTS ? ZONE_MAX_POINTS : in.polygon.size();
  if (!is_circle && !field_accepts(FieldClass::PolygonPoints, static_cast<int64_t>(points))) {
    return ErrorCode::FieldOutOfRange;
  }

  const TemplateLayout& layout = layout_of(TemplateKind::Zone);
  const std::string label = clip_text(FieldClass::Label, in.label);
  const std::string note = clip_text(FieldClass::Note, in.note);
  const IdList ids = normalize_ids(in.src, in.src_ids);

  uint8_t flags = 0;
  if (!label.empty()) flags |= kZoneFlagLabel;
  if (!note.empty()) flags |= kZoneFlagNote;
  if (is_circle) flags |= kZoneFlagCircle;
  if (ids.size() > 1) flags |= layout.ext_flag_mask;

  RecordWriter w(out);
  w.u8(layout.record_version);            // [0]     record version
  w.u16(static_cast<uint16_t>(in.src));   // [1..2]  primary id
  w.u8(code_u8(in.threat));               // [3]     threat level
  w.u8(code_u8(in.meaning_code));         // [4]     meaning code
  w.u32(quantize_minutes(in.t_ms));       // [5..8]  whole minutes
  w.u8(flags);                            // [9]     label | note | circle | ext(0x08)

  // Text sections come before the shape.
  if (!label.empty()) w.text(label);
  if (!note.empty()) w.text(note);

  // Shape: circle = center + radius, otherwise a counted polygon.
  if (is_circle) {
    write_point(w, in.circle->center);
    w.u16(quantize_radius(in.circle->radius_m));
  } else {
    w.u8(static_cast<uint8_t>(points));
    for (size_t i = 0; i < points; ++i) write_point(w, in.polygon[i]);
  }

  if (ids.size() > 1) write_extension(w, ids);
  return finish(w);
}

ErrorCode decode_zone(const uint8_t* data, size_t len, ZonePayload& out) {
  RecordReader r(data, len);
  const ErrorCode rc = read_version(r, len, TemplateKind::Zone);
  if (rc != ErrorCode::Ok) return rc;

  uint16_t src = 0;
  uint8_t threat = 0, meaning = 0, flags = 0;
  uint32_t minutes = 0;
  if (!(r.u16(src) && r.u8(threat) && r.u8(meaning) && r.u32(minutes) && r.u8(flags))) {
    return ErrorCode::MalformedBuffer;
  }

  out.src = src;
  out.threat = threat;
  out.meaning_code = meaning;
  out.t_ms = minutes_to_ms(minutes);
  out.label.clear();
  out.note.clear();
  out.circle.reset();
  out.polygon.clear();
  out.src_ids.clear();

  if ((flags & kZoneFlagLabel) && !r.text(out.label)) return ErrorCode::MalformedBuffer;
  if ((flags & kZoneFlagNote) && !r.text(out.note)) return ErrorCode::MalformedBuffer;

  if (flags & kZoneFlagCircle) {
    ZoneCircle c;
    uint16_t radius = 0;
    if (!(read_point(r, c.center) && r.u16(radius))) return ErrorCode::MalformedBuffer;
    c.radius_m = radius;
    out.circle = c;
  } else {
    uint8_t n = 0;
    if (!r.u8(n)) return ErrorCode::MalformedBuffer;
    if (!field_accepts(FieldClass::PolygonPoints, n)) return ErrorCode::MalformedBuffer;
    out.polygon.reserve(n);
    for (uint8_t i = 0; i < n; ++i) {
      GeoPoint p;
      if (!read_point(r, p)) return ErrorCode::MalformedBuffer;
      out.polygon.push_back(p);
    }
  }

  if (flags & layout_of(TemplateKind::Zone).ext_flag_mask) {
    return read_extension(r, src, out.src_ids);
  }
  return ErrorCode::Ok;
}

// =============================================================================
// Dispatch
// =============================================================================

bool has_codec(TemplateKind kind) {
  return find_codec(kind) != nullptr;
}

ErrorCode encode_payload(const PacketPayload& in, etl::ivector<uint8_t>& out) {
  const CodecEntry* codec = find_codec(kind_of(in));
  if (!codec) return ErrorCode::UnsupportedTemplate;
  return codec->encode(in, out);
}

ErrorCode decode_payload(TemplateKind kind, const uint8_t* data, size_t len, PacketPayload& out) {
  const CodecEntry* codec = find_codec(kind);
  if (!codec) return ErrorCode::UnsupportedTemplate;
  return codec->decode(data, len, out);
}

ErrorCode decode_payload(uint32_t template_id, const uint8_t* data, size_t len, PacketPayload& out) {
  const auto kind = template_kind_from_id(template_id);
  if (!kind) return ErrorCode::UnsupportedTemplate;
  return decode_payload(*kind, data, len, out);
}

ErrorCode encode_payload_b64(const PacketPayload& in, std::string& out_b64) {
  RecordBuffer rec;
  const ErrorCode rc = encode_payload(in, rec);
  if (rc != ErrorCode::Ok) return rc;
  out_b64 = encode_base64url(rec);
  return ErrorCode::Ok;
}

ErrorCode decode_payload_b64(uint32_t template_id, const std::string& b64, PacketPayload& out) {
  RecordBuffer rec;
  const ErrorCode rc = decode_base64url(b64, rec);
  if (rc != ErrorCode::Ok) return rc;
  return decode_payload(template_id, rec.data(), rec.size(), out);
}

} // namespace xtoc
