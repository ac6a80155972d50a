// -----------------------------------------------------------------------------
// field_policy.cpp - normalization rules applied by the template codec.
//
// Rows of kPolicy are indexed by FieldClass. Keep them in enum order.
// -----------------------------------------------------------------------------
#include "xtoc/field_policy.hpp"

#include <cmath>
#include <limits>

#include "xtoc/text.hpp"

namespace xtoc {

namespace {

const FieldSpec kPolicy[] = {
  { FieldClass::PrimaryId,     "primary_id",   FieldRule::Require,  1, 65535 },
  { FieldClass::SecondaryId,   "secondary_id", FieldRule::Clamp,    0, 65535 },
  { FieldClass::Code,          "code",         FieldRule::Clamp,    0, 255 },
  { FieldClass::Quantity,      "quantity",     FieldRule::Clamp,    0, 65535 },
  { FieldClass::Minutes,       "minutes",      FieldRule::Clamp,    0, 4294967295LL },
  { FieldClass::Coordinate,    "coordinate",   FieldRule::Clamp,
    std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max() },
  { FieldClass::Radius,        "radius_m",     FieldRule::Clamp,    0, 65535 },
  { FieldClass::Note,          "note",         FieldRule::Truncate, 0, static_cast<int64_t>(NOTE_MAX) },
  { FieldClass::Label,         "label",        FieldRule::Truncate, 0, static_cast<int64_t>(LABEL_MAX) },
  { FieldClass::PolygonPoints, "polygon",      FieldRule::Require,
    static_cast<int64_t>(ZONE_MIN_POINTS), static_cast<int64_t>(ZONE_MAX_POINTS) },
  { FieldClass::SourceIds,     "src_ids",      FieldRule::Drop,     1, 65535 },
};

// Clamp a double that has already been checked for NaN into the row range.
int64_t clamp_double(FieldClass field, double v) {
  const FieldSpec& s = field_spec(field);
  if (v <= static_cast<double>(s.min)) return s.min;
  if (v >= static_cast<double>(s.max)) return s.max;
  return static_cast<int64_t>(v);
}

} // namespace

const FieldSpec& field_spec(FieldClass field) {
  return kPolicy[static_cast<size_t>(field)];
}

int64_t clamp_field(FieldClass field, int64_t value) {
  const FieldSpec& s = field_spec(field);
  if (value < s.min) return s.min;
  if (value > s.max) return s.max;
  return value;
}

bool field_accepts(FieldClass field, int64_t value) {
  const FieldSpec& s = field_spec(field);
  return value >= s.min && value <= s.max;
}

uint32_t quantize_minutes(int64_t t_ms) {
  if (t_ms < 0) return 0;
  return static_cast<uint32_t>(clamp_field(FieldClass::Minutes, t_ms / MINUTE_MS));
}

int32_t quantize_coord(double deg) {
  if (!std::isfinite(deg)) return 0;
  // halves round toward +inf so -0.000005 lands on 0, as deployed encoders do
  const double scaled = std::floor(deg * COORD_SCALE + 0.5);
  return static_cast<int32_t>(clamp_double(FieldClass::Coordinate, scaled));
}

bool usable_point(const GeoPoint& p) {
  return std::isfinite(p.lat) && std::isfinite(p.lon);
}

uint16_t quantize_radius(double radius_m) {
  if (std::isnan(radius_m)) return 0;
  return static_cast<uint16_t>(clamp_double(FieldClass::Radius, std::floor(radius_m)));
}

std::string clip_text(FieldClass field, const std::string& text) {
  size_t b = 0;
  size_t e = text.size();
  while (b < e && is_space(text[b])) ++b;
  while (e > b && is_space(text[e - 1])) --e;

  const size_t budget = static_cast<size_t>(field_spec(field).max);
  if (e - b > budget) {
    e = b + budget;
    // never split a multi-byte sequence: back off over continuation bytes
    while (e > b && (static_cast<uint8_t>(text[e]) & 0xC0) == 0x80) --e;
  }
  return text.substr(b, e - b);
}

IdList normalize_ids(int64_t primary, const std::vector<int64_t>& ids) {
  IdList out;
  out.push_back(static_cast<uint16_t>(primary));

  for (int64_t id : ids) {
    if (out.full()) break;
    if (!field_accepts(FieldClass::SourceIds, id)) continue;

    const uint16_t v = static_cast<uint16_t>(id);
    bool seen = false;
    for (uint16_t have : out) {
      if (have == v) { seen = true; break; }
    }
    if (!seen) out.push_back(v);
  }
  return out;
}

} // namespace xtoc
