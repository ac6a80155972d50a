/**
 * @file field_policy.hpp
 * @brief One table deciding, per field class, whether bad input is clamped,
 *        truncated, dropped or rejected.
 *
 * @details
 * Radio operators type on bad keyboards in bad weather. A priority of 300,
 * a negative count or a NaN longitude should still produce a packet. The
 * rule of thumb encoded here:
 *
 *   - numbers out of range are CLAMPED into the wire width
 *   - text is TRIMMED and CUT at its byte budget (on a UTF-8 boundary)
 *   - correlated ids that cannot be represented are DROPPED
 *   - only a missing/unusable primary id, or a zone polygon with too few
 *     points, is REJECTED (FieldOutOfRange)
 *
 * The codec asks this table instead of carrying its own ad hoc checks, so
 * the boundary between "normalize" and "fail" can be read and tested here.
 *
 * | Field class    | Rule     | Range            |
 * |----------------|----------|------------------|
 * | PrimaryId      | Require  | 1..65535         |
 * | SecondaryId    | Clamp    | 0..65535         |
 * | Code           | Clamp    | 0..255           |
 * | Quantity       | Clamp    | 0..65535         |
 * | Minutes        | Clamp    | 0..4294967295    |
 * | Coordinate     | Clamp    | int32 fixed-point|
 * | Radius         | Clamp    | 0..65535         |
 * | Note           | Truncate | 120 bytes        |
 * | Label          | Truncate | 48 bytes         |
 * | PolygonPoints  | Require  | 3..32 (extra cut)|
 * | SourceIds      | Drop     | 1..65535, max 32 |
 */
#ifndef XTOC_FIELD_POLICY_HPP
#define XTOC_FIELD_POLICY_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include "etl/vector.h"
#include "payload.hpp"

namespace xtoc {

static constexpr size_t  MAX_SOURCE_IDS  = 32;
static constexpr size_t  NOTE_MAX        = 120;
static constexpr size_t  LABEL_MAX       = 48;
static constexpr size_t  ZONE_MIN_POINTS = 3;
static constexpr size_t  ZONE_MAX_POINTS = 32;
static constexpr double  COORD_SCALE     = 1e5;
static constexpr int64_t MINUTE_MS       = 60000;

/// Normalized correlated-id list: primary first, unique, 1..65535.
using IdList = etl::vector<uint16_t, MAX_SOURCE_IDS>;

enum class FieldClass : uint8_t {
  PrimaryId,
  SecondaryId,
  Code,
  Quantity,
  Minutes,
  Coordinate,
  Radius,
  Note,
  Label,
  PolygonPoints,
  SourceIds,
};

enum class FieldRule : uint8_t { Clamp, Require, Truncate, Drop };

struct FieldSpec {
  FieldClass  field;
  const char* name;
  FieldRule   rule;
  int64_t     min;
  int64_t     max;
};

const FieldSpec& field_spec(FieldClass field);

/// Clamp into [min, max] of the field's row.
int64_t clamp_field(FieldClass field, int64_t value);

/// True if `value` satisfies the row's range (used for Require rows).
bool field_accepts(FieldClass field, int64_t value);

/// floor(t_ms / 60000), clamped to uint32. Negative times become 0.
uint32_t quantize_minutes(int64_t t_ms);

inline int64_t minutes_to_ms(uint32_t minutes) {
  return static_cast<int64_t>(minutes) * MINUTE_MS;
}

/// round(deg * 1e5) with halves rounded up; NaN/inf map to 0, clamped to int32.
int32_t quantize_coord(double deg);

inline double dequantize_coord(int32_t fixed) {
  return static_cast<double>(fixed) / COORD_SCALE;
}

/// Both coordinates finite.
bool usable_point(const GeoPoint& p);

/// floor(radius) clamped to 0..65535; NaN maps to 0.
uint16_t quantize_radius(double radius_m);

/// Trim surrounding whitespace and cut to the field's byte budget.
std::string clip_text(FieldClass field, const std::string& text);

/// Build the wire id list: primary first, then valid unique extras, max 32.
/// `primary` must already satisfy the PrimaryId row.
IdList normalize_ids(int64_t primary, const std::vector<int64_t>& ids);

} // namespace xtoc

#endif // XTOC_FIELD_POLICY_HPP
