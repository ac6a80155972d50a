/**
 * @file payload.hpp
 * @brief Typed field sets for every XTOC template (the PacketPayload union).
 *
 * These structs are what application code fills in before encoding and what
 * the decoder hands back. Numeric inputs use wide signed types so that
 * out-of-range input reaches the field policy intact: a caller may pass 300
 * for a priority or 70000 for an id and the encoder clamps or drops it
 * (see field_policy.hpp). After a decode
 * every field is inside its wire range.
 *
 * Conventions shared by all templates:
 *   - `t_ms` is a Unix time in milliseconds. On the wire it is whole minutes;
 *     a decoded value is always a multiple of 60000.
 *   - Coordinates are decimal degrees, quantized to 1e-5 on the wire.
 *   - `src_ids` / `unit_ids` list correlated ids. On input the primary id may
 *     or may not be repeated at the front. A decoded list is either empty
 *     (single source) or starts with the primary id and holds 2..32 entries.
 *   - Empty `note` / `label` means "absent"; text is trimmed and cut to
 *     120 / 48 bytes on encode.
 */
#ifndef XTOC_PAYLOAD_HPP
#define XTOC_PAYLOAD_HPP

#include <stdint.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "template_kind.hpp"

namespace xtoc {

struct GeoPoint {
  double lat = 0.0;
  double lon = 0.0;
};

/// Template 4: unit check-in with position.
struct CheckinLocPayload {
  int64_t unit_id = 0;
  std::vector<int64_t> unit_ids;
  double lat = 0.0;
  double lon = 0.0;
  int64_t t_ms = 0;
  int32_t status = 0;
};

/// Template 1: situation report.
struct SitrepPayload {
  int64_t src = 0;
  std::vector<int64_t> src_ids;
  int64_t dst = 0;              ///< 0 = all stations
  int32_t pri = 0;
  int32_t status = 0;
  int64_t t_ms = 0;
  std::optional<GeoPoint> loc;
  std::string note;
};

/// Template 2: contact / sighting report.
struct ContactPayload {
  int64_t src = 0;
  std::vector<int64_t> src_ids;
  int32_t pri = 0;
  int64_t t_ms = 0;
  int32_t type_code = 0;
  int64_t count = 0;
  int32_t dir = 0;
  std::optional<GeoPoint> loc;
  std::string note;
};

/// Template 3: tasking order.
struct TaskPayload {
  int64_t src = 0;
  std::vector<int64_t> src_ids;
  int64_t dst = 0;
  int32_t pri = 0;
  int64_t t_ms = 0;
  int32_t action_code = 0;
  int64_t due_mins = 0;
  std::optional<GeoPoint> loc;
  std::string note;
};

/// Template 5: resource request or report.
struct ResourcePayload {
  int64_t src = 0;
  std::vector<int64_t> src_ids;
  int32_t pri = 0;
  int64_t t_ms = 0;
  int32_t item_code = 0;
  int64_t qty = 0;
  std::optional<GeoPoint> loc;
  std::string note;
};

/// Template 6: asset status.
struct AssetPayload {
  int64_t src = 0;
  std::vector<int64_t> src_ids;
  int32_t condition = 0;
  int64_t t_ms = 0;
  int32_t type_code = 0;
  std::optional<GeoPoint> loc;
  std::string label;
  std::string note;
};

struct ZoneCircle {
  GeoPoint center;
  double radius_m = 0.0;
};

/// Template 7: zone. `circle` wins over `polygon` when both are set.
struct ZonePayload {
  int64_t src = 0;
  std::vector<int64_t> src_ids;
  int32_t threat = 0;
  int32_t meaning_code = 0;
  int64_t t_ms = 0;
  std::string label;
  std::string note;
  std::optional<ZoneCircle> circle;
  std::vector<GeoPoint> polygon;
};

using PacketPayload = std::variant<
    SitrepPayload,
    ContactPayload,
    TaskPayload,
    CheckinLocPayload,
    ResourcePayload,
    AssetPayload,
    ZonePayload>;

/// Template kind carried by the active alternative.
TemplateKind kind_of(const PacketPayload& payload);

/// Primary source/unit id of the active alternative.
int64_t primary_id_of(const PacketPayload& payload);

/// Timestamp (ms) of the active alternative.
int64_t time_of(const PacketPayload& payload);

} // namespace xtoc

#endif // XTOC_PAYLOAD_HPP
