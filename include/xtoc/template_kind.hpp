/**
 * @file template_kind.hpp
 * @brief XTOC template identifiers and their fixed record layouts.
 *
 * Each message schema (SITREP, CONTACT, ...) is identified on the wire by a
 * small integer template id. The table behind `layout_of()` records, per
 * template, what the codec needs to know without looking at field code:
 *
 *   - base record length (bytes before any optional section)
 *   - record version byte written at offset 0
 *   - where the multi-source extension flag lives (byte offset + bit mask)
 *
 * The extension flag position is not uniform: SITREP, CONTACT, TASK and
 * RESOURCE use mask 0x04, ASSET and ZONE use mask 0x08, and the flags byte
 * sits at a different offset in every record. Deployed decoders depend on
 * these exact positions.
 *
 * CHECKIN/LOC carries no flag bit; multi-unit records switch the version
 * byte to 2 instead. MISSION has an id but no binary codec.
 */
#ifndef XTOC_TEMPLATE_KIND_HPP
#define XTOC_TEMPLATE_KIND_HPP

#include <stdint.h>
#include <stddef.h>
#include <optional>

namespace xtoc {

enum class TemplateKind : uint8_t {
  Sitrep     = 1,
  Contact    = 2,
  Task       = 3,
  CheckinLoc = 4,
  Resource   = 5,
  Asset      = 6,
  Zone       = 7,
  Mission    = 8,
};

struct TemplateLayout {
  TemplateKind kind;
  const char*  name;            ///< upper-case display name ("SITREP")
  uint8_t      record_version;  ///< byte 0 of a single-source record
  size_t       base_length;     ///< 0 when the template has no binary codec
  size_t       ext_flag_offset; ///< flags byte holding the extension bit
  uint8_t      ext_flag_mask;   ///< 0 when extension is signalled another way
};

/// Layout entry for a kind. Every enumerator has one.
const TemplateLayout& layout_of(TemplateKind kind);

/// Map a wire template id to a kind; empty for unknown ids.
std::optional<TemplateKind> template_kind_from_id(uint32_t template_id);

inline uint32_t template_id_of(TemplateKind kind) {
  return static_cast<uint32_t>(kind);
}

/// Short display name, "UNKNOWN" never returned for a valid enumerator.
const char* to_string(TemplateKind kind);

} // namespace xtoc

#endif // XTOC_TEMPLATE_KIND_HPP
