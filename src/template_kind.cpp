// -----------------------------------------------------------------------------
// template_kind.cpp - static layout table for XTOC templates.
//
// Offsets and masks here are wire format. Changing any of them breaks
// interoperability with fielded encoders.
// -----------------------------------------------------------------------------
#include "xtoc/template_kind.hpp"

namespace xtoc {

namespace {

//                kind                    name        ver base off mask
const TemplateLayout kLayouts[] = {
  { TemplateKind::Sitrep,     "SITREP",     1, 12, 11, 0x04 },
  { TemplateKind::Contact,    "CONTACT",    1, 13, 12, 0x04 },
  { TemplateKind::Task,       "TASK",       1, 14, 13, 0x04 },
  { TemplateKind::CheckinLoc, "CHECKIN",    1, 16,  0, 0x00 },
  { TemplateKind::Resource,   "RESOURCE",   1, 12, 11, 0x04 },
  { TemplateKind::Asset,      "ASSET",      1, 10,  9, 0x08 },
  { TemplateKind::Zone,       "ZONE",       1, 10,  9, 0x08 },
  { TemplateKind::Mission,    "MISSION",    1,  0,  0, 0x00 },
};

} // namespace

// Rows are ordered by template id, which starts at 1.
const TemplateLayout& layout_of(TemplateKind kind) {
  return kLayouts[static_cast<size_t>(kind) - 1];
}

std::optional<TemplateKind> template_kind_from_id(uint32_t template_id) {
  for (const auto& l : kLayouts) {
    if (static_cast<uint32_t>(l.kind) == template_id) return l.kind;
  }
  return std::nullopt;
}

const char* to_string(TemplateKind kind) {
  return layout_of(kind).name;
}

} // namespace xtoc
