// -----------------------------------------------------------------------------
// payload.cpp - accessors common to every PacketPayload alternative.
// -----------------------------------------------------------------------------
#include "xtoc/payload.hpp"

#include <type_traits>

namespace xtoc {

namespace {

template <typename P> struct KindOf;
template <> struct KindOf<SitrepPayload>     { static constexpr TemplateKind value = TemplateKind::Sitrep; };
template <> struct KindOf<ContactPayload>    { static constexpr TemplateKind value = TemplateKind::Contact; };
template <> struct KindOf<TaskPayload>       { static constexpr TemplateKind value = TemplateKind::Task; };
template <> struct KindOf<CheckinLocPayload> { static constexpr TemplateKind value = TemplateKind::CheckinLoc; };
template <> struct KindOf<ResourcePayload>   { static constexpr TemplateKind value = TemplateKind::Resource; };
template <> struct KindOf<AssetPayload>      { static constexpr TemplateKind value = TemplateKind::Asset; };
template <> struct KindOf<ZonePayload>       { static constexpr TemplateKind value = TemplateKind::Zone; };

} // namespace

TemplateKind kind_of(const PacketPayload& payload) {
  return std::visit([](const auto& p) {
    return KindOf<std::decay_t<decltype(p)>>::value;
  }, payload);
}

int64_t primary_id_of(const PacketPayload& payload) {
  return std::visit([](const auto& p) -> int64_t {
    if constexpr (std::is_same_v<std::decay_t<decltype(p)>, CheckinLocPayload>) {
      return p.unit_id;
    } else {
      return p.src;
    }
  }, payload);
}

int64_t time_of(const PacketPayload& payload) {
  return std::visit([](const auto& p) { return p.t_ms; }, payload);
}

} // namespace xtoc
