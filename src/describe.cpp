// -----------------------------------------------------------------------------
// describe.cpp - grep-friendly summaries for the CLI and tools.
//
// Output examples:
//   "tpl=CHECKIN unit=12 unit_ids=12,14 lat=37.77490 lon=-122.41940 t=... status=1"
//   "tpl=TASK src=12 dst=7 pri=1 t=... action=3 due=90 note=\"hold bridge\""
// -----------------------------------------------------------------------------
#include "xtoc/describe.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

namespace xtoc {

namespace {

void put_ids(std::ostringstream& os, const char* key, const std::vector<int64_t>& ids) {
  if (ids.empty()) return;
  os << ' ' << key << '=';
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i) os << ',';
    os << ids[i];
  }
}

void put_point(std::ostringstream& os, const GeoPoint& p) {
  os << std::fixed << std::setprecision(5) << p.lat << ',' << p.lon;
}

void put_loc(std::ostringstream& os, const std::optional<GeoPoint>& loc) {
  if (!loc) return;
  os << " loc=";
  put_point(os, *loc);
}

void put_text(std::ostringstream& os, const char* key, const std::string& v) {
  if (v.empty()) return;
  os << ' ' << key << "=\"" << v << '"';
}

void body(std::ostringstream& os, const CheckinLocPayload& p) {
  os << " unit=" << p.unit_id;
  put_ids(os, "unit_ids", p.unit_ids);
  os << " lat=" << std::fixed << std::setprecision(5) << p.lat
     << " lon=" << p.lon
     << " t=" << p.t_ms << " status=" << p.status;
}

void body(std::ostringstream& os, const SitrepPayload& p) {
  os << " src=" << p.src;
  put_ids(os, "src_ids", p.src_ids);
  os << " dst=" << p.dst << " pri=" << p.pri << " status=" << p.status << " t=" << p.t_ms;
  put_loc(os, p.loc);
  put_text(os, "note", p.note);
}

void body(std::ostringstream& os, const ContactPayload& p) {
  os << " src=" << p.src;
  put_ids(os, "src_ids", p.src_ids);
  os << " pri=" << p.pri << " t=" << p.t_ms << " type=" << p.type_code
     << " count=" << p.count << " dir=" << p.dir;
  put_loc(os, p.loc);
  put_text(os, "note", p.note);
}

void body(std::ostringstream& os, const TaskPayload& p) {
  os << " src=" << p.src;
  put_ids(os, "src_ids", p.src_ids);
  os << " dst=" << p.dst << " pri=" << p.pri << " t=" << p.t_ms
     << " action=" << p.action_code << " due=" << p.due_mins;
  put_loc(os, p.loc);
  put_text(os, "note", p.note);
}

void body(std::ostringstream& os, const ResourcePayload& p) {
  os << " src=" << p.src;
  put_ids(os, "src_ids", p.src_ids);
  os << " pri=" << p.pri << " t=" << p.t_ms << " item=" << p.item_code << " qty=" << p.qty;
  put_loc(os, p.loc);
  put_text(os, "note", p.note);
}

void body(std::ostringstream& os, const AssetPayload& p) {
  os << " src=" << p.src;
  put_ids(os, "src_ids", p.src_ids);
  os << " condition=" << p.condition << " t=" << p.t_ms << " type=" << p.type_code;
  put_loc(os, p.loc);
  put_text(os, "label", p.label);
  put_text(os, "note", p.note);
}

void body(std::ostringstream& os, const ZonePayload& p) {
  os << " src=" << p.src;
  put_ids(os, "src_ids", p.src_ids);
  os << " threat=" << p.threat << " meaning=" << p.meaning_code << " t=" << p.t_ms;
  put_text(os, "label", p.label);
  put_text(os, "note", p.note);
  if (p.circle) {
    os << " circle=";
    put_point(os, p.circle->center);
    os << ',' << std::setprecision(0) << p.circle->radius_m;
  } else {
    os << " polygon=" << p.polygon.size();
  }
}

} // namespace

std::string describe(const FramedPacket& packet) {
  std::ostringstream os;
  const auto kind = template_kind_from_id(packet.template_id);
  os << "tpl=";
  if (kind) os << to_string(*kind);
  else      os << packet.template_id;
  os << " id=" << packet.id
     << " mode=" << packet.mode_char()
     << " part=" << packet.part << '/' << packet.total;
  if (packet.is_secure()) os << " kid=" << packet.kid();
  os << " payload_len=" << packet.payload.size();
  return os.str();
}

std::string describe(const PacketPayload& payload) {
  std::ostringstream os;
  os << "tpl=" << to_string(kind_of(payload));
  std::visit([&os](const auto& p) { body(os, p); }, payload);
  return os.str();
}

} // namespace xtoc
