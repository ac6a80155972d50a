// -----------------------------------------------------------------------------
// transport_profile.cpp - carrier budget table.
// -----------------------------------------------------------------------------
#include "xtoc/transport_profile.hpp"

namespace xtoc {

namespace {

// Rows in enum order.
const ProfileInfo kProfiles[PROFILE_COUNT] = {
  { TransportProfile::JS8Call,    "JS8Call",    50 },
  { TransportProfile::APRS,       "APRS",       67 },
  { TransportProfile::HamOther,   "HamOther",   80 },
  { TransportProfile::Voice,      "Voice",      80 },   // spelled out by a human
  { TransportProfile::Winlink,    "Winlink",    400 },
  { TransportProfile::Meshtastic, "Meshtastic", 180 },
  { TransportProfile::MeshCore,   "MeshCore",   160 },  // 160-byte text frames
  { TransportProfile::HaLow,      "HaLow",      50000 },// IP LAN, chunking rarely needed
  { TransportProfile::Reticulum,  "Reticulum",  320 },
  { TransportProfile::Email,      "Email",      800 },
  { TransportProfile::QR,         "QR",         800 },
  { TransportProfile::CopyPaste,  "CopyPaste",  800 },
};

char lower_ascii(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool iequals(const std::string& a, const char* b) {
  size_t i = 0;
  for (; i < a.size(); ++i) {
    if (b[i] == '\0' || lower_ascii(a[i]) != lower_ascii(b[i])) return false;
  }
  return b[i] == '\0';
}

} // namespace

const ProfileInfo& profile_info(TransportProfile profile) {
  return kProfiles[static_cast<size_t>(profile)];
}

const ProfileInfo& profile_at(size_t index) {
  return kProfiles[index < PROFILE_COUNT ? index : static_cast<size_t>(DEFAULT_PROFILE)];
}

std::optional<TransportProfile> profile_from_name(const std::string& name) {
  for (const auto& p : kProfiles) {
    if (iequals(name, p.name)) return p.profile;
  }
  return std::nullopt;
}

size_t max_chars_for(const std::string& name) {
  const auto p = profile_from_name(name);
  return max_chars(p ? *p : DEFAULT_PROFILE);
}

} // namespace xtoc
