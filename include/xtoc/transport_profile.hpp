/**
 * @file transport_profile.hpp
 * @brief Named carriers and their per-message character budgets.
 *
 * The chunker needs one number per carrier: how many characters fit in a
 * single transmission once the carrier's own framing is accounted for.
 * These values match what fielded stations use, so a chunk set produced
 * here reassembles on any of them.
 *
 * | Profile    | Max chars |
 * |------------|-----------|
 * | JS8Call    | 50        |
 * | APRS       | 67        |
 * | HamOther   | 80        |
 * | Voice      | 80        |
 * | Winlink    | 400       |
 * | Meshtastic | 180       |
 * | MeshCore   | 160       |
 * | HaLow      | 50000     |
 * | Reticulum  | 320       |
 * | Email      | 800       |
 * | QR         | 800       |
 * | CopyPaste  | 800       |
 */
#ifndef XTOC_TRANSPORT_PROFILE_HPP
#define XTOC_TRANSPORT_PROFILE_HPP

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <string>

namespace xtoc {

enum class TransportProfile : uint8_t {
  JS8Call = 0,
  APRS,
  HamOther,
  Voice,
  Winlink,
  Meshtastic,
  MeshCore,
  HaLow,
  Reticulum,
  Email,
  QR,
  CopyPaste,
};

static constexpr size_t           PROFILE_COUNT   = 12;
static constexpr TransportProfile DEFAULT_PROFILE = TransportProfile::CopyPaste;

struct ProfileInfo {
  TransportProfile profile;
  const char*      name;
  size_t           max_chars;
};

const ProfileInfo& profile_info(TransportProfile profile);

/// Row `index` of the profile table (0 .. PROFILE_COUNT-1).
const ProfileInfo& profile_at(size_t index);

inline size_t max_chars(TransportProfile profile) {
  return profile_info(profile).max_chars;
}

inline const char* to_string(TransportProfile profile) {
  return profile_info(profile).name;
}

/// Case-insensitive lookup by name ("js8call", "APRS" ...).
std::optional<TransportProfile> profile_from_name(const std::string& name);

/// Budget for a profile name; unknown names get the CopyPaste budget.
size_t max_chars_for(const std::string& name);

} // namespace xtoc

#endif // XTOC_TRANSPORT_PROFILE_HPP
