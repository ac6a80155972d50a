/**
 * @file describe.hpp
 * @brief One-line key=value summaries of wrappers and decoded payloads.
 *
 * Output is meant for logs and shell pipelines, e.g.
 *   "tpl=SITREP id=7KQ2M9TA mode=C part=1/1 payload_len=16"
 *   "tpl=SITREP src=12 dst=0 pri=2 status=0 t=1700000000000"
 *   "tpl=ZONE src=12 threat=2 meaning=4 t=... circle=37.77490,-122.41940,250"
 *
 * Absent optional fields are omitted; correlated ids print as a
 * comma-separated list (`src_ids=12,14,19`).
 */
#pragma once

#include <string>
#include "packet.hpp"
#include "payload.hpp"

namespace xtoc {

std::string describe(const FramedPacket& packet);
std::string describe(const PacketPayload& payload);

} // namespace xtoc
