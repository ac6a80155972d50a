/**
 * @file reassembler.hpp
 * @brief Rebuild one 1/1 wrapper from an unordered set of chunks.
 *
 * @details
 * Chunks arrive out of order, twice, or not at all, and sometimes two
 * stations' traffic is pasted into the same box. The reassembler checks,
 * in this order:
 *
 *   1. every frame belongs to the same logical message (template, mode,
 *      id, total and, for Secure, kid), else InconsistentParts
 *   2. every part 1..total is present, else MissingPart naming the
 *      smallest gap ("Missing part 2/3")
 *   3. the concatenated payload, rewrapped as 1/1, parses again, else
 *      ReassemblyIntegrityFailure
 *
 * Duplicated parts are harmless: the last copy of a part number wins.
 *
 * Nothing here throws or keeps state between calls. Buffering chunks over
 * time is the caller's job (see chunk_store.hpp for one way to do it).
 */
#ifndef XTOC_REASSEMBLER_HPP
#define XTOC_REASSEMBLER_HPP

#include <stdint.h>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "packet.hpp"

namespace xtoc {

struct ReassemblyResult {
  ErrorCode   code{ErrorCode::NoPackets};
  uint32_t    missing_part{0};       ///< set with ErrorCode::MissingPart
  std::string reason;                ///< human-readable, empty on success
  std::string packet;                ///< rebuilt 1/1 wrapper line
  std::optional<FramedPacket> parsed;

  bool ok() const { return code == ErrorCode::Ok; }
};

/// Reassemble already-parsed frames (any order).
ReassemblyResult reassemble_packets(const std::vector<FramedPacket>& parts);

/// Convenience: pull every parseable line out of `text` and reassemble.
/// Blank and unparseable lines are skipped. A lone 1/1 line is returned
/// as-is without going through the multi-part path.
ReassemblyResult reassemble_text(const std::string& text);

/// Every X1 candidate in free text (whole lines and whitespace tokens),
/// trailing punctuation stripped, duplicates removed, first-seen order.
std::vector<std::string> extract_candidates(const std::string& text);

} // namespace xtoc

#endif // XTOC_REASSEMBLER_HPP
