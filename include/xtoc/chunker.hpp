/**
 * @file chunker.hpp
 * @brief Split one 1/1 wrapper line into carrier-sized part/total lines.
 *
 * @details
 * The header of every chunk carries `<part>/<total>.`, whose width depends
 * on how many chunks there are, which depends on how much room the header
 * leaves. The chunker resolves that circle with a bounded fixed-point loop:
 *
 * ```
 *   len  = max(1, budget - (header + "1/1."))       // assume one chunk
 *   repeat up to 5 times:
 *     n    = ceil(payload / len)
 *     next = max(1, budget - (header + "n/n."))
 *     stop if next == len
 *     len  = next
 * ```
 *
 * `header` is `X1.<T>.<M>.<id>.` plus `<kid>.` in Secure mode. The lower
 * bound of one character keeps the split moving under absurd budgets; in
 * that case lines will exceed the budget, there is nothing smaller to send.
 *
 * Convergence is not proven for every input (a digit-width step such as
 * 9 -> 10 or 99 -> 100 chunks can move the target twice). The five
 * iteration bound matches fielded encoders and is kept as is.
 *
 * A packet that already fits is returned unchanged as its single `1/1`
 * line. Input that is itself a chunk (total > 1) is passed through as-is.
 */
#ifndef XTOC_CHUNKER_HPP
#define XTOC_CHUNKER_HPP

#include <stddef.h>
#include <string>
#include <vector>
#include "packet.hpp"
#include "transport_profile.hpp"

namespace xtoc {

static constexpr unsigned CHUNK_MAX_ITERATIONS = 5;

struct ChunkPlan {
  size_t   chunk_len{1};   ///< payload characters per chunk (last may be shorter)
  size_t   count{1};       ///< number of chunks
  unsigned iterations{0};  ///< loop passes used, <= CHUNK_MAX_ITERATIONS
  bool     converged{false};
};

/// Header bytes that do not depend on part/total: "X1.T.M.ID." [+ "KID."].
size_t fixed_header_len(const FramedPacket& packet);

/// Run the convergence loop for a payload of `payload_len` characters.
ChunkPlan plan_chunks(size_t header_len, size_t payload_len, size_t max_chars);

/// Chunk a parsed 1/1 packet for a budget of `max_chars` per line.
std::vector<std::string> chunk_packet(const FramedPacket& packet, size_t max_chars);

inline std::vector<std::string> chunk_packet(const FramedPacket& packet, TransportProfile profile) {
  return chunk_packet(packet, max_chars(profile));
}

/// Parse `line` then chunk it; empty result if the line does not parse.
std::vector<std::string> chunk_line(const std::string& line, size_t max_chars);

} // namespace xtoc

#endif // XTOC_CHUNKER_HPP
