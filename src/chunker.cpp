// -----------------------------------------------------------------------------
// chunker.cpp - transport-aware splitting of wrapper lines
//
// Algorithm and its known limits:
//   see include/xtoc/chunker.hpp
// -----------------------------------------------------------------------------
#include "xtoc/chunker.hpp"

namespace xtoc {

namespace {

size_t digits(size_t n) {
  size_t d = 1;
  while (n >= 10) { n /= 10; ++d; }
  return d;
}

// "<n>/<n>." for an n-chunk split
size_t part_total_len(size_t n) {
  return digits(n) * 2 + 2;
}

// Room left for payload; never below one character.
size_t allowance(size_t max_chars, size_t header_len, size_t n) {
  const size_t overhead = header_len + part_total_len(n);
  return max_chars > overhead + 1 ? max_chars - overhead : 1;
}

size_t chunks_needed(size_t payload_len, size_t chunk_len) {
  if (payload_len <= chunk_len) return 1;
  return (payload_len + chunk_len - 1) / chunk_len;
}

} // namespace

size_t fixed_header_len(const FramedPacket& packet) {
  // "X1." + T + "." + M + "." + ID + "."
  size_t n = 3 + std::to_string(packet.template_id).size() + 1 + 1 + 1 + packet.id.size() + 1;
  if (packet.is_secure()) n += packet.kid().size() + 1;
  return n;
}

ChunkPlan plan_chunks(size_t header_len, size_t payload_len, size_t max_chars) {
  ChunkPlan plan;
  plan.chunk_len = allowance(max_chars, header_len, 1);

  for (unsigned iter = 0; iter < CHUNK_MAX_ITERATIONS; ++iter) {
    plan.iterations = iter + 1;
    const size_t n = chunks_needed(payload_len, plan.chunk_len);
    const size_t next = allowance(max_chars, header_len, n);
    if (next == plan.chunk_len) {
      plan.converged = true;
      break;
    }
    plan.chunk_len = next;
  }

  plan.count = chunks_needed(payload_len, plan.chunk_len);
  return plan;
}

std::vector<std::string> chunk_packet(const FramedPacket& packet, size_t max_chars) {
  std::vector<std::string> out;
  const std::string whole = build_packet(packet);

  // already a chunk of something larger, or small enough to send as-is
  if (packet.total != 1 || whole.size() <= max_chars) {
    out.push_back(whole);
    return out;
  }

  const ChunkPlan plan = plan_chunks(fixed_header_len(packet), packet.payload.size(), max_chars);
  out.reserve(plan.count);

  FramedPacket piece = packet;
  piece.total = static_cast<uint32_t>(plan.count);
  for (size_t i = 0; i < plan.count; ++i) {
    piece.part = static_cast<uint32_t>(i + 1);
    piece.payload = packet.payload.substr(i * plan.chunk_len, plan.chunk_len);
    out.push_back(build_packet(piece));
  }
  return out;
}

std::vector<std::string> chunk_line(const std::string& line, size_t max_chars) {
  const auto parsed = parse_packet(line);
  if (!parsed) return {};
  return chunk_packet(*parsed, max_chars);
}

} // namespace xtoc
