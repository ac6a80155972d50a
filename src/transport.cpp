// -----------------------------------------------------------------------------
// transport.cpp - chunked send / store-fed receive over an ITransport.
// -----------------------------------------------------------------------------
#include "xtoc/transport/transport_base.hpp"

#include <vector>

#include "xtoc/chunker.hpp"

namespace xtoc::transport {

TransmitReport transmit(ITransport& t, const FramedPacket& packet) {
  TransmitReport report;
  const std::vector<std::string> lines = chunk_packet(packet, t.max_chars());
  report.lines = lines.size();

  for (const auto& line : lines) {
    report.last = t.send_line(line);
    if (report.last != TxResult::Ok) break;
    ++report.sent;
  }
  return report;
}

std::size_t receive(ITransport& t, ChunkStore& store, uint64_t now_ms, std::size_t max_lines) {
  std::size_t n = 0;
  std::string line;
  while (n < max_lines) {
    // PRE: a full inbox would refuse the line after it left the link
    if (store.inbox_full()) break;
    const RxResult rc = t.poll_line(line);
    if (rc != RxResult::Ok) break;         // None: idle, Error: adapter logs its own fault
    ++n;
    if (!store.add_line(line, now_ms)) break;   // one line held several frames and overflowed
  }
  return n;
}

} // namespace xtoc::transport
