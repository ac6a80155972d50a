#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal text-carrier interface for XTOC wrappers.
 *
 * XTOC never touches a radio. A transport adapter (JS8Call API, APRS TNC,
 * Meshtastic serial, mail drop ...) implements this interface and the
 * helpers below do the protocol side: chunk for the carrier's budget on the
 * way out, feed received text into a ChunkStore on the way in.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "xtoc/chunk_store.hpp"
#include "xtoc/packet.hpp"
#include "xtoc/transport_profile.hpp"

namespace xtoc::transport {

// Return codes kept simple.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

/**
 * @brief Carrier trait every adapter can rely on.
 *
 * Contract:
 *  - send_line(line) queues/transmits one wrapper line; never blocks for long
 *    (return Busy instead).
 *  - poll_line(out) returns Ok with one received line, None when idle.
 *  - profile() names the carrier; its budget drives chunking.
 *  - name() is a short identifier for logs/diagnostics.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual TxResult         send_line(const std::string& line) = 0;
  virtual RxResult         poll_line(std::string& out) = 0;
  virtual TransportProfile profile() const = 0;
  virtual const char*      name() const = 0;

  /// Per-line budget; adapters with a tighter link may override.
  virtual std::size_t max_chars() const { return xtoc::max_chars(profile()); }
};

struct TransmitReport {
  std::size_t lines{0};          ///< chunks produced for the packet
  std::size_t sent{0};           ///< chunks accepted by the carrier
  TxResult    last{TxResult::Ok};
};

/// Chunk `packet` for `t` and send each line in order; stops at the first
/// non-Ok result so the caller can resume from `report.sent`.
TransmitReport transmit(ITransport& t, const FramedPacket& packet);

/// Poll `t` until idle (or `max_lines`), handing every line to `store`.
/// Stops before polling when the store's inbox is full, so no line is lost. Returns the number of lines read.
std::size_t receive(ITransport& t, ChunkStore& store, uint64_t now_ms, std::size_t max_lines = 64);

} // namespace xtoc::transport
