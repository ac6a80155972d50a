/**
 * @file chunk_store.hpp
 * @brief ChunkStore - caller-owned accumulator for chunks arriving over time.
 *
 * @details
 * ## Field Brief
 * The reassembler is stateless: it gets a pile of chunks and
 * says yes or no. Something still has to hold part 1 of 3 while parts 2
 * and 3 crawl in over a fading HF path. **ChunkStore** is that something.
 * It is a small, single-threaded object with the same loop shape as the
 * node core it grew out of:
 *
 * ```
 *  [transport text]                 [ChunkStore]
 *         │                              │
 *   add_line(text, now) ──────────►  inbox (bounded, candidates only)
 *         │                              │
 *         │                       tick(now) ──► for each queued frame:
 *         │                              │        ├─ 1/1 → outbox
 *         │                              │        ├─ group by X1:T:M:ID:KID
 *         │                              │        ├─ complete? reassemble → outbox
 *         │                              │        └─ expire groups idle > 15 min
 *         │                              │
 *   ◄──────────────────────── get_packet(out) ── outbox (bounded)
 * ```
 *
 * ---
 *
 * @par Policies
 * - **Grouping:** frames group on template, mode, id and kid. A frame whose
 *   total disagrees with its group restarts the group (the sender re-chunked).
 * - **Idempotent insert:** re-receiving a part replaces it; nothing grows.
 * - **Bounded memory:** inbox, group table and outbox are fixed-capacity ETL
 *   containers. When the inbox is full, `add_line()` refuses. When the group
 *   table is full, frames for new messages are refused until one completes
 *   or expires. When the outbox is full, `tick()` leaves work queued.
 * - **Part cap:** frames declaring more than PARTS_CAP parts are refused.
 * - **Expiry:** a group idle for more than BUFFER_TTL_MS is dropped on tick.
 *
 * @par Failure Model
 * - A complete group that fails reassembly (integrity) is dropped and counted
 *   in `stats().failed`; nothing is emitted for it.
 * - Lines with no X1 candidates are ignored (counted as `ignored`).
 *
 * @par Minimal Usage Example
 * @code
 * xtoc::ChunkStore store;
 * store.add_line(rx_text, now_ms());
 * store.tick(now_ms());
 * xtoc::FramedPacket pkt;
 * while (store.get_packet(pkt)) {
 *   // pkt is a complete 1/1 wrapper; decode or hand to the key store
 * }
 * @endcode
 */
#ifndef XTOC_CHUNK_STORE_HPP
#define XTOC_CHUNK_STORE_HPP

#include <stdint.h>
#include <stddef.h>
#include <map>
#include <string>
#include "etl/deque.h"
#include "etl/map.h"
#include "packet.hpp"

namespace xtoc {

class ChunkStore {
public:
  /// @name Capacities & policy knobs (compile-time)
  ///@{
  static constexpr size_t   INBOX_CAP     = 64;   ///< parsed frames waiting for tick()
  static constexpr size_t   GROUP_CAP     = 16;   ///< partial messages tracked at once
  static constexpr size_t   OUTBOX_CAP    = 16;   ///< complete packets waiting for get_packet()
  static constexpr uint32_t PARTS_CAP     = 256;  ///< largest total accepted
  static constexpr uint64_t BUFFER_TTL_MS = 15ull * 60ull * 1000ull;
  ///@}

  struct Stats {
    uint32_t accepted{0};    ///< frames queued by add_line()
    uint32_t refused{0};     ///< frames dropped by a capacity or part cap
    uint32_t ignored{0};     ///< lines without a single X1 candidate
    uint32_t duplicates{0};  ///< parts received again
    uint32_t completed{0};   ///< packets placed in the outbox
    uint32_t failed{0};      ///< complete groups that did not reassemble
    uint32_t expired{0};     ///< groups dropped by the TTL
  };

  ChunkStore() = default;

  /// Scan `text` for wrapper candidates and queue every one that parses.
  /// Returns false if at least one frame was refused because the inbox is full.
  bool add_line(const std::string& text, uint64_t now_ms);

  /// Drain the inbox into groups, emit completed packets, expire stale groups.
  void tick(uint64_t now_ms);

  /// Pop the oldest complete packet; false when none.
  bool get_packet(FramedPacket& out);

  size_t pending_groups() const { return groups_.size(); }
  size_t pending_frames() const { return inbox_.size(); }
  /// True when add_line() would refuse; poll the link only after tick().
  bool   inbox_full() const { return inbox_.full(); }
  const Stats& stats() const { return stats_; }

  /// Key used to group chunks: "X1:<T>:<M>:<ID>:<KID>".
  static std::string group_key(const FramedPacket& p);

private:
  struct Pending {
    FramedPacket frame;
    uint64_t     received_ms{0};
  };

  struct Group {
    uint32_t total{0};
    std::map<uint32_t, FramedPacket> parts;
    uint64_t last_seen_ms{0};
  };

  void absorb(const Pending& in);
  void complete_group(const std::string& key);
  void expire(uint64_t now_ms);

  etl::deque<Pending, INBOX_CAP>           inbox_;
  etl::map<std::string, Group, GROUP_CAP>  groups_;
  etl::deque<FramedPacket, OUTBOX_CAP>     outbox_;
  Stats stats_{};
};

} // namespace xtoc

#endif // XTOC_CHUNK_STORE_HPP
