// -----------------------------------------------------------------------------
// chunk_store.cpp - Implementation of the XTOC ChunkStore
//
// API & policies:
//   see include/xtoc/chunk_store.hpp
//
// NOTE: This file focuses on the order in which policies are applied.
// External-facing contracts live in the header.
// -----------------------------------------------------------------------------
#include "xtoc/chunk_store.hpp"

#include <utility>
#include <vector>

#include "xtoc/reassembler.hpp"

namespace xtoc {

// ---------- public ----------

std::string ChunkStore::group_key(const FramedPacket& p) {
  return std::string(WRAPPER_VERSION) + ":" + std::to_string(p.template_id) + ":" +
         p.mode_char() + ":" + p.id + ":" + p.kid();
}

// add_line() - queue every parseable candidate found in the text.
bool ChunkStore::add_line(const std::string& text, uint64_t now_ms) {
  const std::vector<std::string> candidates = extract_candidates(text);
  if (candidates.empty()) {
    ++stats_.ignored;
    return true;
  }

  bool all_queued = true;
  for (const auto& c : candidates) {
    // candidates are only text shaped like "X1."; the parser has the last word
    auto frame = parse_packet(c);
    if (!frame) continue;                 // looked like X1 but is not a wrapper

    if (inbox_.full()) {                  // back-pressure: caller decides to retry or drop
      ++stats_.refused;
      all_queued = false;
      continue;
    }
    inbox_.push_back(Pending{std::move(*frame), now_ms});
    ++stats_.accepted;
  }
  return all_queued;
}

// tick() - drain inbox while the outbox has room, then apply the TTL.
void ChunkStore::tick(uint64_t now_ms) {
  while (!inbox_.empty() && !outbox_.full()) {
    const Pending in = inbox_.front();
    inbox_.pop_front();
    absorb(in);
  }
  expire(now_ms);
}

bool ChunkStore::get_packet(FramedPacket& out) {
  if (outbox_.empty()) return false;
  out = outbox_.front();
  outbox_.pop_front();
  return true;
}

// ---------- private ----------

void ChunkStore::absorb(const Pending& in) {
  const FramedPacket& f = in.frame;

  // POLICY: single-chunk packets bypass grouping
  if (f.total == 1) {
    outbox_.push_back(f);
    ++stats_.completed;
    return;
  }

  // POLICY: refuse absurd part counts before they occupy a group
  if (f.total > PARTS_CAP) {
    ++stats_.refused;
    return;
  }

  // Locate (or open) the group this part belongs to.
  const std::string key = group_key(f);
  auto it = groups_.find(key);
  if (it == groups_.end()) {
    if (groups_.full()) {                 // POLICY: no room for another message
      ++stats_.refused;
      return;
    }
    it = groups_.insert(std::make_pair(key, Group{})).first;
    it->second.total = f.total;
  }

  Group& g = it->second;
  // POLICY: total changed under the same id: sender re-chunked, start over
  if (g.total != f.total) {
    g.parts.clear();
    g.total = f.total;
  }

  // POLICY: a repeated part replaces the stored copy; the count never grows
  if (g.parts.count(f.part)) ++stats_.duplicates;
  g.parts[f.part] = f;
  g.last_seen_ms = in.received_ms;   // TTL runs from the newest part, not the first

  // Every slot 1..total filled: hand the set to the reassembler.
  if (g.parts.size() == g.total) complete_group(key);
}

void ChunkStore::complete_group(const std::string& key) {
  auto it = groups_.find(key);
  if (it == groups_.end()) return;

  // Copy the parts out (map order == part order) and free the slot first,
  // so a failed set cannot pin the group table.
  std::vector<FramedPacket> parts;
  parts.reserve(it->second.parts.size());
  for (const auto& kv : it->second.parts) parts.push_back(kv.second);
  groups_.erase(it);

  const ReassemblyResult r = reassemble_packets(parts);
  // POLICY: integrity failures are counted and dropped, never emitted
  if (!r.ok() || !r.parsed) {
    ++stats_.failed;
    return;
  }
  outbox_.push_back(*r.parsed);
  ++stats_.completed;
}

void ChunkStore::expire(uint64_t now_ms) {
  for (auto it = groups_.begin(); it != groups_.end();) {
    const uint64_t last = it->second.last_seen_ms;
    // clock stepped backwards: treat as fresh rather than ancient
    const uint64_t idle = (now_ms >= last) ? (now_ms - last) : 0;
    if (idle > BUFFER_TTL_MS) {
      it = groups_.erase(it);
      ++stats_.expired;
    } else {
      ++it;
    }
  }
}

} // namespace xtoc
