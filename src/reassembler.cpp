// -----------------------------------------------------------------------------
// reassembler.cpp - chunk set validation and payload concatenation
//
// Check order and failure reasons:
//   see include/xtoc/reassembler.hpp
// -----------------------------------------------------------------------------
#include "xtoc/reassembler.hpp"

#include <map>
#include <set>
#include <utility>

#include "xtoc/text.hpp"

namespace xtoc {

namespace {

ReassemblyResult fail(ErrorCode code, std::string reason) {
  ReassemblyResult r;
  r.code = code;
  r.reason = std::move(reason);
  return r;
}

bool wrapper_char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '.' || c == '_' || c == '/' || c == '-';
}

// Text from the first "X1." with trailing punctuation dropped; "" if none.
std::string clean_candidate(const std::string& s) {
  const std::string t = trim_copy(s);
  const size_t at = t.find("X1.");
  if (at == std::string::npos) return std::string();
  size_t end = t.size();
  while (end > at && !wrapper_char(t[end - 1])) --end;
  return t.substr(at, end - at);
}

} // namespace

ReassemblyResult reassemble_packets(const std::vector<FramedPacket>& parts) {
  if (parts.empty()) return fail(ErrorCode::NoPackets, "No parts");

  const FramedPacket& first = parts.front();
  for (const auto& p : parts) {
    if (!same_message(first, p)) {
      return fail(ErrorCode::InconsistentParts, "Parts do not match same packet");
    }
  }

  std::map<uint32_t, const FramedPacket*> by_part;
  for (const auto& p : parts) by_part[p.part] = &p;

  const uint32_t total = first.total;
  for (uint32_t i = 1; i <= total; ++i) {
    if (by_part.find(i) == by_part.end()) {
      ReassemblyResult r = fail(ErrorCode::MissingPart,
                                "Missing part " + std::to_string(i) + "/" + std::to_string(total));
      r.missing_part = i;
      return r;
    }
  }

  std::string payload;
  for (uint32_t i = 1; i <= total; ++i) payload += by_part[i]->payload;

  const FramedPacket whole = make_frame(first.template_id, first.mode, first.id, 1, 1, payload);

  // final integrity check: the rebuilt line must parse back to itself
  auto reparsed = parse_packet(whole.raw);
  if (!reparsed || reparsed->payload != payload) {
    return fail(ErrorCode::ReassemblyIntegrityFailure, "Failed to parse reassembled packet");
  }

  ReassemblyResult r;
  r.code = ErrorCode::Ok;
  r.packet = whole.raw;
  r.parsed = std::move(reparsed);
  return r;
}

ReassemblyResult reassemble_text(const std::string& text) {
  std::vector<FramedPacket> parsed;
  for (const auto& line : split_lines(text)) {
    const std::string t = trim_copy(line);
    if (t.empty()) continue;
    auto p = parse_packet(t);
    if (p) parsed.push_back(std::move(*p));
  }

  if (parsed.empty()) return fail(ErrorCode::NoPackets, "No valid packets found");

  if (parsed.size() == 1 && parsed.front().total == 1) {
    ReassemblyResult r;
    r.code = ErrorCode::Ok;
    r.packet = parsed.front().raw;
    r.parsed = parsed.front();
    return r;
  }
  return reassemble_packets(parsed);
}

std::vector<std::string> extract_candidates(const std::string& text) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  auto keep = [&out, &seen](const std::string& c) {
    if (c.compare(0, 3, "X1.") != 0) return;
    for (char ch : c) {
      if (is_space(ch)) return;           // several wrappers on one line
    }
    if (seen.insert(c).second) out.push_back(c);
  };

  for (const auto& line : split_lines(text)) {
    const std::string l = trim_copy(line);
    if (l.empty()) continue;

    keep(clean_candidate(l));

    size_t i = 0;
    while (i < l.size()) {
      while (i < l.size() && is_space(l[i])) ++i;
      size_t j = i;
      while (j < l.size() && !is_space(l[j])) ++j;
      if (j > i) keep(clean_candidate(l.substr(i, j - i)));
      i = j;
    }
  }
  return out;
}

} // namespace xtoc
