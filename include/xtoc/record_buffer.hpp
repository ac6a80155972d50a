/**
 * @file record_buffer.hpp
 * @brief Big-endian byte writer/reader over bounded ETL buffers.
 *
 * Every XTOC record is packed most-significant byte first. RecordWriter
 * appends into any `etl::ivector<uint8_t>` and remembers if it ran out of
 * room; RecordReader walks a read-only span and returns false instead of
 * reading past the end, which the codec reports as MalformedBuffer.
 *
 * Header-only; both classes are a handful of inline calls.
 */
#ifndef XTOC_RECORD_BUFFER_HPP
#define XTOC_RECORD_BUFFER_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include "etl/vector.h"

namespace xtoc {

/// Largest record any template can produce (zone polygon + label + note + ext).
static constexpr size_t RECORD_MAX = 512;

using RecordBuffer = etl::vector<uint8_t, RECORD_MAX>;

class RecordWriter {
public:
  explicit RecordWriter(etl::ivector<uint8_t>& out)
  : out_(out) {
    out_.clear();
  }

  void u8(uint8_t v) {
    if (out_.full()) { overflow_ = true; return; }
    out_.push_back(v);
  }

  void u16(uint16_t v) {
    u8(static_cast<uint8_t>(v >> 8));
    u8(static_cast<uint8_t>(v));
  }

  void u32(uint32_t v) {
    u8(static_cast<uint8_t>(v >> 24));
    u8(static_cast<uint8_t>(v >> 16));
    u8(static_cast<uint8_t>(v >> 8));
    u8(static_cast<uint8_t>(v));
  }

  void i32(int32_t v) { u32(static_cast<uint32_t>(v)); }

  /// Length byte followed by the bytes. Caller keeps text under 256 bytes.
  void text(const std::string& s) {
    u8(static_cast<uint8_t>(s.size()));
    for (char c : s) u8(static_cast<uint8_t>(c));
  }

  size_t size() const { return out_.size(); }
  bool overflow() const { return overflow_; }

private:
  etl::ivector<uint8_t>& out_;
  bool overflow_{false};
};

class RecordReader {
public:
  RecordReader(const uint8_t* data, size_t len)
  : data_(data), len_(len) {}

  bool u8(uint8_t& v) {
    if (remaining() < 1) return false;
    v = data_[pos_++];
    return true;
  }

  bool u16(uint16_t& v) {
    if (remaining() < 2) return false;
    v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return true;
  }

  bool u32(uint32_t& v) {
    if (remaining() < 4) return false;
    v = (static_cast<uint32_t>(data_[pos_])     << 24) |
        (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
        (static_cast<uint32_t>(data_[pos_ + 2]) << 8)  |
         static_cast<uint32_t>(data_[pos_ + 3]);
    pos_ += 4;
    return true;
  }

  bool i32(int32_t& v) {
    uint32_t u = 0;
    if (!u32(u)) return false;
    v = static_cast<int32_t>(u);
    return true;
  }

  bool text(std::string& s) {
    uint8_t n = 0;
    if (!u8(n)) return false;
    if (remaining() < n) return false;
    s.assign(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n;
    return true;
  }

  size_t offset() const { return pos_; }
  size_t remaining() const { return len_ - pos_; }

private:
  const uint8_t* data_;
  size_t len_;
  size_t pos_{0};
};

} // namespace xtoc

#endif // XTOC_RECORD_BUFFER_HPP
