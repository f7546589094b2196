// ============================================================================
// frame.cpp: implementation for tp90x/frame.hpp
// For the wire diagram see the header. Tests: tests/test_frame.cpp
// ============================================================================

#include "tp90x/frame.hpp"

namespace tp90x {

uint8_t frame_checksum(uint8_t opcode, const uint8_t* payload, size_t len) {
  uint32_t sum = opcode;                        // 32-bit accumulator, masked once at the end
  sum += static_cast<uint32_t>(len);
  for (size_t i = 0; i < len; ++i) sum += payload[i];
  return static_cast<uint8_t>(sum & 0xFF);
}

// ---------------------------------------------------------------------------
// encode_frame()
// Layout: [opcode][len][payload...][checksum]
// ---------------------------------------------------------------------------
Status encode_frame(uint8_t opcode, const uint8_t* data, size_t len, WireBytes& out) {
  out.clear();
  if (len > MAX_PAYLOAD) return Status::PayloadTooLarge;
  if (len && !data)      return Status::InvalidArgument;

  out.reserve(len + MIN_FRAME);
  out.push_back(opcode);
  out.push_back(static_cast<uint8_t>(len));
  if (len) out.insert(out.end(), data, data + len);
  out.push_back(frame_checksum(opcode, data, len));
  return Status::Ok;
}

// ---------------------------------------------------------------------------
// decode_frame()
// - header first, so a padded 20-byte notification with a short frame parses
// - bytes past the checksum are padding and stay untouched
// ---------------------------------------------------------------------------
Status decode_frame(const uint8_t* raw, size_t n, Frame& out) {
  if (!raw || n < MIN_FRAME) return Status::TooShort;

  const uint8_t opcode = raw[0];
  const size_t  len    = raw[1];
  if (n < MIN_FRAME + len) return Status::TooShort;

  const uint8_t* body = raw + 2;
  const uint8_t  got  = raw[2 + len];
  if (frame_checksum(opcode, body, len) != got) return Status::ChecksumMismatch;

  out.opcode = opcode;
  out.payload.assign(body, body + len);
  out.checksum = got;
  return Status::Ok;
}

// ---------------------------------------------------------------------------
// Hex text <-> bytes
// ---------------------------------------------------------------------------
static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parse_hex(const std::string& text, WireBytes& out, std::string& reason) {
  out.clear();
  int hi = -1;

  for (char c : text) {
    if (c == ' ' || c == ':' || c == '-') {
      if (hi >= 0) { reason = "split_byte"; out.clear(); return false; }
      continue;
    }
    int v = hex_value(c);
    if (v < 0) { reason = "bad_hex_digit"; out.clear(); return false; }
    if (hi < 0) {
      hi = v;
    } else {
      out.push_back(static_cast<uint8_t>((hi << 4) | v));
      hi = -1;
    }
  }

  if (hi >= 0) { reason = "odd_digit_count"; out.clear(); return false; }
  return true;
}

std::string format_hex(const uint8_t* data, size_t len) {
  static const char* HEX = "0123456789abcdef";
  std::string s;
  s.reserve(len * 3);
  for (size_t i = 0; i < len; ++i) {
    if (i) s.push_back(' ');
    s.push_back(HEX[data[i] >> 4]);
    s.push_back(HEX[data[i] & 0x0F]);
  }
  return s;
}

} // namespace tp90x
