#include "tp90x/auth.hpp"

#include "tp90x/frame.hpp"   // parse_hex()

namespace tp90x {

bool parse_auth_hex(const std::string& text, AuthPayload& out, std::string& reason) {
  WireBytes bytes;
  if (!parse_hex(text, bytes, reason)) return false;
  if (bytes.size() != AUTH_PAYLOAD_LEN) {
    reason = "expected_9_bytes_got_" + std::to_string(bytes.size());
    return false;
  }

  for (size_t i = 0; i < AUTH_PAYLOAD_LEN; ++i) out[i] = bytes[i];
  return true;
}

} // namespace tp90x
