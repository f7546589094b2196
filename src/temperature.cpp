// ============================================================================
// temperature.cpp: implementation for tp90x/temperature.hpp
// ============================================================================

#include "tp90x/temperature.hpp"

namespace tp90x {

Status decode_temperature(const uint8_t* raw, Temperature& out) {
  if (!raw) return Status::InvalidArgument;

  const uint8_t hi = raw[0];
  const uint8_t lo = raw[1];

  // Sentinel first: FF FF would otherwise read as a negative, invalid BCD value.
  if (hi == TEMP_ABSENT_BYTE && lo == TEMP_ABSENT_BYTE) {
    out = Temperature::absent();
    return Status::Ok;
  }

  const bool    neg      = (hi & 0x80) != 0;
  const uint8_t hundreds = (hi >> 4) & 0x07;
  const uint8_t tens     = hi & 0x0F;
  const uint8_t ones     = lo >> 4;
  const uint8_t tenth    = lo & 0x0F;

  if (tens > 9 || ones > 9 || tenth > 9) return Status::InvalidBcd;

  int v = hundreds * 1000 + tens * 100 + ones * 10 + tenth;
  if (neg) v = -v;
  out = Temperature::from_tenths(static_cast<int16_t>(v));
  return Status::Ok;
}

Status encode_temperature(const Temperature& t, uint8_t* out) {
  if (!out) return Status::InvalidArgument;

  if (t.is_absent()) {
    out[0] = TEMP_ABSENT_BYTE;
    out[1] = TEMP_ABSENT_BYTE;
    return Status::Ok;
  }

  int v = t.tenths();
  const bool neg = v < 0;
  if (neg) v = -v;
  if (v > TEMP_MAX_TENTHS) return Status::InvalidArgument;

  const uint8_t tenth    = v % 10;
  const uint8_t ones     = (v / 10) % 10;
  const uint8_t tens     = (v / 100) % 10;
  const uint8_t hundreds = (v / 1000) % 10;   // <= 7 after the range check

  out[0] = static_cast<uint8_t>((hundreds << 4) | tens);
  out[1] = static_cast<uint8_t>((ones << 4) | tenth);
  if (neg) out[0] |= 0x80;
  return Status::Ok;
}

std::string to_string(const Temperature& t) {
  if (t.is_absent()) return "---";

  int v = t.tenths();
  std::string s;
  if (v < 0) { s.push_back('-'); v = -v; }
  s += std::to_string(v / 10);
  s.push_back('.');
  s += std::to_string(v % 10);
  return s;
}

bool parse_temperature(const std::string& text, Temperature& out) {
  if (text == "---") {
    out = Temperature::absent();
    return true;
  }

  size_t i = 0;
  bool neg = false;
  if (i < text.size() && (text[i] == '-' || text[i] == '+')) neg = text[i++] == '-';

  int whole = 0, digits = 0;
  for (; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i, ++digits) {
    whole = whole * 10 + (text[i] - '0');
    if (whole > TEMP_MAX_TENTHS) return false;
  }
  if (digits == 0) return false;

  int tenth = 0;
  if (i < text.size() && text[i] == '.') {
    ++i;
    if (i >= text.size() || text[i] < '0' || text[i] > '9') return false;
    tenth = text[i++] - '0';
  }
  if (i != text.size()) return false;

  int v = whole * 10 + tenth;
  if (v > TEMP_MAX_TENTHS) return false;
  out = Temperature::from_tenths(static_cast<int16_t>(neg ? -v : v));
  return true;
}

} // namespace tp90x
