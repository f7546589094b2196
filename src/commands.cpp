#include "tp90x/commands.hpp"   // builders, opcodes and the Request type

namespace tp90x {

// ============================================================================
// Low-level helpers
// ============================================================================

static inline Request header(uint8_t opcode) {
  Request r;
  r.opcode = opcode;
  return r;
}

static inline void add_u8(Request& r, uint8_t v) { r.payload.push_back(v); }

static inline void add_u32_le(Request& r, uint32_t v) {
  r.payload.push_back(static_cast<uint8_t>(v & 0xFF));          // low byte first
  r.payload.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  r.payload.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  r.payload.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

static inline Status add_temp(Request& r, const Temperature& t) {
  uint8_t b[2];
  Status st = encode_temperature(t, b);
  if (st != Status::Ok) return st;
  r.payload.push_back(b[0]);
  r.payload.push_back(b[1]);
  return Status::Ok;
}

// ============================================================================
// Builders
// ============================================================================

Request make_auth(const AuthPayload& bytes) {
  auto r = header(OP_AUTH);
  r.payload.assign(bytes.begin(), bytes.end());
  return r;
}

Request make_backlight_on() { return header(OP_BACKLIGHT_ON); }

Request make_set_units(Units u) {
  auto r = header(OP_SET_UNITS);
  add_u8(r, u == Units::Fahrenheit ? FLAG_OFF : FLAG_ON);   // same two bytes as on/off
  return r;
}

Request make_set_sound(bool enabled) {
  auto r = header(OP_SET_SOUND);
  add_u8(r, enabled ? FLAG_ON : FLAG_OFF);
  return r;
}

// ---------------------------------------------------------------------------
// make_set_alarm()
// Temperatures are encoded per mode; see the header for the exact bytes.
// ---------------------------------------------------------------------------
Status make_set_alarm(const AlarmConfig& cfg, Request& out) {
  if (cfg.channel < 1 || cfg.channel > MAX_PROBES) return Status::InvalidArgument;

  auto r = header(OP_SET_ALARM);
  add_u8(r, cfg.channel);
  add_u8(r, static_cast<uint8_t>(cfg.mode));

  Status st = Status::Ok;
  switch (cfg.mode) {
    case AlarmMode::Off:
      st = add_temp(r, Temperature::absent());
      if (st == Status::Ok) st = add_temp(r, Temperature::absent());
      break;

    case AlarmMode::Target:
      if (cfg.primary.is_absent()) return Status::InvalidArgument;
      st = add_temp(r, cfg.primary);
      add_u8(r, 0x00);
      add_u8(r, 0x00);
      break;

    case AlarmMode::Range:
      if (cfg.primary.is_absent() || cfg.secondary.is_absent()) return Status::InvalidArgument;
      st = add_temp(r, cfg.primary);
      if (st == Status::Ok) st = add_temp(r, cfg.secondary);
      break;

    default:
      return Status::InvalidArgument;
  }
  if (st != Status::Ok) return st;

  out = r;
  return Status::Ok;
}

Request make_get_alarm(uint8_t channel) {
  auto r = header(OP_GET_ALARM);
  add_u8(r, channel);
  return r;
}

Request make_get_status()   { return header(OP_STATUS); }
Request make_snooze()       { return header(OP_SNOOZE); }
Request make_get_firmware() { return header(OP_FIRMWARE); }

Request make_time_sync(uint32_t seconds_since_2020) {
  auto r = header(OP_TIME_SYNC);
  add_u32_le(r, seconds_since_2020);
  return r;
}

uint32_t seconds_since_2020(int64_t unix_seconds) {
  if (unix_seconds <= EPOCH_2020_UNIX) return 0;
  const int64_t d = unix_seconds - EPOCH_2020_UNIX;
  return d > 0xFFFFFFFFll ? 0xFFFFFFFFu : static_cast<uint32_t>(d);
}

} // namespace tp90x
