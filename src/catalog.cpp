// ============================================================================
// catalog.cpp: the opcode table and its payload decoders
// Table overview lives in include/tp90x/catalog.hpp. Tests: tests/test_catalog.cpp
// ============================================================================

#include "tp90x/catalog.hpp"
#include "tp90x/commands.hpp"   // opcode names

#include "etl/flat_map.h"

namespace tp90x {

// ============================================================================
// Payload decoders (lengths are already checked by decode_inbound)
// ============================================================================

static Status decode_probes(const uint8_t* p, size_t count, ProbeList& out) {
  out.clear();
  for (size_t i = 0; i < count; ++i) {
    Temperature t;
    Status st = decode_temperature(p + i * 2, t);
    if (st != Status::Ok) return st;
    out.push_back(t);
  }
  return Status::Ok;
}

static Status decode_raw(uint8_t opcode, const Payload& p, InboundMessage& out) {
  RawFrame r;
  r.opcode  = opcode;
  r.payload = p;
  out = r;
  return Status::Ok;
}

static Status decode_auth(const Payload& p, InboundMessage& out) {
  AuthResponse a;
  a.device_type_hint = p[0];
  a.probe_count_hint = p[1];
  out = a;
  return Status::Ok;
}

// [units][beeper][battery][?][?]
static Status decode_status(const Payload& p, InboundMessage& out) {
  DeviceStatus s;
  s.units           = static_cast<Units>(p[0]);
  s.beeper_enabled  = p[1] == FLAG_ON;
  s.battery_percent = p[2];
  out = s;
  return Status::Ok;
}

// [channel][mode][primary x2][secondary x2]
static Status decode_alarm(const Payload& p, InboundMessage& out) {
  const uint8_t ch = p[0];
  if (ch < 1 || ch > MAX_PROBES) return decode_raw(OP_GET_ALARM, p, out);  // keep the bytes

  AlarmConfig a;
  a.channel = ch;
  a.mode    = static_cast<AlarmMode>(p[1]);
  Status st = decode_temperature(&p[2], a.primary);
  if (st == Status::Ok) st = decode_temperature(&p[4], a.secondary);
  if (st != Status::Ok) return st;
  out = a;
  return Status::Ok;
}

// [probe count][alarm flags][N x temperature]
static Status decode_snapshot(const Payload& p, InboundMessage& out) {
  TemperatureSnapshot t;
  t.probe_count = p[0];
  t.alarm_flags = p[1];
  Status st = decode_probes(&p[2], (p.size() - 2) / 2, t.temps);
  if (st != Status::Ok) return st;
  out = t;
  return Status::Ok;
}

// [battery][units][alarm flags][N x temperature]
static Status decode_broadcast(const Payload& p, InboundMessage& out) {
  TemperatureBroadcast b;
  b.battery_percent = p[0];
  b.units           = static_cast<Units>(p[1]);
  b.alarm_flags     = p[2];
  Status st = decode_probes(&p[3], (p.size() - 3) / 2, b.temps);
  if (st != Status::Ok) return st;
  out = b;
  return Status::Ok;
}

// [major<<4 | minor][build][build]
static Status decode_firmware(const Payload& p, InboundMessage& out) {
  FirmwareVersion f;
  f.major         = p[0] >> 4;
  f.minor         = p[0] & 0x0F;
  f.build_info[0] = p[1];
  f.build_info[1] = p[2];
  out = f;
  return Status::Ok;
}

// Unclassified rows: shape is known, meaning is not.
static Status decode_opaque(const Payload& p, InboundMessage& out) {
  return decode_raw(0, p, out);   // opcode patched in decode_inbound
}

// ============================================================================
// Table
// ============================================================================

static LengthSet none()                   { return LengthSet{}; }
static LengthSet len(uint8_t a)           { return LengthSet{1, {a, 0}}; }
static LengthSet len(uint8_t a, uint8_t b){ return LengthSet{2, {a, b}}; }

static CommandDescriptor row(uint8_t op, const char* name, uint8_t dirs,
                             LengthSet out_len, LengthSet in_len,
                             PayloadDecoder decode,
                             bool has_response = false, uint8_t response = 0) {
  CommandDescriptor d;
  d.opcode          = op;
  d.name            = name;
  d.directions      = dirs;
  d.out_len         = out_len;
  d.in_len          = in_len;
  d.has_response    = has_response;
  d.response_opcode = response;
  d.decode          = decode;
  return d;
}

using CatalogMap = etl::flat_map<uint8_t, CommandDescriptor, 24>;

// Built once (thread-safe static init), read-only afterwards.
static const CatalogMap& catalog() {
  static const CatalogMap table = [] {
    CatalogMap m;
    auto put = [&m](const CommandDescriptor& d) { m.insert(std::make_pair(d.opcode, d)); };

    put(row(OP_AUTH,           "auth",           DIR_OUT | DIR_IN, len(9),  len(2),      decode_auth,      true, OP_AUTH));
    put(row(OP_BACKLIGHT_ON,   "backlight_on",   DIR_OUT | DIR_IN, len(0),  len(0),      decode_opaque));
    put(row(OP_UNKNOWN_03,     "unknown_03",     DIR_IN,           none(),  len(1),      decode_opaque));
    put(row(OP_SET_UNITS,      "set_units",      DIR_OUT,          len(1),  none(),      nullptr));
    put(row(OP_SET_SOUND,      "set_sound",      DIR_OUT,          len(1),  none(),      nullptr));
    put(row(OP_SET_ALARM,      "set_alarm",      DIR_OUT,          len(6),  none(),      nullptr));
    put(row(OP_GET_ALARM,      "alarm",          DIR_OUT | DIR_IN, len(1),  len(6),      decode_alarm,     true, OP_GET_ALARM));
    put(row(OP_TEMP_SNAPSHOT,  "temp_snapshot",  DIR_IN,           none(),  len(14, 6),  decode_snapshot));
    put(row(OP_STATUS,         "status",         DIR_OUT | DIR_IN, len(0),  len(5),      decode_status,    true, OP_STATUS));
    put(row(OP_SNOOZE,         "snooze",         DIR_OUT,          len(0),  none(),      nullptr));
    put(row(OP_TIME_SYNC,      "time_sync",      DIR_OUT,          len(4),  none(),      nullptr));
    put(row(OP_UNKNOWN_29,     "unknown_29",     DIR_IN,           none(),  len(9),      decode_opaque));
    put(row(OP_TEMP_BROADCAST, "temp_broadcast", DIR_IN,           none(),  len(15, 7),  decode_broadcast));
    put(row(OP_FIRMWARE,       "firmware",       DIR_OUT | DIR_IN, len(0),  len(3),      decode_firmware,  true, OP_FIRMWARE));
    put(row(OP_UNKNOWN_42,     "unknown_42",     DIR_IN,           none(),  len(1),      decode_opaque));
    put(row(OP_DEVICE_ERROR,   "device_error",   DIR_IN,           none(),  len(2),      decode_opaque));
    return m;
  }();
  return table;
}

// ============================================================================
// Public API
// ============================================================================

const CommandDescriptor* find_command(uint8_t opcode) {
  const CatalogMap& m = catalog();
  auto it = m.find(opcode);
  return it == m.end() ? nullptr : &it->second;
}

size_t catalog_size() { return catalog().size(); }

Status validate_outbound(uint8_t opcode, size_t payload_len) {
  const CommandDescriptor* d = find_command(opcode);
  if (!d || !d->outbound())          return Status::InvalidArgument;
  if (!d->out_len.contains(payload_len)) return Status::UnexpectedPayloadLength;
  return Status::Ok;
}

Status decode_inbound(const Frame& f, InboundMessage& out) {
  const CommandDescriptor* d = find_command(f.opcode);

  // Unknown opcode, or one we only ever send: keep the bytes, never fail.
  if (!d || !d->inbound() || !d->decode) return decode_raw(f.opcode, f.payload, out);

  if (!d->in_len.contains(f.payload.size())) return Status::UnexpectedPayloadLength;

  Status st = d->decode(f.payload, out);
  if (st == Status::Ok) {
    if (auto* raw = std::get_if<RawFrame>(&out)) raw->opcode = f.opcode;
  }
  return st;
}

} // namespace tp90x
