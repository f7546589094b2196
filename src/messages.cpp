// ============================================================================
// messages.cpp: string renderings for tp90x/messages.hpp
// Output is lossy on purpose: key=value lines for logs and shell pipelines.
// ============================================================================

#include "tp90x/messages.hpp"
#include "tp90x/log.hpp"     // hex_byte()

#include <iomanip>           // std::setw, std::setfill, std::hex for byte dumps
#include <sstream>

namespace tp90x {

namespace {

void append_hex(std::ostringstream& os, const uint8_t* p, size_t n) {
  std::ios_base::fmtflags f0 = os.flags();
  char fill0 = os.fill();
  for (size_t i = 0; i < n; ++i)
    os << std::hex << std::setw(2) << std::setfill('0') << unsigned(p[i]);
  os.flags(f0);
  os.fill(fill0);
}

// Known members print their name; anything else the device sent prints as hex.
std::string units_text(Units u) {
  if (u == Units::Celsius || u == Units::Fahrenheit) return to_string(u);
  return hex_byte(static_cast<uint8_t>(u));
}

std::string mode_text(AlarmMode m) {
  if (m == AlarmMode::Off || m == AlarmMode::Target || m == AlarmMode::Range) return to_string(m);
  return hex_byte(static_cast<uint8_t>(m));
}

void append_probes(std::ostringstream& os, const ProbeList& temps) {
  for (size_t i = 0; i < temps.size(); ++i)
    os << " t" << (i + 1) << "=" << to_string(temps[i]);
}

// One overload per variant alternative; std::visit picks the right one.
struct Describer {
  std::ostringstream& os;

  void operator()(const AuthResponse& a) const {
    os << "type=auth device_type=" << hex_byte(a.device_type_hint)
       << " probes=" << unsigned(a.probe_count_hint);
  }

  void operator()(const DeviceStatus& s) const {
    os << "type=status units=" << units_text(s.units)
       << " beeper=" << (s.beeper_enabled ? "on" : "off")
       << " battery=" << unsigned(s.battery_percent);
  }

  void operator()(const AlarmConfig& a) const {
    os << "type=alarm ch=" << unsigned(a.channel) << " mode=" << mode_text(a.mode);
    if (a.mode == AlarmMode::Target) {
      os << " target=" << to_string(a.primary);
    } else if (a.mode == AlarmMode::Range) {
      os << " low=" << to_string(a.secondary) << " high=" << to_string(a.primary);
    } else if (a.mode != AlarmMode::Off) {
      os << " v1=" << to_string(a.primary) << " v2=" << to_string(a.secondary);
    }
  }

  void operator()(const TemperatureSnapshot& t) const {
    os << "type=snapshot probes=" << unsigned(t.probe_count)
       << " alarm=" << hex_byte(t.alarm_flags);
    append_probes(os, t.temps);
  }

  void operator()(const TemperatureBroadcast& b) const {
    os << "type=broadcast battery=" << unsigned(b.battery_percent)
       << " units=" << units_text(b.units)
       << " alarm=" << hex_byte(b.alarm_flags);
    append_probes(os, b.temps);
  }

  void operator()(const FirmwareVersion& f) const {
    os << "type=firmware version=" << f.to_string();
  }

  void operator()(const RawFrame& r) const {
    os << "type=raw op=" << hex_byte(r.opcode) << " len=" << r.payload.size();
    if (!r.payload.empty()) {
      os << " data=";
      append_hex(os, r.payload.data(), r.payload.size());
    }
  }
};

} // namespace

std::string FirmwareVersion::to_string() const {
  std::ostringstream os;
  os << unsigned(major) << "." << unsigned(minor) << ".";
  append_hex(os, &build_info[0], 1);
  os << ".";
  append_hex(os, &build_info[1], 1);
  return os.str();
}

const char* to_string(Units u) {
  switch (u) {
    case Units::Celsius:    return "C";
    case Units::Fahrenheit: return "F";
  }
  return "?";
}

const char* to_string(AlarmMode m) {
  switch (m) {
    case AlarmMode::Off:    return "off";
    case AlarmMode::Target: return "target";
    case AlarmMode::Range:  return "range";
  }
  return "unknown";
}

std::string describe(const InboundMessage& m) {
  std::ostringstream os;
  std::visit(Describer{os}, m);
  return os.str();
}

} // namespace tp90x
