// ============================================================================
// device.cpp: model table and the Thermometer facade
// Tests: tests/test_device.cpp
// ============================================================================

#include "tp90x/device.hpp"
#include "tp90x/catalog.hpp"   // decode_inbound()
#include "tp90x/commands.hpp"
#include "tp90x/log.hpp"

#include <cctype>
#include <chrono>
#include <utility>

namespace tp90x {

// ---------------------------------------------------------------------------
// Model table
// ---------------------------------------------------------------------------

static const DeviceModel MODELS[] = {
  {"TP902", 6, SearchMode::Address, "TP902"},
  {"TP904", 2, SearchMode::Name,    "TP904"},
};

const char* to_string(SearchMode m) {
  switch (m) {
    case SearchMode::Address: return "address";
    case SearchMode::Name:    return "name";
  }
  return "unknown";
}

static bool iequals(const std::string& a, const char* b) {
  size_t i = 0;
  for (; i < a.size() && b[i]; ++i)
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return i == a.size() && b[i] == '\0';
}

const DeviceModel* find_model(const std::string& name) {
  for (const auto& m : MODELS)
    if (iequals(name, m.name)) return &m;
  return nullptr;
}

std::string model_names() {
  std::string s;
  for (const auto& m : MODELS) {
    if (!s.empty()) s += ",";
    s += m.name;
  }
  return s;
}

// ---------------------------------------------------------------------------
// Construction / discovery
// ---------------------------------------------------------------------------

Thermometer::Thermometer(const DeviceModel& model, std::unique_ptr<transport::ITransport> link,
                         DeviceOptions opts)
: model_(model),
  auth_(opts.auth ? std::move(opts.auth) : std::make_shared<FixedAuthPayload>()),
  session_(std::move(link), opts.session) {}

Status Thermometer::connect(const DeviceModel& model, Scanner& scanner, const std::string& identifier,
                            const DeviceOptions& opts, std::unique_ptr<Thermometer>& out,
                            std::optional<SearchMode> mode) {
  const SearchMode how = mode.value_or(model.default_search);
  const std::string target = identifier.empty() ? std::string(model.name_pattern) : identifier;

  std::unique_ptr<transport::ITransport> link;
  Status st = (how == SearchMode::Address) ? scanner.connect_by_address(target, link)
                                           : scanner.connect_by_name(target, link);
  if (st == Status::Ok && !link) st = Status::NotFound;
  if (st != Status::Ok) {
    log_event(LogLevel::Warn, "connect_failed",
              std::string("model=") + model.name + " search=" + to_string(how) +
              " target=" + target + " reason=" + to_string(st));
    return st;
  }

  auto dev = std::make_unique<Thermometer>(model, std::move(link), opts);
  st = dev->open();
  if (st != Status::Ok) return st;

  log_event(LogLevel::Info, "connected", std::string("model=") + model.name + " target=" + target);
  out = std::move(dev);
  return Status::Ok;
}

Status Thermometer::open() { return session_.start(); }

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Send, wait for the catalog reply, decode it.
Status Thermometer::request(const Request& r, InboundMessage& reply) {
  Frame f;
  Status st = session_.submit_request(r, f);
  if (st != Status::Ok) return st;
  return decode_inbound(f, reply);
}

Status Thermometer::check_channel(uint8_t channel) const {
  if (channel < 1 || channel > MAX_PROBES || channel > model_.probe_count) return Status::InvalidArgument;
  return Status::Ok;
}

// Typed extraction; anything else (e.g. a RawFrame) means the reply had the wrong shape.
template <typename T>
static Status take(const InboundMessage& m, T& out) {
  if (const T* v = std::get_if<T>(&m)) {
    out = *v;
    return Status::Ok;
  }
  return Status::UnexpectedPayloadLength;
}

// ---------------------------------------------------------------------------
// Solicited reads
// ---------------------------------------------------------------------------

Status Thermometer::authenticate(AuthResponse& out) {
  InboundMessage m;
  Status st = request(make_auth(auth_->generate()), m);
  if (st != Status::Ok) return st;
  return take(m, out);
}

Status Thermometer::get_status(DeviceStatus& out) {
  InboundMessage m;
  Status st = request(make_get_status(), m);
  if (st != Status::Ok) return st;
  return take(m, out);
}

Status Thermometer::get_firmware_version(FirmwareVersion& out) {
  InboundMessage m;
  Status st = request(make_get_firmware(), m);
  if (st != Status::Ok) return st;
  return take(m, out);
}

Status Thermometer::read_alarm(uint8_t channel, AlarmConfig& out) {
  Status st = check_channel(channel);
  if (st != Status::Ok) return st;

  InboundMessage m;
  st = request(make_get_alarm(channel), m);
  if (st != Status::Ok) return st;

  AlarmConfig a;
  st = take(m, a);
  if (st != Status::Ok) return st;
  if (a.channel != channel) {
    log_event(LogLevel::Warn, "alarm_channel_mismatch",
              "asked=" + std::to_string(channel) + " got=" + std::to_string(a.channel));
    return Status::UnexpectedPayloadLength;
  }
  out = a;
  return Status::Ok;
}

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------

Status Thermometer::set_units(Units u) {
  if (u != Units::Celsius && u != Units::Fahrenheit) return Status::InvalidArgument;
  return session_.submit_write(make_set_units(u));
}

Status Thermometer::set_alarm_sound(bool enabled) {
  return session_.submit_write(make_set_sound(enabled));
}

Status Thermometer::set_alarm_config(uint8_t channel, AlarmMode mode,
                                     const Temperature& primary, const Temperature& secondary) {
  Status st = check_channel(channel);
  if (st != Status::Ok) return st;

  AlarmConfig cfg;
  cfg.channel   = channel;
  cfg.mode      = mode;
  cfg.primary   = primary;
  cfg.secondary = secondary;

  Request r;
  st = make_set_alarm(cfg, r);
  if (st != Status::Ok) return st;
  return session_.submit_write(r);
}

Status Thermometer::sync_time(uint32_t seconds_since_2020) {
  return session_.submit_write(make_time_sync(seconds_since_2020));
}

Status Thermometer::sync_time_now() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const int64_t unix_s = std::chrono::duration_cast<std::chrono::seconds>(now).count();
  return sync_time(seconds_since_2020(unix_s));
}

Status Thermometer::snooze_alarm() { return session_.submit_write(make_snooze()); }

Status Thermometer::backlight_on() { return session_.submit_write(make_backlight_on()); }

} // namespace tp90x
