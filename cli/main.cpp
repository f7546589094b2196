/**
 * @file main.cpp
 * @brief tp90x-cli: offline frame tool for TP902/TP904 thermometers.
 *
 * Responsibilities:
 *  - Build the exact request frame for one command, ready to paste into a
 *    generic GATT tool as a write to the thermometer's write characteristic.
 *  - Decode notifications captured from the notify characteristic into the
 *    same describe() lines the engine logs.
 *  - List the command catalog and the GATT identity.
 *  - Parse CLI options (CLI11); merge them over the JSON config (CLI wins).
 *  - Report failures as `status=error reason=<why>` on stderr.
 *
 * No BLE link is opened here. Connecting is left to the platform (see
 * tp90x::Scanner).
 *
 * Exit codes:
 *  0 ok, 2 usage/config error, 4 a frame failed to build or decode.
 *
 * Examples:
 *  tp90x-cli status
 *  tp90x-cli --model tp904 alarm-set 1 range 80 60
 *  tp90x-cli decode "30 07 32 0c 00 02 15 ff ff 8a 00 00"
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"

#include "tp90x/auth.hpp"
#include "tp90x/catalog.hpp"
#include "tp90x/commands.hpp"
#include "tp90x/config.hpp"
#include "tp90x/device.hpp"
#include "tp90x/frame.hpp"
#include "tp90x/log.hpp"
#include "tp90x/messages.hpp"
#include "tp90x/temperature.hpp"

using namespace tp90x;

// ---------- small utilities ----------

enum ExitCode : int {
  EXIT_OK       = 0,
  EXIT_USAGE    = 2,
  EXIT_PROTOCOL = 4
};

static int fail(const std::string& reason, int code) {
  std::cerr << "status=error reason=" << reason << "\n";
  return code;
}

static bool parse_mode(const std::string& s, AlarmMode& out) {
  if (s == "off")    { out = AlarmMode::Off;    return true; }
  if (s == "target") { out = AlarmMode::Target; return true; }
  if (s == "range")  { out = AlarmMode::Range;  return true; }
  return false;
}

static std::string lengths(const LengthSet& l) {
  if (l.count == 0) return "-";
  std::string s = std::to_string(l.v[0]);
  if (l.count > 1) s += "|" + std::to_string(l.v[1]);
  return s;
}

static const char* direction(const CommandDescriptor& d) {
  if (d.outbound() && d.inbound()) return "both";
  return d.outbound() ? "out" : "in";
}

// One request -> "op=.. name=.. frame=.." on stdout.
static int print_request(const Request& r) {
  Status st = validate_outbound(r.opcode, r.payload.size());
  WireBytes wire;
  if (st == Status::Ok) st = encode_frame(r.opcode, r.payload, wire);
  if (st != Status::Ok) return fail(std::string(to_string(st)) + " op=" + hex_byte(r.opcode), EXIT_PROTOCOL);

  const CommandDescriptor* d = find_command(r.opcode);
  std::cout << "op=" << hex_byte(r.opcode) << " name=" << (d ? d->name : "-")
            << " frame=" << format_hex(wire);
  if (d && d->has_response) std::cout << " reply=" << hex_byte(d->response_opcode);
  std::cout << "\n";
  return EXIT_OK;
}

// One captured notification -> describe() line on stdout.
static bool print_notification(const std::string& text) {
  WireBytes raw;
  std::string why;
  if (!parse_hex(text, raw, why)) {
    std::cerr << "status=error reason=" << why << " input=\"" << text << "\"\n";
    return false;
  }

  Frame f;
  Status st = decode_frame(raw, f);
  InboundMessage m;
  if (st == Status::Ok) st = decode_inbound(f, m);
  if (st != Status::Ok) {
    std::cerr << "status=error reason=" << to_string(st) << " input=\"" << text << "\"\n";
    return false;
  }
  std::cout << describe(m) << "\n";
  return true;
}

// ---------- main ----------

int main(int argc, char** argv) {
  // Global options
  std::string opt_config;
  std::string opt_model;
  bool        opt_verbose = false;

  CLI::App app{"TP902/TP904 frame tool: build request frames, decode notifications"};
  app.require_subcommand(1);

  app.add_option("--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/tp90x/config.json)");
  auto* o_model = app.add_option("--model", opt_model, "Thermometer model: " + model_names());
  app.add_flag("-v,--verbose", opt_verbose, "Debug logging on stderr");

  // Request builders
  auto* c_auth   = app.add_subcommand("auth", "Handshake frame (config auth_payload, else the captured one)");
  auto* c_status = app.add_subcommand("status", "Units, beeper and battery request");
  auto* c_fw     = app.add_subcommand("fw", "Firmware version request");

  int alarm_ch = 1;
  auto* c_alarm_get = app.add_subcommand("alarm-get", "Read one probe's alarm");
  c_alarm_get->add_option("channel", alarm_ch, "Probe channel (1..N)")->required();

  std::string alarm_mode, alarm_primary = "---", alarm_secondary = "---";
  auto* c_alarm_set = app.add_subcommand("alarm-set", "Configure one probe's alarm");
  c_alarm_set->add_option("channel", alarm_ch, "Probe channel (1..N)")->required();
  c_alarm_set->add_option("mode", alarm_mode, "off|target|range")->required()
             ->check(CLI::IsMember({"off", "target", "range"}));
  c_alarm_set->add_option("primary", alarm_primary, "Target, or range high (e.g. 63.5)");
  c_alarm_set->add_option("secondary", alarm_secondary, "Range low");

  std::string units;
  auto* c_units = app.add_subcommand("units", "Display units");
  c_units->add_option("unit", units, "c|f")->required()->check(CLI::IsMember({"c", "f", "C", "F"}));

  std::string sound;
  auto* c_sound = app.add_subcommand("sound", "Alarm sound");
  c_sound->add_option("state", sound, "on|off")->required()->check(CLI::IsMember({"on", "off"}));

  uint32_t epoch2020 = 0;
  auto* c_time = app.add_subcommand("time-sync", "Set the device clock (default: now)");
  auto* o_epoch = c_time->add_option("--epoch2020", epoch2020, "Seconds since 2020-01-01T00:00:00Z");

  auto* c_snooze    = app.add_subcommand("snooze", "Silence a sounding alarm");
  auto* c_backlight = app.add_subcommand("backlight", "Light the display");

  // Inspection
  std::vector<std::string> captured;
  auto* c_decode = app.add_subcommand("decode", "Decode captured notifications, one hex string each");
  c_decode->add_option("hex", captured, "e.g. \"26 05 0c 0c 50 00 00 93\"")->required();

  auto* c_catalog = app.add_subcommand("catalog", "List known opcodes and the GATT UUIDs");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  // Config file, then CLI overrides
  Config cfg;
  std::string reason;
  const std::string cfg_path = opt_config.empty() ? default_config_path() : opt_config;
  if (!opt_config.empty() && !std::filesystem::exists(opt_config))
    return fail("config_not_found path=" + opt_config, EXIT_USAGE);
  if (!load_config(cfg_path, cfg, reason)) return fail("bad_config " + reason, EXIT_USAGE);

  if (*o_model) cfg.model = opt_model;
  set_log_level(opt_verbose ? LogLevel::Debug : cfg.log_level);

  const DeviceModel* model = find_model(cfg.model);
  if (!model) return fail("unknown_model model=" + cfg.model, EXIT_USAGE);

  if ((c_alarm_get->parsed() || c_alarm_set->parsed()) && (alarm_ch < 1 || alarm_ch > model->probe_count))
    return fail("bad_channel channel=" + std::to_string(alarm_ch) + " probes=" + std::to_string(model->probe_count), EXIT_USAGE);

  // Run exactly one subcommand
  if (c_auth->parsed()) {
    return print_request(make_auth(cfg.auth_payload ? *cfg.auth_payload : KNOWN_AUTH_PAYLOAD));
  }
  if (c_status->parsed())    return print_request(make_get_status());
  if (c_fw->parsed())        return print_request(make_get_firmware());
  if (c_alarm_get->parsed()) return print_request(make_get_alarm(static_cast<uint8_t>(alarm_ch)));
  if (c_alarm_set->parsed()) {
    AlarmConfig a;
    a.channel = static_cast<uint8_t>(alarm_ch);
    if (!parse_mode(alarm_mode, a.mode)) return fail("bad_mode mode=" + alarm_mode, EXIT_USAGE);
    if (!parse_temperature(alarm_primary, a.primary))     return fail("bad_temperature value=" + alarm_primary, EXIT_USAGE);
    if (!parse_temperature(alarm_secondary, a.secondary)) return fail("bad_temperature value=" + alarm_secondary, EXIT_USAGE);

    Request r;
    Status st = make_set_alarm(a, r);
    if (st != Status::Ok) return fail(std::string(to_string(st)) + " step=alarm_set", EXIT_USAGE);
    return print_request(r);
  }
  if (c_units->parsed())
    return print_request(make_set_units(units == "f" || units == "F" ? Units::Fahrenheit : Units::Celsius));
  if (c_sound->parsed()) return print_request(make_set_sound(sound == "on"));
  if (c_time->parsed()) {
    if (*o_epoch) return print_request(make_time_sync(epoch2020));
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return print_request(make_time_sync(
        seconds_since_2020(std::chrono::duration_cast<std::chrono::seconds>(now).count())));
  }
  if (c_snooze->parsed())    return print_request(make_snooze());
  if (c_backlight->parsed()) return print_request(make_backlight_on());

  if (c_decode->parsed()) {
    size_t failed = 0;
    for (const auto& text : captured)
      if (!print_notification(text)) ++failed;
    return failed ? EXIT_PROTOCOL : EXIT_OK;
  }

  if (c_catalog->parsed()) {
    std::cout << "model=" << model->name << " probes=" << int(model->probe_count)
              << " search=" << to_string(model->default_search) << "\n";
    std::cout << "service=" << SERVICE_UUID << " write=" << WRITE_UUID << " notify=" << NOTIFY_UUID << "\n";
    for (int op = 0; op <= 0xFF; ++op) {
      const CommandDescriptor* d = find_command(static_cast<uint8_t>(op));
      if (!d) continue;
      std::cout << "op=" << hex_byte(d->opcode) << " name=" << d->name << " dir=" << direction(*d)
                << " out_len=" << lengths(d->out_len) << " in_len=" << lengths(d->in_len);
      if (d->has_response) std::cout << " reply=" << hex_byte(d->response_opcode);
      std::cout << "\n";
    }
  }
  return EXIT_OK;
}
