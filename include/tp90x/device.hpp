#pragma once
/**
 * @page tp90x-device TP90x Device Facade
 * @file device.hpp
 * @brief Thermometer: the public, model-aware API on top of one Session.
 *
 * @details
 * PURPOSE
 * -------
 * One call per thing a user can do with the thermometer. Each call builds a
 * Request (commands.hpp), pushes it through the Session and hands back a typed
 * value. Callers never see opcodes.
 *
 * MODELS
 * ------
 * TP902 and TP904 share the frame grammar and the opcode set. They differ in:
 *   - probe count (6 vs 2), which bounds alarm channels and payload lengths
 *   - how they are found: TP902 by fixed address, TP904 by advertised name
 * The model table is closed (find_model()). Either search mode works for either
 * model; the table only picks the default.
 *
 * DISCOVERY
 * ---------
 * BLE scanning and connecting belong to the platform. The facade only asks a
 * Scanner for a connected transport:
 * @code
 *   MyBleScanner scanner;                       // implements tp90x::Scanner
 *   std::unique_ptr<tp90x::Thermometer> dev;
 *   auto st = tp90x::Thermometer::connect(*tp90x::find_model("tp904"), scanner, "TP904", {}, dev);
 *   if (st == tp90x::Status::Ok) {
 *     tp90x::AuthResponse a;
 *     dev->authenticate(a);
 *     tp90x::DeviceStatus s;
 *     dev->get_status(s);
 *   }
 * @endcode
 *
 * WRITES
 * ------
 * set_units, set_alarm_sound, set_alarm_config, sync_time, snooze_alarm and
 * backlight_on have no reply opcode. They return Ok once the write went out
 * and no failure showed up within the write grace window (SessionConfig).
 *
 * @author Leo
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "tp90x/auth.hpp"
#include "tp90x/messages.hpp"
#include "tp90x/session.hpp"
#include "tp90x/status.hpp"
#include "tp90x/transport/transport_base.hpp"

namespace tp90x {

enum class SearchMode : uint8_t { Address, Name };

const char* to_string(SearchMode m);

/// One row of the closed model table.
struct DeviceModel {
  const char* name;                 ///< "TP902"
  uint8_t     probe_count;
  SearchMode  default_search;
  const char* name_pattern;         ///< advertised-name pattern for SearchMode::Name
};

/// Case-insensitive lookup ("tp902", "TP904"). nullptr if unknown.
const DeviceModel* find_model(const std::string& name);

/// Comma-separated model names, for help text.
std::string model_names();

/**
 * @class Scanner
 * @brief The platform BLE collaborator: find a thermometer, hand back a live link.
 *
 * Implementations return NotFound when nothing matches, TransportError when the
 * adapter fails. On Ok, @p out holds a connected transport whose notify
 * subscription is already active.
 */
class Scanner {
public:
  virtual ~Scanner() = default;
  virtual Status connect_by_address(const std::string& address,
                                    std::unique_ptr<transport::ITransport>& out) = 0;
  virtual Status connect_by_name(const std::string& name_pattern,
                                 std::unique_ptr<transport::ITransport>& out) = 0;
};

struct DeviceOptions {
  SessionConfig                         session;
  std::shared_ptr<AuthPayloadGenerator> auth;      ///< nullptr -> FixedAuthPayload
};

class Thermometer {
public:
  /// Wrap an already connected transport. Call open() before anything else.
  Thermometer(const DeviceModel& model, std::unique_ptr<transport::ITransport> link,
              DeviceOptions opts = {});

  /**
   * @brief Find, connect and open in one step.
   *
   * @param identifier  address (SearchMode::Address) or name pattern
   *                    (SearchMode::Name); empty means the model's own pattern
   * @param mode        overrides the model's default search mode
   */
  static Status connect(const DeviceModel& model, Scanner& scanner, const std::string& identifier,
                        const DeviceOptions& opts, std::unique_ptr<Thermometer>& out,
                        std::optional<SearchMode> mode = std::nullopt);

  /// Start the session (receive thread).
  Status open();

  Status authenticate(AuthResponse& out);
  Status get_status(DeviceStatus& out);
  Status get_firmware_version(FirmwareVersion& out);

  /// @p channel must be 1..probe_count; a reply for another channel is rejected.
  Status read_alarm(uint8_t channel, AlarmConfig& out);

  Status set_units(Units u);
  Status set_alarm_sound(bool enabled);

  /// Target uses @p primary; Range uses @p primary as high and @p secondary as low.
  Status set_alarm_config(uint8_t channel, AlarmMode mode,
                          const Temperature& primary = Temperature::absent(),
                          const Temperature& secondary = Temperature::absent());

  Status sync_time(uint32_t seconds_since_2020);
  Status sync_time_now();
  Status snooze_alarm();
  Status backlight_on();

  BroadcastStream subscribe_broadcasts() const { return session_.broadcasts(); }

  void disconnect() { session_.close(); }

  const DeviceModel& model() const { return model_; }
  SessionState state() const { return session_.state(); }

private:
  Status request(const Request& r, InboundMessage& reply);
  Status check_channel(uint8_t channel) const;

  const DeviceModel&                    model_;
  std::shared_ptr<AuthPayloadGenerator> auth_;
  Session                               session_;
};

} // namespace tp90x
