#pragma once
/**
 * @file messages.hpp
 * @brief Decoded values the engine hands to callers.
 *
 * @details
 * These are immutable snapshots. Nothing here accumulates history: each
 * broadcast supersedes the previous one, each status read supersedes the last.
 *
 * Byte values shared with the wire:
 *  - Units:       0x0c = Celsius, 0x0f = Fahrenheit
 *  - On/off flag: 0x0c = on,      0x0f = off  (beeper, alarm sound)
 *  - AlarmMode:   0x00 = Off, 0x0a = Target, 0x82 = Range
 *
 * Units and AlarmMode keep the raw byte as their underlying value, so an
 * unexpected byte from the device survives decoding and shows up in describe()
 * as hex instead of being coerced to a known member.
 */

#include <array>
#include <cstdint>
#include <string>
#include <variant>

#include "etl/vector.h"
#include "tp90x/frame.hpp"
#include "tp90x/temperature.hpp"

namespace tp90x {

static constexpr size_t  MAX_PROBES = 6;
static constexpr uint8_t FLAG_ON    = 0x0C;
static constexpr uint8_t FLAG_OFF   = 0x0F;

enum class Units : uint8_t { Celsius = 0x0C, Fahrenheit = 0x0F };
enum class AlarmMode : uint8_t { Off = 0x00, Target = 0x0A, Range = 0x82 };

using ProbeList = etl::vector<Temperature, MAX_PROBES>;

/// 0x01 reply. Field meaning is a best guess from captures.
struct AuthResponse {
  uint8_t device_type_hint{0};
  uint8_t probe_count_hint{0};
};

/// 0x26 reply.
struct DeviceStatus {
  Units   units{Units::Celsius};
  bool    beeper_enabled{false};
  uint8_t battery_percent{0};
};

/// 0x30 notification, streamed by the device on its own schedule.
struct TemperatureBroadcast {
  uint8_t   battery_percent{0};
  Units     units{Units::Celsius};
  uint8_t   alarm_flags{0};          ///< raw byte as observed
  ProbeList temps;

  bool device_alarm() const { return alarm_flags != 0; }
};

/// 0x25 notification: on-demand counterpart of the broadcast.
struct TemperatureSnapshot {
  uint8_t   probe_count{0};
  uint8_t   alarm_flags{0};
  ProbeList temps;

  bool device_alarm() const { return alarm_flags != 0; }
};

/// 0x24 reply / 0x23 request body. Range mode: primary = high, secondary = low.
struct AlarmConfig {
  uint8_t     channel{1};
  AlarmMode   mode{AlarmMode::Off};
  Temperature primary;
  Temperature secondary;
};

/// 0x41 reply. build_info format is not confirmed; carried opaque.
struct FirmwareVersion {
  uint8_t                major{0};
  uint8_t                minor{0};
  std::array<uint8_t, 2> build_info{};

  /// "1.2.0a.3f"
  std::string to_string() const;
};

/// Anything the catalog cannot (or may not) classify.
struct RawFrame {
  uint8_t opcode{0};
  Payload payload;
};

using InboundMessage = std::variant<AuthResponse,
                                    DeviceStatus,
                                    AlarmConfig,
                                    TemperatureSnapshot,
                                    TemperatureBroadcast,
                                    FirmwareVersion,
                                    RawFrame>;

const char* to_string(Units u);
const char* to_string(AlarmMode m);

/**
 * @brief One-line, grep-friendly rendering of any decoded value.
 *
 * Examples:
 *   "type=status units=C beeper=on battery=80"
 *   "type=broadcast battery=50 units=C alarm=0x00 t1=--- t2=21.5"
 *   "type=raw op=0x29 data=0102030405060708ff"
 */
std::string describe(const InboundMessage& m);

} // namespace tp90x
