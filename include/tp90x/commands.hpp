#pragma once
/**
 * @page tp90x-commands TP90x Commands Layer
 * @file commands.hpp
 * @brief Opcodes, GATT identifiers and request builders for TP902/TP904 thermometers.
 *
 * @details
 * PURPOSE
 * -------
 * This is the host's vocabulary for talking to the thermometer. Each builder
 * returns a Request (opcode + payload) that the session frames, checksums and
 * writes. Builders never touch the transport; they only shape bytes.
 *
 * RELATIONSHIP TO OTHER FILES
 * ---------------------------
 * - frame.hpp:   wraps Request into `CMD LEN DATA CHECKSUM`.
 * - catalog.hpp: knows the legal payload lengths for every opcode and how to
 *                decode inbound payloads. The session checks every Request
 *                against it before sending.
 * - device.hpp:  the public facade calls these builders, one per operation.
 *
 * EXAMPLE FLOW
 * ------------
 *   make_set_units(Units::Celsius) -> {0x20, [0c]}
 *   encode_frame()                 -> 20 01 0c 2d
 *   session.submit_write()         -> GATT write, wait a short grace period
 *
 * MAINTENANCE
 * -----------
 * - Keep builders explicit: one function per outbound opcode.
 * - New opcodes go here AND in the catalog table (catalog.cpp).
 */

#include <array>
#include <cstdint>

#include "tp90x/frame.hpp"
#include "tp90x/messages.hpp"
#include "tp90x/status.hpp"

namespace tp90x {

// =============================== Opcodes ===============================
enum : uint8_t {
  OP_AUTH           = 0x01,  /**< out: 9-byte handshake, in: 2-byte reply. */
  OP_BACKLIGHT_ON   = 0x02,  /**< out: light the LCD like a button press (no reply). */
  OP_UNKNOWN_03     = 0x03,  /**< in: unclassified, 1 byte. */
  OP_SET_UNITS      = 0x20,  /**< out: 1 byte, 0x0c=C 0x0f=F. */
  OP_SET_SOUND      = 0x21,  /**< out: 1 byte, 0x0c=on 0x0f=off. */
  OP_SET_ALARM      = 0x23,  /**< out: channel, mode, 2x BCD temperature. */
  OP_GET_ALARM      = 0x24,  /**< out: channel, in: 6-byte alarm config. */
  OP_TEMP_SNAPSHOT  = 0x25,  /**< in: probe count, alarm flags, temperatures. */
  OP_STATUS         = 0x26,  /**< out: empty, in: units, beeper, battery, 2 unknown. */
  OP_SNOOZE         = 0x27,  /**< out: empty; silences a sounding alarm until next trigger. */
  OP_TIME_SYNC      = 0x28,  /**< out: u32 LE seconds since 2020-01-01. */
  OP_UNKNOWN_29     = 0x29,  /**< in: unclassified, 9 bytes. */
  OP_TEMP_BROADCAST = 0x30,  /**< in: battery, units, alarm flags, temperatures. */
  OP_FIRMWARE       = 0x41,  /**< out: empty, in: 3 bytes. */
  OP_UNKNOWN_42     = 0x42,  /**< in: unclassified, 1 byte. */
  OP_DEVICE_ERROR   = 0xE0   /**< in: 2 bytes; believed to be an error report. */
};

// ============================ GATT identity ============================
static constexpr const char* SERVICE_UUID = "1086fff0-3343-4817-8bb2-b32206336ce8";
static constexpr const char* WRITE_UUID   = "1086fff1-3343-4817-8bb2-b32206336ce8";
static constexpr const char* NOTIFY_UUID  = "1086fff2-3343-4817-8bb2-b32206336ce8";

/// Unix time of 2020-01-01T00:00:00Z, the device clock's epoch.
static constexpr int64_t EPOCH_2020_UNIX = 1577836800;

static constexpr size_t AUTH_PAYLOAD_LEN = 9;
using AuthPayload = std::array<uint8_t, AUTH_PAYLOAD_LEN>;

/**
 * @struct Request
 * @brief Unframed outbound command: what to send, before LEN and checksum.
 */
struct Request {
  uint8_t opcode{0};
  Payload payload;
};

// ============================== Builders ===============================

/// 0x01 with the 9 handshake bytes produced by an AuthPayloadGenerator.
Request make_auth(const AuthPayload& bytes);

/// 0x02, empty.
Request make_backlight_on();

/// 0x20 [0x0c|0x0f].
Request make_set_units(Units u);

/// 0x21 [0x0c|0x0f].
Request make_set_sound(bool enabled);

/**
 * @brief 0x23 [channel][mode][primary BCD][secondary BCD].
 *
 * Temperature bytes per mode:
 *   Off    -> FF FF  FF FF  (temperatures ignored)
 *   Target -> primary 00 00
 *   Range  -> primary(high) secondary(low)
 *
 * @return InvalidArgument if the channel is outside 1..6, the mode is not one of
 *         the three known values, a required temperature is absent, or a
 *         temperature does not fit the BCD range.
 */
Status make_set_alarm(const AlarmConfig& cfg, Request& out);

/// 0x24 [channel]. Channel range is checked by the caller.
Request make_get_alarm(uint8_t channel);

/// 0x26, empty.
Request make_get_status();

/// 0x27, empty.
Request make_snooze();

/// 0x28 [u32 little-endian seconds since 2020-01-01].
Request make_time_sync(uint32_t seconds_since_2020);

/// 0x41, empty.
Request make_get_firmware();

/// Clamp a Unix timestamp onto the device epoch (0 for anything before 2020).
uint32_t seconds_since_2020(int64_t unix_seconds);

} // namespace tp90x
