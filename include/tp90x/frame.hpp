#pragma once
/**
 * @page tp90x-frame TP90x Frame Codec
 * @file frame.hpp
 * @brief Build and parse the `CMD LEN DATA CHECKSUM` wire frame.
 *
 * @details
 * WIRE SHAPE
 * ----------
 * @code
 *   +--------+--------+------------------+----------+
 *   | opcode |  len   |  payload (len B) | checksum |
 *   +--------+--------+------------------+----------+
 *   checksum = (opcode + len + sum(payload)) & 0xFF
 * @endcode
 *
 * Every GATT write and every GATT notification carries exactly one frame.
 * Notifications are often padded to a fixed size (20 bytes is common); the
 * decoder reads only `2 + len + 1` bytes and ignores the rest.
 *
 * EXAMPLE
 * -------
 * @code
 *   tp90x::Payload p; p.push_back(0x0c);
 *   tp90x::WireBytes out;
 *   tp90x::encode_frame(0x20, p, out);   // out = 20 01 0c 2d
 *
 *   tp90x::Frame f;
 *   if (tp90x::decode_frame(out.data(), out.size(), f) == tp90x::Status::Ok) {
 *       // f.opcode == 0x20, f.payload == {0x0c}
 *   }
 * @endcode
 *
 * The payload type is a fixed-capacity ETL vector; a decoded Frame never
 * touches the heap.
 *
 * @author Leo
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "etl/vector.h"
#include "tp90x/status.hpp"

namespace tp90x {

/// Largest payload a one-byte length field can describe.
static constexpr size_t MAX_PAYLOAD = 255;

/// Smallest legal frame: opcode, len=0, checksum.
static constexpr size_t MIN_FRAME = 3;

using Payload   = etl::vector<uint8_t, MAX_PAYLOAD>;
using WireBytes = std::vector<uint8_t>;

/**
 * @struct Frame
 * @brief One decoded frame. Transient: built per send/receive.
 */
struct Frame {
  uint8_t opcode{0};
  Payload payload;
  uint8_t checksum{0};
};

/// Low byte of opcode + len + every payload byte, summed in 32 bits.
uint8_t frame_checksum(uint8_t opcode, const uint8_t* payload, size_t len);

/**
 * @brief Serialize opcode + payload into wire bytes.
 *
 * @param opcode  command byte
 * @param data    payload bytes (may be nullptr when @p len is 0)
 * @param len     payload length; more than 255 fails with PayloadTooLarge
 * @param out     cleared, then filled with the full frame
 */
Status encode_frame(uint8_t opcode, const uint8_t* data, size_t len, WireBytes& out);

inline Status encode_frame(uint8_t opcode, const Payload& p, WireBytes& out) {
  return encode_frame(opcode, p.data(), p.size(), out);
}

/**
 * @brief Parse one frame from raw notification bytes.
 *
 * Never reads past @p n. Returns TooShort when fewer than `3 + len` bytes are
 * present, ChecksumMismatch when the trailing byte is wrong. Padding after the
 * checksum is ignored.
 */
Status decode_frame(const uint8_t* raw, size_t n, Frame& out);

inline Status decode_frame(const WireBytes& raw, Frame& out) {
  return decode_frame(raw.data(), raw.size(), out);
}

/**
 * @brief Parse bytes written as hex, as GATT tools print them.
 *
 * Accepts "260026", "26 00 26", "26:00:26" and "26-00-26". A separator may
 * not fall inside a byte.
 * Returns false with a short reason (`bad_hex_digit`, `split_byte`,
 * `odd_digit_count`) and leaves @p out empty.
 */
bool parse_hex(const std::string& text, WireBytes& out, std::string& reason);

/// Space-separated lowercase hex ("26 00 26").
std::string format_hex(const uint8_t* data, size_t len);

inline std::string format_hex(const WireBytes& bytes) { return format_hex(bytes.data(), bytes.size()); }

} // namespace tp90x
