#pragma once
/**
 * @file temperature.hpp
 * @brief 2-byte BCD temperature codec with the "probe absent" sentinel.
 *
 * @details
 * Byte layout (observed on TP902/TP904 firmware):
 * @code
 *   hi: [S][h h h][t t t t]    S = sign (1 = negative), h = hundreds, t = tens
 *   lo: [o o o o][d d d d]     o = ones, d = tenths
 *
 *   21.5  -> 02 15
 *   -3.2  -> 80 32
 *   absent-> FF FF
 * @endcode
 *
 * A decoded Temperature is a signed count of tenths of a degree, or Absent.
 * The hundreds field has three bits, so the representable magnitude is
 * 0.0 .. 799.9. Units (C or F) live next to the readings, not inside them.
 */

#include <cstdint>
#include <string>

#include "tp90x/status.hpp"

namespace tp90x {

static constexpr uint8_t TEMP_ABSENT_BYTE = 0xFF;    ///< both bytes 0xFF => probe absent
static constexpr int16_t TEMP_MAX_TENTHS  = 7999;    ///< 799.9 degrees

class Temperature {
public:
  /// Default-constructed temperature is Absent.
  Temperature() = default;

  static Temperature absent() { return Temperature(); }
  static Temperature from_tenths(int16_t tenths) { return Temperature(tenths); }

  bool    present()   const { return present_; }
  bool    is_absent() const { return !present_; }
  int16_t tenths()    const { return present_ ? tenths_ : 0; }
  double  degrees()   const { return tenths() / 10.0; }

  bool operator==(const Temperature& o) const {
    return present_ == o.present_ && tenths() == o.tenths();
  }
  bool operator!=(const Temperature& o) const { return !(*this == o); }

private:
  explicit Temperature(int16_t tenths) : present_(true), tenths_(tenths) {}

  bool    present_{false};
  int16_t tenths_{0};
};

/**
 * @brief Decode two wire bytes.
 * @return Ok, or InvalidBcd if any digit nibble is above 9 (never clamps).
 */
Status decode_temperature(const uint8_t* raw, Temperature& out);

/**
 * @brief Encode into two wire bytes. Absent always yields FF FF.
 * @return Ok, or InvalidArgument when |value| > 799.9.
 */
Status encode_temperature(const Temperature& t, uint8_t* out);

/// "21.5", "-3.2" or "---" for an absent probe.
std::string to_string(const Temperature& t);

/**
 * @brief Inverse of to_string() for user input: "63", "63.5", "-3.2", "---".
 *
 * At most one fractional digit. Returns false on junk or a magnitude above 799.9.
 */
bool parse_temperature(const std::string& text, Temperature& out);

} // namespace tp90x
