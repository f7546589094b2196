#pragma once
/**
 * @file auth.hpp
 * @brief Where the 9 bytes of the 0x01 handshake come from.
 *
 * @details
 * The construction of the handshake payload has never been documented. Every
 * capture seen so far carries the same 9 bytes, and the thermometers accept
 * them from any host, so the default generator simply replays them. The
 * generator is an interface so a future derivation (per-device, per-session)
 * can be dropped in without touching the facade.
 */

#include <string>

#include "tp90x/commands.hpp"

namespace tp90x {

/// The captured handshake body: 01 09 [99 a8 89 3c 66 81 75 0d e3] 5c
static constexpr AuthPayload KNOWN_AUTH_PAYLOAD{{0x99, 0xa8, 0x89, 0x3c, 0x66, 0x81, 0x75, 0x0d, 0xe3}};

class AuthPayloadGenerator {
public:
  virtual ~AuthPayloadGenerator() = default;
  virtual AuthPayload generate() = 0;
};

/// Always returns the same bytes (the captured payload unless told otherwise).
class FixedAuthPayload : public AuthPayloadGenerator {
public:
  FixedAuthPayload() : bytes_(KNOWN_AUTH_PAYLOAD) {}
  explicit FixedAuthPayload(const AuthPayload& bytes) : bytes_(bytes) {}

  AuthPayload generate() override { return bytes_; }

private:
  AuthPayload bytes_;
};

/**
 * @brief Parse a 9-byte handshake written as hex.
 *
 * Accepts "99a8893c6681750de3" as well as "99 a8 89 3c ..." or "99:a8:..".
 * Returns false with a short reason on odd digit counts, stray characters or
 * a byte count other than 9.
 */
bool parse_auth_hex(const std::string& text, AuthPayload& out, std::string& reason);

} // namespace tp90x
