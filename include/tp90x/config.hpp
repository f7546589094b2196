#pragma once
/**
 * @file config.hpp
 * @brief Engine and tp90x-cli settings from a JSON file (nlohmann::json).
 *
 * @details
 * Location: `--config <path>`, else `$XDG_CONFIG_HOME/tp90x/config.json`, else
 * `$HOME/.config/tp90x/config.json`. A missing file is not an error; every key
 * is optional and falls back to the defaults below.
 *
 * @code
 *   {
 *     "model": "tp904",
 *     "request_timeout_ms": 3000,
 *     "log_level": "info",
 *     "auth_payload": "99 a8 89 3c 66 81 75 0d e3"
 *   }
 * @endcode
 *
 * Loading never throws. Bad JSON, wrong types and out-of-range values come back
 * as `false` plus a reason such as `key=request_timeout_ms expected=positive_integer`.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "tp90x/commands.hpp"   // AuthPayload
#include "tp90x/log.hpp"
#include "tp90x/session.hpp"

namespace tp90x {

struct Config {
  std::string model{"tp902"};
  uint32_t    request_timeout_ms{5000};
  uint32_t    write_grace_ms{300};
  uint32_t    receive_poll_ms{50};
  size_t      broadcast_backlog{0};
  LogLevel    log_level{LogLevel::Warn};
  std::optional<AuthPayload> auth_payload;   ///< unset -> captured default

  SessionConfig session_config() const;
};

/// `$XDG_CONFIG_HOME/tp90x/config.json` (or the $HOME fallback). Empty if neither is set.
std::string default_config_path();

/// Overlay the keys found in @p text onto @p cfg.
bool parse_config(const std::string& text, Config& cfg, std::string& reason);

/// Read @p path and parse it. A file that does not exist leaves @p cfg untouched and succeeds.
bool load_config(const std::string& path, Config& cfg, std::string& reason);

} // namespace tp90x
