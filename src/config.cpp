// ============================================================================
// config.cpp: JSON settings for the engine and tp90x-cli (see include/tp90x/config.hpp)
// ============================================================================

#include "tp90x/config.hpp"
#include "tp90x/auth.hpp"    // parse_auth_hex()

#include "nlohmann/json.hpp"

#include <cstdlib>           // std::getenv
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace tp90x {

SessionConfig Config::session_config() const {
  SessionConfig s;
  s.request_timeout_ms = request_timeout_ms;
  s.write_grace_ms     = write_grace_ms;
  s.receive_poll_ms    = receive_poll_ms;
  s.broadcast_backlog  = broadcast_backlog;
  return s;
}

std::string default_config_path() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return (fs::path(xdg) / "tp90x" / "config.json").string();
  const char* home = std::getenv("HOME");
  if (home && *home) return (fs::path(home) / ".config" / "tp90x" / "config.json").string();
  return {};
}

// ---------------------------------------------------------------------------
// Typed key readers. Each returns false with "key=<k> expected=<what>".
// ---------------------------------------------------------------------------

static bool bad(const char* key, const char* expected, std::string& reason) {
  reason = std::string("key=") + key + " expected=" + expected;
  return false;
}

static bool read_string(const json& j, const char* key, std::string& out, std::string& reason) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) return bad(key, "string", reason);
  out = it->get<std::string>();
  return true;
}

template <typename T>
static bool read_uint(const json& j, const char* key, int64_t min, T& out, std::string& reason) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_integer()) return bad(key, "integer", reason);
  const int64_t v = it->get<int64_t>();
  if (v < min || static_cast<uint64_t>(v) > static_cast<uint64_t>(std::numeric_limits<T>::max()))
    return bad(key, min > 0 ? "positive_integer" : "non_negative_integer", reason);
  out = static_cast<T>(v);
  return true;
}

bool parse_config(const std::string& text, Config& cfg, std::string& reason) {
  const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) { reason = "invalid_json"; return false; }
  if (!j.is_object())   { reason = "expected_object"; return false; }

  Config c = cfg;   // commit only if every key is good

  if (!read_string(j, "model", c.model, reason))  return false;
  if (!read_uint(j, "request_timeout_ms", 1, c.request_timeout_ms, reason))    return false;
  if (!read_uint(j, "write_grace_ms", 0, c.write_grace_ms, reason))            return false;
  if (!read_uint(j, "receive_poll_ms", 1, c.receive_poll_ms, reason))          return false;
  if (c.receive_poll_ms > MAX_RECEIVE_POLL_MS) return bad("receive_poll_ms", "1..60000", reason);
  if (!read_uint(j, "broadcast_backlog", 0, c.broadcast_backlog, reason))      return false;

  std::string level;
  if (!read_string(j, "log_level", level, reason)) return false;
  if (!level.empty() && !parse_log_level(level, c.log_level))
    return bad("log_level", "error|warn|info|debug", reason);

  std::string hex;
  if (!read_string(j, "auth_payload", hex, reason)) return false;
  if (!hex.empty()) {
    AuthPayload p{};
    std::string why;
    if (!parse_auth_hex(hex, p, why)) {
      reason = "key=auth_payload " + why;
      return false;
    }
    c.auth_payload = p;
  }

  cfg = c;
  return true;
}

bool load_config(const std::string& path, Config& cfg, std::string& reason) {
  if (path.empty()) return true;

  std::error_code ec;
  if (!fs::exists(path, ec)) return true;       // no file -> defaults

  std::ifstream in(path);
  if (!in) { reason = "cannot_open path=" + path; return false; }
  std::ostringstream ss;
  ss << in.rdbuf();

  if (!parse_config(ss.str(), cfg, reason)) {
    reason += " path=" + path;
    return false;
  }
  return true;
}

} // namespace tp90x
