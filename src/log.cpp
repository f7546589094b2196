// ============================================================================
// log.cpp: implementation for tp90x/log.hpp and tp90x/status.hpp strings
// ============================================================================

#include "tp90x/log.hpp"
#include "tp90x/status.hpp"

#include <cctype>      // std::tolower for level parsing
#include <iostream>    // std::cerr default sink
#include <mutex>       // one writer at a time (receive thread + caller thread)

namespace tp90x {

namespace {

std::mutex g_log_mtx;                   // level + sink
std::mutex g_cerr_mtx;                  // whole lines on stderr
LogSink    g_sink;                      // empty => std::cerr
LogLevel   g_level = LogLevel::Warn;

} // namespace

const char* to_string(Status s) {
  switch (s) {
    case Status::Ok:                      return "ok";
    case Status::TooShort:                return "too_short";
    case Status::ChecksumMismatch:        return "checksum_mismatch";
    case Status::PayloadTooLarge:         return "payload_too_large";
    case Status::InvalidBcd:              return "invalid_bcd";
    case Status::UnexpectedPayloadLength: return "unexpected_payload_length";
    case Status::Timeout:                 return "timeout";
    case Status::Cancelled:               return "cancelled";
    case Status::InvalidArgument:         return "invalid_argument";
    case Status::InvalidState:            return "invalid_state";
    case Status::TransportError:          return "transport_error";
    case Status::NotFound:                return "not_found";
  }
  return "unknown";
}

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "error";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Info:  return "info";
    case LogLevel::Debug: return "debug";
  }
  return "unknown";
}

bool parse_log_level(const std::string& s, LogLevel& out) {
  std::string l;
  for (char c : s) l.push_back((char)std::tolower((unsigned char)c));

  if      (l == "error") out = LogLevel::Error;
  else if (l == "warn")  out = LogLevel::Warn;
  else if (l == "info")  out = LogLevel::Info;
  else if (l == "debug") out = LogLevel::Debug;
  else return false;
  return true;
}

std::string hex_byte(uint8_t b) {
  static const char* HEX = "0123456789abcdef";
  std::string s = "0x";
  s.push_back(HEX[b >> 4]);
  s.push_back(HEX[b & 0x0F]);
  return s;
}

void set_log_level(LogLevel level) {
  std::lock_guard<std::mutex> lk(g_log_mtx);
  g_level = level;
}

LogLevel log_level() {
  std::lock_guard<std::mutex> lk(g_log_mtx);
  return g_level;
}

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lk(g_log_mtx);
  g_sink = std::move(sink);
}

void log_event(LogLevel level, const char* event, const std::string& detail) {
  LogSink sink;
  {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (static_cast<uint8_t>(level) > static_cast<uint8_t>(g_level)) return;
    sink = g_sink;
  }

  std::string line = "level=";
  line += to_string(level);
  line += " event=";
  line += event ? event : "-";
  if (!detail.empty()) {
    line += ' ';
    line += detail;
  }

  // The sink runs unlocked: it may log or query the session itself.
  if (sink) {
    sink(level, line);
    return;
  }
  std::lock_guard<std::mutex> lk(g_cerr_mtx);
  std::cerr << line << "\n";
}

} // namespace tp90x
