#pragma once
/**
 * @file log.hpp
 * @brief Tiny key=value logger for the protocol engine.
 *
 * @details
 * Every line has the shape
 * @code
 *   level=warn event=frame_dropped reason=checksum_mismatch op=0x30
 * @endcode
 * so it can be grepped and cut like the CLI's `status=... reason=...` output.
 *
 * Lines go to std::cerr by default. Tests and embedders can install their own
 * sink with set_log_sink(); pass an empty function to restore stderr.
 * The receive thread and the caller thread may both log. Writes to stderr
 * are serialized per line. A custom sink is called without any logger lock
 * held, possibly from both threads at once; it may itself log or call back
 * into the session.
 */

#include <cstdint>
#include <functional>
#include <string>

namespace tp90x {

enum class LogLevel : uint8_t { Error = 0, Warn = 1, Info = 2, Debug = 3 };

using LogSink = std::function<void(LogLevel, const std::string& line)>;

/// Emit one line if @p level passes the threshold.
void log_event(LogLevel level, const char* event, const std::string& detail = {});

/// Lines above this level are discarded. Default: Warn.
void set_log_level(LogLevel level);
LogLevel log_level();

/// Replace the output sink; an empty function restores std::cerr.
void set_log_sink(LogSink sink);

const char* to_string(LogLevel level);

/// Parse "error|warn|info|debug" (case-insensitive). Returns false on junk.
bool parse_log_level(const std::string& s, LogLevel& out);

/// "0x3a" style helper used all over the log lines.
std::string hex_byte(uint8_t b);

} // namespace tp90x
