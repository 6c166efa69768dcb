#pragma once
/**
 * @file log.hpp
 * @brief Leveled key=value log lines for the xmmrpc host library.
 *
 * @details
 * Every event is a single line on stderr shaped like
 *
 *   level=warn event=unexpected_tx tag=0x11000107
 *
 * so operators can grep it and scripts can split it on spaces, the same way
 * the CLI prints `status=error reason=...`.
 *
 * The sink can be swapped (tests capture lines into a vector). Writes are
 * serialized so lines from the reader thread and callers never interleave.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace xmmrpc {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Receives the formatted line (without trailing newline).
using LogSink = std::function<void(LogLevel, const std::string&)>;

/**
 * @brief Emit one event if @p lvl passes the current threshold.
 * @param event  Stable token naming what happened (e.g. "length_mismatch").
 * @param detail Optional `key=value ...` tail, appended after a space.
 */
void log_event(LogLevel lvl, const std::string& event, const std::string& detail = {});

void set_log_level(LogLevel lvl);
LogLevel log_level();

/// Replace the sink; an empty function restores the stderr sink.
void set_log_sink(LogSink sink);

/// "debug" | "info" | "warn" | "error" -> level. Returns false on anything else.
bool parse_log_level(const std::string& name, LogLevel& out);

const char* log_level_name(LogLevel lvl);

/// Lowercase hex of a byte range, no separators ("0a1b").
std::string to_hex(const uint8_t* data, size_t len);

/// "0x" + 8 hex digits.
std::string hex32(uint32_t v);

} // namespace xmmrpc
