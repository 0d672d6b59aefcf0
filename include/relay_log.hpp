#pragma once
/**
 * @file relay_log.hpp
 * @brief Tiny levelled logger with a single installable sink.
 *
 * Overview
 * --------
 * The protocol core runs in two very different homes: an Arduino loop where
 * the main UART is reserved for protocol traffic, and a host process where
 * stderr is free. The core never writes anywhere by itself. It formats a
 * line and hands it to whatever sink the application installed:
 *
 *   - firmware: a sink that writes "[LVL] text" to the debug UART (Serial1),
 *     compiled in only with PICORELAY_DEBUG=1
 *   - relayctl: a sink that writes to stderr, filtered by -v / -vv
 *   - tests:    a capturing sink, or nothing at all
 *
 * With no sink installed every call is a cheap no-op.
 *
 * Usage
 * -----
 * @code
 * static void to_stderr(picorelay::LogLevel lvl, const char* msg) {
 *   std::fprintf(stderr, "[%s] %s\n", picorelay::log_level_name(lvl), msg);
 * }
 * picorelay::log_set_sink(&to_stderr);
 * picorelay::log_set_level(picorelay::LogLevel::DEBUG);
 * PICORELAY_LOG_WARN("bad relay token '%s'", tok);
 * @endcode
 *
 * @author Leo
 */

#include <cstdint>

namespace picorelay {

enum class LogLevel : uint8_t {
  DEBUG = 0,
  INFO  = 1,
  WARN  = 2,
  ERROR = 3
};

/// Sink signature. @p msg is NUL-terminated and has no trailing newline.
typedef void (*LogSink)(LogLevel level, const char* msg);

/**
 * @brief Install or replace the log sink.
 * @param sink Function pointer, or nullptr to silence all output.
 */
void log_set_sink(LogSink sink);

/// Messages below @p level are dropped before formatting.
void log_set_level(LogLevel level);

LogLevel log_level();

/// Short uppercase tag ("DBG", "INF", "WRN", "ERR").
const char* log_level_name(LogLevel level);

/**
 * @brief Format and emit one log line.
 *
 * Output longer than the internal buffer (160 bytes) is truncated.
 */
void log_printf(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace picorelay

#define PICORELAY_LOG_DEBUG(...) ::picorelay::log_printf(::picorelay::LogLevel::DEBUG, __VA_ARGS__)
#define PICORELAY_LOG_INFO(...)  ::picorelay::log_printf(::picorelay::LogLevel::INFO,  __VA_ARGS__)
#define PICORELAY_LOG_WARN(...)  ::picorelay::log_printf(::picorelay::LogLevel::WARN,  __VA_ARGS__)
#define PICORELAY_LOG_ERROR(...) ::picorelay::log_printf(::picorelay::LogLevel::ERROR, __VA_ARGS__)
