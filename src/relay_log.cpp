// relay_log.cpp — implementation for relay_log.hpp
// See relay_log.hpp for the sink model and usage.

#include "relay_log.hpp"

#include <cstdarg>   // va_list for printf-style forwarding
#include <cstdio>    // vsnprintf

namespace picorelay {

// Current sink (nullptr = logging disabled) and threshold.
static LogSink  s_sink  = nullptr;
static LogLevel s_level = LogLevel::INFO;

void log_set_sink(LogSink sink) { s_sink = sink; }

void log_set_level(LogLevel level) { s_level = level; }

LogLevel log_level() { return s_level; }

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "DBG";
    case LogLevel::INFO:  return "INF";
    case LogLevel::WARN:  return "WRN";
    case LogLevel::ERROR: return "ERR";
  }
  return "???";
}

// log_printf() — format into a stack buffer, then hand off to the sink.
// Early-outs before formatting so disabled levels cost one compare.
void log_printf(LogLevel level, const char* fmt, ...) {
  if (!s_sink || !fmt) return;
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(s_level)) return;

  char buf[160];
  va_list ap;
  va_start(ap, fmt);
  int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  if (n < 0) return;   // encoding error: drop the line

  s_sink(level, buf);
}

} // namespace picorelay
