#pragma once
/**
 * @file relay_line.hpp
 * @brief Byte-at-a-time line assembly for the device UART.
 *
 * Bytes are accumulated until '\n' or '\r'. Empty lines (including the
 * second half of "\r\n") produce nothing. A line that grows past the limit
 * is dropped in full, and one TOO_LONG event is reported when its terminator
 * finally arrives, so the caller can answer it with exactly one error line.
 *
 * poll() pulls bytes from a ByteSource and stops at the first event, leaving
 * later bytes unread. A pump that handles one event per pass therefore never
 * holds the loop for more than one request, however much input is buffered.
 */

#include <cstddef>
#include <string>

#include "relay_grammar.hpp"   // kMaxLineLength

namespace picorelay {

/// Non-blocking byte input, e.g. a UART receive buffer.
class ByteSource {
 public:
  virtual ~ByteSource() {}

  /// Next byte (0..255), or -1 when nothing is buffered right now.
  virtual int read() = 0;
};

class LineAssembler {
 public:
  enum class Event : unsigned char {
    NONE,       ///< byte consumed, no line yet
    LINE,       ///< @p line holds a complete request (no terminator)
    TOO_LONG    ///< an oversized request ended; it was discarded
  };

  explicit LineAssembler(size_t max_len = kMaxLineLength);

  Event push(char c, std::string& line);

  /// Read from @p src until a LINE or TOO_LONG event, or until it runs dry
  /// (NONE). Bytes after the event stay in @p src.
  Event poll(ByteSource& src, std::string& line);

  void reset();

  size_t pending() const { return buf_.size(); }

 private:
  std::string buf_;
  size_t      max_len_;
  bool        discarding_;
};

} // namespace picorelay
