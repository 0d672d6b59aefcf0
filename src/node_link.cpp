// -----------------------------------------------------------------------------
// node_link.cpp
// Implementation of the line transport declared in node_link.hpp.
//
// Notes:
//  * See node_link.hpp for the callback model and limits.
//  * This file is about mechanics: wiring Serial, line assembly, and handler
//    dispatch.
// -----------------------------------------------------------------------------

#include "node_link.hpp"        // Line transport API (begin, update, handlers, send)
#include "node_interface.hpp"   // Default handlers: node_interface_on_line / on_overflow
#include "relay_line.hpp"       // LineAssembler

#include <Arduino.h>            // Serial

// Single assembler for the single protocol UART.
static picorelay::LineAssembler g_lines;

// Serial's receive buffer as a ByteSource.
class SerialSource : public picorelay::ByteSource {
 public:
  int read() override { return Serial.available() > 0 ? Serial.read() : -1; }
};

static SerialSource g_serial;

// Installed handlers (nullptr = route to node_interface defaults).
static node_link_line_handler     g_handler  = nullptr;
static node_link_overflow_handler g_overflow = nullptr;

static void deliver_line(const std::string& line) {
  if (g_handler) g_handler(line.c_str(), line.size());
  else           node_interface_on_line(line.c_str(), line.size());
}

static void deliver_overflow() {
  if (g_overflow) g_overflow();
  else            node_interface_on_overflow();
}

// -----------------------------------------------------------------------------
// Open the protocol UART and reset assembly state
// -----------------------------------------------------------------------------
void node_link_begin(unsigned long baud) {
  Serial.begin(baud);
  g_lines.reset();
}

// -----------------------------------------------------------------------------
// Deliver at most one line or overflow event. A PULSE blocks for up to 5 s,
// so several queued requests handled in one pass could outlast the watchdog;
// the rest wait in Serial's buffer for the next loop() tick.
// -----------------------------------------------------------------------------
void node_link_update() {
  std::string line;
  switch (g_lines.poll(g_serial, line)) {
    case picorelay::LineAssembler::Event::NONE:
      break;
    case picorelay::LineAssembler::Event::LINE:
      deliver_line(line);
      break;
    case picorelay::LineAssembler::Event::TOO_LONG:
      deliver_overflow();
      break;
  }
}

void node_link_set_handler(node_link_line_handler handler) {
  g_handler = handler;
}

void node_link_set_overflow_handler(node_link_overflow_handler handler) {
  g_overflow = handler;
}

// -----------------------------------------------------------------------------
// Write one response line. The terminator is always added here so callers
// never have to remember it.
// -----------------------------------------------------------------------------
void node_link_send_line(const char* text, size_t len) {
  if (text && len) Serial.write(reinterpret_cast<const uint8_t*>(text), len);
  Serial.write('\n');
}
