#pragma once
/**
 * @page pr-node-link PicoRelay Node Link (line transport over Serial)
 * @file node_link.hpp
 * @brief Byte pump from the protocol UART into whole request lines, and back.
 *
 * Overview
 * --------
 * This module is the narrow waist between raw UART bytes and request lines.
 * It owns the protocol serial port, feeds every received byte through a
 * LineAssembler, and hands each complete line to a single installed handler.
 * In the other direction it writes one response followed by '\n'. It does
 * not interpret commands.
 *
 * Where It Sits
 * -------------
 * - Below: hardware UART (Serial), 115200 8N1.
 * - Above: node_interface.* (runs the Dispatcher, drives the indicator).
 *
 * Callback Model
 * --------------
 * - node_link_set_handler(cb) installs the line handler. With no handler
 *   installed, lines go to node_interface_on_line().
 * - node_link_set_overflow_handler(cb) receives oversized lines. With none
 *   installed, they go to node_interface_on_overflow().
 * - node_link_update() reads buffered bytes until one line or one overflow
 *   event is delivered, then returns. Anything after it stays in Serial's
 *   buffer for the next call. Call it from every loop() tick, which also
 *   feeds the watchdog between requests.
 *
 * Default Limits and Behavior
 * ---------------------------
 * - Line terminator: '\n' or '\r'; empty lines are ignored.
 * - Max request length: 64 bytes (kMaxLineLength). Longer requests are
 *   dropped whole and reported once through the overflow handler.
 * - Responses always end in exactly one '\n'.
 *
 * Error Handling Philosophy
 * -------------------------
 * All input is untrusted. Nothing in this layer can fail the loop: a bad
 * line becomes a handler call, a long line becomes an overflow call, and the
 * pump keeps going.
 *
 * @author Leo
 */

#include <stddef.h>
#include <stdint.h>

/// Line handler signature. @p line is NUL-terminated, terminator stripped.
typedef void (*node_link_line_handler)(const char* line, size_t len);
typedef void (*node_link_overflow_handler)();

void node_link_begin(unsigned long baud);
void node_link_update();

void node_link_set_handler(node_link_line_handler handler);
void node_link_set_overflow_handler(node_link_overflow_handler handler);

/// Write @p text plus '\n' to the protocol UART.
void node_link_send_line(const char* text, size_t len);
