/**
 * @page pr-node-main PicoRelay Firmware Entry (ESP32, 8-channel relay board)
 * @file main.cpp
 * @brief Minimal entry point: boot subsystems, then run the line pump.
 *
 * Purpose
 * -------
 * This file is intentionally boring. It wires up the debug sink, transport,
 * relay/config/dispatcher core, and the status indicator, then hands control
 * to a cooperative update loop. All heavy lifting lives in modules that can
 * be tested or swapped without touching main().
 *
 * What This File Does
 * -------------------
 * 1) Optional: routes core log lines to Serial1 when built with
 *    PICORELAY_DEBUG=1. The protocol UART never carries log text.
 * 2) Brings up the line transport on Serial and registers the line and
 *    overflow handlers (node_link.*).
 * 3) Brings up the heartbeat LED and RGB pixel (node_indicator.*).
 * 4) Drives relays OFF, opens NVS, restores saved states and beeps
 *    (node_interface.*).
 * 5) Arms the task watchdog on the loop task.
 * 6) Loops: handle at most one line, tick the heartbeat, feed the watchdog.
 *
 * Watchdog Budget
 * ---------------
 * The longest blocking command is 5000 ms (PULSE/BEEP/TONE cap) plus relay
 * settle time. The watchdog is 8 s and is fed after every request, so a
 * legal command can never trip it and a wedged loop always will.
 *
 * Operational Notes
 * -----------------
 * - Ports: on Linux the board enumerates as /dev/ttyUSB* or /dev/ttyACM*.
 * - Quick check: `relayctl --port /dev/ttyUSB0 ping` should print PONG.
 * - Debug trace: build with -DPICORELAY_DEBUG=1 and attach a USB-UART to
 *   board::DEBUG_TX_PIN at 115200.
 *
 * @author Leo
 */

#include <Arduino.h>
#include <esp_task_wdt.h>

#include "board_config.hpp"
#include "node_link.hpp"        // node_link_begin, node_link_set_handler, node_link_update
#include "node_interface.hpp"   // node_interface_begin, node_interface_on_line, ...
#include "node_indicator.hpp"   // node_indicator_begin, node_indicator_tick
#include "relay_log.hpp"

#ifndef PICORELAY_DEBUG
#define PICORELAY_DEBUG 0
#endif

#if PICORELAY_DEBUG
static void debug_sink(picorelay::LogLevel level, const char* msg) {
  Serial1.printf("[%s] %s\n", picorelay::log_level_name(level), msg);
}

static constexpr uint32_t STATS_PERIOD_MS = 60000;
static uint32_t s_last_stats = 0;
#endif

void setup() {
  // 1) Debug sink (secondary UART only)
#if PICORELAY_DEBUG
  Serial1.begin(board::DEBUG_BAUD, SERIAL_8N1, board::DEBUG_RX_PIN, board::DEBUG_TX_PIN);
  picorelay::log_set_sink(&debug_sink);
  picorelay::log_set_level(picorelay::LogLevel::DEBUG);
#endif

  // 2) Transport (line protocol on Serial)
  node_link_begin(board::PROTOCOL_BAUD);
  node_link_set_handler(node_interface_on_line);
  node_link_set_overflow_handler(node_interface_on_overflow);

  // 3) Indicator first so the boot color shows as soon as possible
  node_indicator_begin();

  // 4) Relays, storage, dispatcher, auto-load, boot beep
  node_interface_begin();

  // 5) Watchdog on this task
  esp_task_wdt_init(board::WATCHDOG_TIMEOUT_S, /*panic=*/true);
  esp_task_wdt_add(NULL);
}

void loop() {
  // At most one request per pass; queued ones wait for the next tick
  node_link_update();

  const uint32_t now = millis();
  node_indicator_tick(now);

#if PICORELAY_DEBUG
  if (now - s_last_stats >= STATS_PERIOD_MS) {
    s_last_stats = now;
    const picorelay::ProtocolStatistics& st = node_interface_statistics();
    PICORELAY_LOG_INFO("stats: %lu cmds, %lu errors (%.1f%%)",
                       (unsigned long)st.command_count, (unsigned long)st.error_count,
                       st.error_rate() * 100.0);
  }
#endif

  esp_task_wdt_reset();
}
