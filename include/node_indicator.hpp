#pragma once
/**
 * @page pr-node-indicator PicoRelay Node Indicator (heartbeat LED + RGB pixel)
 * @file node_indicator.hpp
 * @brief Tiny presentation shim: a blinking heartbeat and a one-pixel status.
 *
 * Overview
 * --------
 * The board has no screen. What it has is a plain LED and one WS2812 pixel,
 * and this module is the only code that touches either. It gives the rest of
 * the firmware three calls (boot color, command outcome, periodic tick) and
 * nothing more.
 *
 * Where This Fits
 * ---------------
 * - Transport lives in node_link.*.
 * - Command handling and persistence live in node_interface.*.
 * - This module is presentation only. It should be safe to ignore or replace.
 *
 * Colors
 * ------
 *   blue    booting (until the first command)
 *   green   last command answered OK or with data
 *   red     last command answered ERROR:<code>
 *
 * Heartbeat
 * ---------
 * node_indicator_tick() toggles the LED every board::HEARTBEAT_MS. If the
 * LED stops blinking, loop() is stuck.
 *
 * Dependencies
 * ------------
 * - Arduino core for ESP32 (pinMode/digitalWrite/millis).
 * - Adafruit_NeoPixel.
 *
 * @author Leo
 */

#include <stdint.h>

void node_indicator_begin();

/// Pixel to the boot color.
void node_indicator_show_boot();

/// Pixel to green (@p ok) or red.
void node_indicator_show_result(bool ok);

/// Heartbeat service; call every loop() tick with millis().
void node_indicator_tick(uint32_t now_ms);
