/**
 * @file node_indicator.cpp
 * @brief Implementation for the matching node_indicator.hpp.
 *
 * Notes:
 * - API/overview lives in node_indicator.hpp. Keep this file focused on "how".
 * - The pixel is only rewritten when its color changes; show() bit-bangs the
 *   WS2812 with interrupts off, so redundant calls are not free.
 */

#include "node_indicator.hpp"
#include "board_config.hpp"

#include <Arduino.h>

/* WS2812 driver. Repo: https://github.com/adafruit/Adafruit_NeoPixel */
#include <Adafruit_NeoPixel.h>

/*------------------------------------------------------------------------------
  Internal state
------------------------------------------------------------------------------*/
namespace {
Adafruit_NeoPixel g_pixel(board::RGB_PIXEL_COUNT, board::RGB_PIXEL_PIN, NEO_GRB + NEO_KHZ800);

bool     g_ok         = false;       // begin() ran
uint32_t g_color      = 0xFFFFFFFF;  // last color pushed; impossible value forces first write
bool     g_led_on     = false;
uint32_t g_last_flip  = 0;

void paint(uint8_t r, uint8_t g, uint8_t b) {
  if (!g_ok) return;
  const uint32_t c = Adafruit_NeoPixel::Color(r, g, b);
  if (c == g_color) return;
  g_pixel.setPixelColor(0, c);
  g_pixel.show();
  g_color = c;
}
} // namespace

/*------------------------------------------------------------------------------
  node_indicator_begin
  --------------------
  Heartbeat LED as output (starts off), pixel driver up and dark.
------------------------------------------------------------------------------*/
void node_indicator_begin() {
  pinMode(board::HEARTBEAT_LED_PIN, OUTPUT);
  digitalWrite(board::HEARTBEAT_LED_PIN, LOW);
  g_led_on = false;
  g_last_flip = millis();

  g_pixel.begin();
  g_pixel.setBrightness(board::RGB_BRIGHTNESS);
  g_pixel.clear();
  g_pixel.show();
  g_ok = true;
}

void node_indicator_show_boot() {
  paint(0, 0, 255);
}

void node_indicator_show_result(bool ok) {
  if (ok) paint(0, 255, 0);
  else    paint(255, 0, 0);
}

/*------------------------------------------------------------------------------
  node_indicator_tick
  -------------------
  Unsigned subtraction keeps this correct across the 49-day millis() wrap.
------------------------------------------------------------------------------*/
void node_indicator_tick(uint32_t now_ms) {
  if (now_ms - g_last_flip < board::HEARTBEAT_MS) return;
  g_last_flip = now_ms;
  g_led_on = !g_led_on;
  digitalWrite(board::HEARTBEAT_LED_PIN, g_led_on ? HIGH : LOW);
}
