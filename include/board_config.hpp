#pragma once
/**
 * @file board_config.hpp
 * @brief Pin map, timing, and identity constants for the relay controller.
 *
 * Hardware Context: ESP32 relay carrier (8 channels)
 * --------------------------------------------------
 * MCU:          ESP32 (Arduino core 2.x)
 * Relays:       8x driven high-active through transistor drivers
 * Buzzer:       passive piezo on an LEDC PWM channel
 * Status:       1x WS2812 RGB pixel, 1x plain heartbeat LED
 * Host link:    USB UART (Serial) at 115200 8N1, protocol traffic only
 * Debug link:   Serial1 on DEBUG_TX/DEBUG_RX, log text only
 *
 * The board reports itself on the wire with the Waveshare identity below so
 * existing host tooling recognizes it.
 */

#include <stdint.h>

namespace board {

// ---- relays (index 0 = relay 1) ----
static constexpr uint8_t RELAY_COUNT = 8;
static constexpr uint8_t RELAY_PINS[RELAY_COUNT] = {16, 17, 18, 19, 21, 22, 23, 25};
static constexpr bool    RELAY_ACTIVE_HIGH = true;
static constexpr uint16_t RELAY_SETTLE_MS  = 10;

// ---- buzzer ----
static constexpr uint8_t  BUZZER_PIN        = 26;
static constexpr uint8_t  BUZZER_LEDC_CH    = 0;
static constexpr uint8_t  BUZZER_LEDC_BITS  = 10;
static constexpr uint16_t BUZZER_DEFAULT_HZ = 1000;
static constexpr uint16_t BOOT_BEEP_MS      = 150;

// ---- status ----
static constexpr uint8_t  HEARTBEAT_LED_PIN = 2;
static constexpr uint16_t HEARTBEAT_MS      = 500;    // LED toggles every 500 ms
static constexpr uint8_t  RGB_PIXEL_PIN     = 27;
static constexpr uint8_t  RGB_PIXEL_COUNT   = 1;
static constexpr uint8_t  RGB_BRIGHTNESS    = 32;

// ---- serial ----
static constexpr unsigned long PROTOCOL_BAUD = 115200;
static constexpr unsigned long DEBUG_BAUD    = 115200;
static constexpr int8_t  DEBUG_TX_PIN = 4;
static constexpr int8_t  DEBUG_RX_PIN = 5;

// ---- watchdog ----
static constexpr uint32_t WATCHDOG_TIMEOUT_S = 8;

// ---- identity ----
static constexpr const char* BOARD_NAME       = "WAVESHARE-PICO-RELAY-B";
static constexpr const char* BOARD_VERSION    = "1.0";
static constexpr const char* FIRMWARE_VERSION = "1.2.0";

// ---- persistence ----
static constexpr const char* NVS_NAMESPACE = "picorelay";
static constexpr const char* NVS_KEY       = "config";

} // namespace board
