// board_backend.cpp — implementation for board_backend.hpp
// GPIO relays, LEDC buzzer, Arduino clock.

#include "board_backend.hpp"
#include "relay_log.hpp"

#include <Arduino.h>

using picorelay::HwStatus;

BoardBackend::BoardBackend() : ready_(false), buzzer_ready_(false) {
  for (uint8_t i = 0; i < board::RELAY_COUNT; ++i) state_[i] = false;
}

//
// begin()
// -------
// Relays come up OFF regardless of what the pins floated to during reset.
// LEDC on core 2.x: ledcSetup returns the achieved frequency, 0 on failure.
//
void BoardBackend::begin() {
  for (uint8_t i = 0; i < board::RELAY_COUNT; ++i) {
    pinMode(board::RELAY_PINS[i], OUTPUT);
    digitalWrite(board::RELAY_PINS[i], board::RELAY_ACTIVE_HIGH ? LOW : HIGH);
    state_[i] = false;
  }
  ready_ = true;

  if (ledcSetup(board::BUZZER_LEDC_CH, board::BUZZER_DEFAULT_HZ, board::BUZZER_LEDC_BITS) == 0) {
    PICORELAY_LOG_ERROR("buzzer LEDC setup failed");
    buzzer_ready_ = false;
    return;
  }
  ledcAttachPin(board::BUZZER_PIN, board::BUZZER_LEDC_CH);
  ledcWrite(board::BUZZER_LEDC_CH, 0);
  buzzer_ready_ = true;
}

HwStatus BoardBackend::drive(uint8_t relay, bool on) {
  if (!picorelay::is_valid_relay(relay)) return HwStatus::BAD_ARGUMENT;
  if (!ready_) return HwStatus::DRIVER_FAULT;

  const uint8_t pin = board::RELAY_PINS[relay - 1];
  const bool level = board::RELAY_ACTIVE_HIGH ? on : !on;
  digitalWrite(pin, level ? HIGH : LOW);
  state_[relay - 1] = on;
  delay(board::RELAY_SETTLE_MS);   // contact bounce before the next switch
  return HwStatus::OK;
}

HwStatus BoardBackend::relay_on(uint8_t relay)  { return drive(relay, true); }
HwStatus BoardBackend::relay_off(uint8_t relay) { return drive(relay, false); }

bool BoardBackend::relay_state(uint8_t relay) const {
  if (!picorelay::is_valid_relay(relay)) return false;
  return state_[relay - 1];
}

HwStatus BoardBackend::buzzer_on(uint16_t freq_hz) {
  if (!buzzer_ready_) return HwStatus::DRIVER_FAULT;
  if (ledcWriteTone(board::BUZZER_LEDC_CH, freq_hz) == 0) return HwStatus::DRIVER_FAULT;
  return HwStatus::OK;
}

HwStatus BoardBackend::buzzer_off() {
  if (!buzzer_ready_) return HwStatus::DRIVER_FAULT;
  ledcWriteTone(board::BUZZER_LEDC_CH, 0);
  return HwStatus::OK;
}

// beep() / tone() — blocking; the buzzer is always silenced afterwards,
// even if starting it failed halfway.
HwStatus BoardBackend::beep(uint16_t duration_ms, uint16_t freq_hz) {
  HwStatus s = buzzer_on(freq_hz);
  if (s != HwStatus::OK) {
    if (buzzer_ready_) ledcWriteTone(board::BUZZER_LEDC_CH, 0);
    return s;
  }
  delay(duration_ms);
  return buzzer_off();
}

HwStatus BoardBackend::tone(uint16_t freq_hz, uint16_t duration_ms) {
  return beep(duration_ms, freq_hz);
}

// ============================================================================
// ArduinoClock
// ============================================================================

uint32_t ArduinoClock::millis() { return ::millis(); }

void ArduinoClock::delay_ms(uint32_t ms) { ::delay(ms); }
