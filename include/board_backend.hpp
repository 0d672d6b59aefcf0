#pragma once
/**
 * @file board_backend.hpp
 * @brief Arduino bindings for RelayBackend and Clock.
 *
 * BoardBackend drives the relay GPIOs with digitalWrite() and the buzzer
 * through an LEDC channel (ledcWriteTone). It keeps a shadow of the last
 * commanded relay levels because the outputs cannot be read back reliably.
 *
 * ArduinoClock maps millis()/delay(). delay() yields to the RTOS idle task,
 * so a 5000 ms PULSE does not starve the watchdog as long as the watchdog
 * timeout stays above the longest allowed duration.
 */

#include <stdint.h>

#include "board_config.hpp"
#include "relay_backend.hpp"
#include "relay_grammar.hpp"

class BoardBackend : public picorelay::RelayBackend {
 public:
  BoardBackend();

  /// Configure pins, drive every relay OFF, attach the buzzer channel.
  void begin();

  picorelay::HwStatus relay_on(uint8_t relay) override;
  picorelay::HwStatus relay_off(uint8_t relay) override;
  bool relay_state(uint8_t relay) const override;

  picorelay::HwStatus buzzer_on(uint16_t freq_hz) override;
  picorelay::HwStatus buzzer_off() override;
  picorelay::HwStatus beep(uint16_t duration_ms, uint16_t freq_hz) override;
  picorelay::HwStatus tone(uint16_t freq_hz, uint16_t duration_ms) override;

  bool buzzer_ready() const { return buzzer_ready_; }

 private:
  picorelay::HwStatus drive(uint8_t relay, bool on);

  bool state_[board::RELAY_COUNT];
  bool ready_;
  bool buzzer_ready_;
};

class ArduinoClock : public picorelay::Clock {
 public:
  uint32_t millis() override;
  void delay_ms(uint32_t ms) override;
};

static_assert(board::RELAY_COUNT == picorelay::kRelayCount,
              "pin map must cover every protocol relay");
