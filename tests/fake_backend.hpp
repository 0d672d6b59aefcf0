#pragma once
// fake_backend.hpp — in-memory RelayBackend and Clock for host-side tests.

#include <cstdint>
#include <string>
#include <vector>

#include "relay_backend.hpp"
#include "relay_grammar.hpp"

namespace picorelay {
namespace test {

class FakeClock : public Clock {
 public:
  uint32_t millis() override { return now; }
  void delay_ms(uint32_t ms) override {
    delays.push_back(ms);
    now += ms;
  }

  uint32_t              now = 1000;
  std::vector<uint32_t> delays;
};

// Records every call as a short string ("on 3", "beep 100@1000", ...).
// fail_relay makes that relay's outputs report DRIVER_FAULT; buzzer_fault
// does the same for all buzzer calls.
class FakeBackend : public RelayBackend {
 public:
  HwStatus relay_on(uint8_t relay) override  { return drive(relay, true); }
  HwStatus relay_off(uint8_t relay) override { return drive(relay, false); }

  bool relay_state(uint8_t relay) const override {
    if (!is_valid_relay(relay)) return false;
    return states[relay - 1];
  }

  HwStatus buzzer_on(uint16_t freq_hz) override {
    calls.push_back("buzz on " + std::to_string(freq_hz));
    if (buzzer_fault) return HwStatus::DRIVER_FAULT;
    buzzing = true;
    return HwStatus::OK;
  }

  HwStatus buzzer_off() override {
    calls.push_back("buzz off");
    if (buzzer_fault) return HwStatus::DRIVER_FAULT;
    buzzing = false;
    return HwStatus::OK;
  }

  HwStatus beep(uint16_t duration_ms, uint16_t freq_hz) override {
    calls.push_back("beep " + std::to_string(duration_ms) + "@" + std::to_string(freq_hz));
    return buzzer_fault ? HwStatus::DRIVER_FAULT : HwStatus::OK;
  }

  HwStatus tone(uint16_t freq_hz, uint16_t duration_ms) override {
    calls.push_back("tone " + std::to_string(freq_hz) + "/" + std::to_string(duration_ms));
    return buzzer_fault ? HwStatus::DRIVER_FAULT : HwStatus::OK;
  }

  bool                     states[kRelayCount] = {false};
  bool                     buzzing      = false;
  bool                     buzzer_fault = false;
  uint8_t                  fail_relay   = 0;
  std::vector<std::string> calls;

 private:
  HwStatus drive(uint8_t relay, bool on) {
    calls.push_back(std::string(on ? "on " : "off ") + std::to_string(relay));
    if (!is_valid_relay(relay)) return HwStatus::BAD_ARGUMENT;
    if (relay == fail_relay) return HwStatus::DRIVER_FAULT;
    states[relay - 1] = on;
    return HwStatus::OK;
  }
};

} // namespace test
} // namespace picorelay
