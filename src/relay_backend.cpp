// relay_backend.cpp — default bulk operations and bit-order helpers
// See relay_backend.hpp for the capability contract.

#include "relay_backend.hpp"
#include "relay_grammar.hpp"   // kRelayCount, is_binary_pattern, reverse_pattern

namespace picorelay {

const char* hw_status_name(HwStatus s) {
  switch (s) {
    case HwStatus::OK:           return "ok";
    case HwStatus::BAD_ARGUMENT: return "bad_argument";
    case HwStatus::DRIVER_FAULT: return "driver_fault";
  }
  return "unknown";
}

HwStatus RelayBackend::all_on() {
  for (uint8_t r = 1; r <= kRelayCount; ++r) {
    HwStatus s = relay_on(r);
    if (s != HwStatus::OK) return s;
  }
  return HwStatus::OK;
}

HwStatus RelayBackend::all_off() {
  for (uint8_t r = 1; r <= kRelayCount; ++r) {
    HwStatus s = relay_off(r);
    if (s != HwStatus::OK) return s;
  }
  return HwStatus::OK;
}

//
// set_pattern()
// -------------
// Walk the wire pattern left to right. Position i maps to relay (8 - i),
// so the rightmost character drives relay 1.
//
HwStatus RelayBackend::set_pattern(const std::string& pattern) {
  if (!is_binary_pattern(pattern)) return HwStatus::BAD_ARGUMENT;

  for (size_t i = 0; i < kPatternLength; ++i) {
    const uint8_t relay = static_cast<uint8_t>(kRelayCount - i);
    HwStatus s = (pattern[i] == '1') ? relay_on(relay) : relay_off(relay);
    if (s != HwStatus::OK) return s;
  }
  return HwStatus::OK;
}

HwStatus RelayBackend::set_states_from_storage_format(const std::string& storage) {
  if (!is_binary_pattern(storage)) return HwStatus::BAD_ARGUMENT;
  return set_pattern(reverse_pattern(storage));
}

std::string RelayBackend::status_binary() const {
  std::string out(kPatternLength, '0');
  for (uint8_t r = 1; r <= kRelayCount; ++r) {
    if (relay_state(r)) out[kRelayCount - r] = '1';
  }
  return out;
}

} // namespace picorelay
