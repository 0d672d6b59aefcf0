#pragma once
/**
 * @file relay_backend.hpp
 * @brief Hardware-facing capability set the dispatcher drives, plus its clock.
 *
 * Overview
 * --------
 * The dispatcher never touches a pin. It talks to a RelayBackend (relays and
 * buzzer) and a Clock (millis + blocking delay). The firmware binds these to
 * digitalWrite/LEDC/delay in board_backend.*; the unit tests bind them to
 * in-memory fakes that record calls and inject faults.
 *
 * Result Model
 * ------------
 * Mutating calls return HwStatus. Nothing throws. The dispatcher maps any
 * non-OK status to ERROR:HARDWARE_ERROR and keeps running.
 *
 * Default Behavior
 * ----------------
 * Subclasses must implement the single-relay and buzzer primitives. The bulk
 * operations (all_on, all_off, set_pattern) default to loops over those
 * primitives; a board that can latch all outputs at once may override them.
 * set_states_from_storage_format() and status_binary() are fixed: they only
 * define bit order and must not differ between boards.
 *
 * @author Leo
 */

#include <cstdint>
#include <string>

namespace picorelay {

constexpr uint16_t kDefaultBuzzerHz = 1000;

enum class HwStatus : uint8_t {
  OK,
  BAD_ARGUMENT,    ///< relay out of range / malformed pattern
  DRIVER_FAULT     ///< the output could not be driven
};

const char* hw_status_name(HwStatus s);

/**
 * @class Clock
 * @brief Monotonic milliseconds and a blocking wait.
 *
 * delay_ms() is the only place the device loop is allowed to block.
 */
class Clock {
 public:
  virtual ~Clock() {}
  virtual uint32_t millis() = 0;
  virtual void delay_ms(uint32_t ms) = 0;
};

/**
 * @class RelayBackend
 * @brief Relay bank + buzzer.
 *
 * Relay numbers are 1-based (1..kRelayCount) at this interface.
 */
class RelayBackend {
 public:
  virtual ~RelayBackend() {}

  // --- single relay (required) ---------------------------------------------
  virtual HwStatus relay_on(uint8_t relay)  = 0;
  virtual HwStatus relay_off(uint8_t relay) = 0;
  /// Last commanded state; false for out-of-range relays.
  virtual bool relay_state(uint8_t relay) const = 0;

  // --- bulk (overridable) ----------------------------------------------------
  virtual HwStatus all_on();
  virtual HwStatus all_off();

  /**
   * @brief Drive all relays from a wire-order pattern (index 0 = relay 8).
   *
   * Stops at the first failing relay and returns its status. A malformed
   * pattern returns BAD_ARGUMENT before any output changes.
   */
  virtual HwStatus set_pattern(const std::string& pattern);

  // --- order conversion (fixed) -----------------------------------------------

  /// Storage order (index 0 = relay 1) is reversed, then set_pattern().
  HwStatus set_states_from_storage_format(const std::string& storage);

  /// Wire-order pattern built from relay_state(); index 0 = relay 8.
  std::string status_binary() const;

  // --- buzzer (required) -------------------------------------------------------
  virtual HwStatus buzzer_on(uint16_t freq_hz) = 0;
  virtual HwStatus buzzer_off() = 0;
  virtual HwStatus beep(uint16_t duration_ms, uint16_t freq_hz) = 0;
  virtual HwStatus tone(uint16_t freq_hz, uint16_t duration_ms) = 0;
};

} // namespace picorelay
