#pragma once
/**
 * @page pr-dispatch PicoRelay Device Dispatcher
 * @file relay_dispatch.hpp
 * @brief Raw request line in, exactly one response line out.
 *
 * Overview
 * --------
 * The dispatcher is the device half of the protocol. It owns no hardware and
 * no storage. It is handed a RelayBackend, a ConfigStore, a Clock and the
 * board identity, and turns each request line into a response:
 *
 *   normalize  trim, uppercase the whole line
 *   tokenize   split on runs of whitespace
 *   validate   validate_tokens() from relay_grammar.hpp
 *   execute    one exhaustive switch over CommandKind
 *   format     "OK" | data | "ERROR:<CODE>"
 *
 * Where It Sits
 * -------------
 *   UART bytes -> node_link (LineAssembler) -> Dispatcher::process_line()
 *              <- node_link appends '\n'    <- response string
 *
 * Responses are returned without the terminator; the transport adds it.
 *
 * Invariants
 * ----------
 * - Every call to process_line() or reject_line() counts one command.
 *   Every error response also counts one error.
 * - A failed validation never reaches the backend or the store.
 * - Nothing escapes: backend and store failures become error lines, and the
 *   caller's loop keeps running.
 * - PULSE blocks on Clock::delay_ms() for its full duration and always
 *   attempts the OFF step after a successful ON.
 *
 * Case Handling
 * -------------
 * The entire line is uppercased before tokenizing, names included. "NAME 1
 * pump" stores "PUMP". Hosts that care about case must not expect it to
 * survive the round trip.
 *
 * @author Leo
 */

#include <cstdint>
#include <string>
#include <vector>

#include "relay_grammar.hpp"
#include "relay_backend.hpp"
#include "relay_config.hpp"

namespace picorelay {

/// Static facts reported by INFO, UID and VERSION.
struct BoardIdentity {
  std::string board_name;        ///< "WAVESHARE-PICO-RELAY-B"
  std::string board_version;     ///< "1.0" (INFO prefixes 'V')
  std::string firmware_version;  ///< VERSION response
  std::string uid;               ///< 16 uppercase hex chars
};

struct ProtocolStatistics {
  uint32_t command_count     = 0;
  uint32_t error_count       = 0;
  uint32_t last_command_time = 0;   ///< Clock::millis() of the last line

  /// error_count / command_count, 0 when nothing was processed.
  double error_rate() const;
};

/// Trim and uppercase. Interior whitespace is preserved.
std::string normalize_line(const std::string& raw);

/// Split on runs of spaces/tabs. Leading and trailing runs yield nothing.
std::vector<std::string> tokenize(const std::string& line);

/// "ERROR:" + code name.
std::string format_error(ErrorCode code);

class Dispatcher {
 public:
  Dispatcher(RelayBackend& backend,
             ConfigStore& store,
             Clock& clock,
             const BoardIdentity& identity);

  /// Handle one request (terminator already stripped).
  std::string process_line(const std::string& raw);

  /**
   * @brief Answer a request that never made it to parsing (e.g. too long).
   *
   * Counts as a processed command and an error.
   */
  std::string reject_line(ErrorCode code);

  /**
   * @brief Boot-time restore of the saved snapshot.
   *
   * Applies saved states only when auto-load is on, a snapshot exists and
   * it is not all zeros.
   *
   * @retval true  A snapshot was applied.
   */
  bool apply_boot_state();

  const ProtocolStatistics& statistics() const { return stats_; }
  void reset_statistics();

  /// True if the most recent response was an error line.
  bool last_failed() const { return last_failed_; }

 private:
  std::string execute(const Command& cmd);
  std::string fail(ErrorCode code);
  std::string hw(HwStatus s, const char* what);

  std::string info_line() const;

  RelayBackend&      backend_;
  ConfigStore&       store_;
  Clock&             clock_;
  BoardIdentity      identity_;
  ProtocolStatistics stats_;
  bool               last_failed_;
};

} // namespace picorelay
