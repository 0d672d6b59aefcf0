#pragma once
/**
 * @page pr-host-client PicoRelay Host Client
 * @file host_client.hpp
 * @brief One-command-in-flight client over an abstract serial link.
 *
 * Overview
 * --------
 * RelayClient sits between callers (relayctl, scripts, tests) and a
 * SerialLink. For each call it:
 *   1) builds the request with build_request() (bad input never hits the wire)
 *   2) writes one line
 *   3) waits for exactly one response line, bounded by the read timeout
 *   4) decodes it and either returns the payload or throws
 *
 * Error Model
 * -----------
 *   ClientError           base, derives std::runtime_error
 *     ConnectionError     link not open, write failed, no PONG on connect
 *     TimeoutError        no response line within the read timeout
 *     CommandError        device answered ERROR:<code>; code() carries it
 *     ValidationError     rejected locally; nothing was sent
 *
 * A TimeoutError never means the device rejected anything. It only means no
 * line arrived in time. PULSE, BEEP and TONE block the device for their
 * duration, so their read deadline is the read timeout plus that duration.
 *
 * Typical Usage
 * -------------
 * @code
 * auto link = std::make_unique<picorelay::PosixSerialLink>();
 * std::string err;
 * if (!link->open("/dev/ttyACM0", 115200, err)) { ... }
 * picorelay::RelayClient client(std::move(link));
 * client.connect();
 * client.relay_on(3);
 * auto states = client.status();   // states[3] == true
 * @endcode
 *
 * Non-Goals
 * ---------
 * - Not thread-safe. Processes sharing a port must serialize themselves.
 * - No retries. A failed call is reported once.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "host_protocol.hpp"
#include "relay_grammar.hpp"

namespace picorelay {

// -----------------------------------------------------------------------------
// Errors
// -----------------------------------------------------------------------------

class ClientError : public std::runtime_error {
 public:
  explicit ClientError(const std::string& what) : std::runtime_error(what) {}
};

class ConnectionError : public ClientError {
 public:
  explicit ConnectionError(const std::string& what) : ClientError(what) {}
};

class TimeoutError : public ClientError {
 public:
  explicit TimeoutError(const std::string& what) : ClientError(what) {}
};

class CommandError : public ClientError {
 public:
  CommandError(const std::string& command, const std::string& code)
      : ClientError(command + " -> ERROR:" + code), command_(command), code_(code) {}

  const std::string& command() const { return command_; }
  const std::string& code() const { return code_; }

  /// Known code, or false for a code this host build does not recognize.
  bool error_code(ErrorCode& out) const { return error_code_from_name(code_, out); }

 private:
  std::string command_;
  std::string code_;
};

class ValidationError : public ClientError {
 public:
  explicit ValidationError(const std::string& what) : ClientError(what) {}
};

// -----------------------------------------------------------------------------
// Transport seam
// -----------------------------------------------------------------------------

enum class ReadStatus : uint8_t {
  LINE,       ///< a full line was read (terminator stripped)
  TIMEOUT,    ///< nothing complete before the deadline
  IO_ERROR    ///< the link failed or closed
};

class SerialLink {
 public:
  virtual ~SerialLink() {}
  virtual bool is_open() const = 0;
  virtual void close() = 0;
  /// Write @p line as-is (caller includes the terminator).
  virtual bool write_line(const std::string& line) = 0;
  virtual ReadStatus read_line(std::string& line, uint32_t timeout_ms) = 0;
  /// Drop anything already received but not yet read.
  virtual void flush_input() = 0;
};

// -----------------------------------------------------------------------------
// Client
// -----------------------------------------------------------------------------

struct ClientOptions {
  uint32_t baud               = 115200;
  uint32_t read_timeout_ms    = 1000;
  uint32_t connect_timeout_ms = 5000;
  uint32_t poll_interval_ms   = 100;
};

struct RelayState {
  int         relay = 0;
  std::string name;
  bool        on = false;
};

class RelayClient {
 public:
  explicit RelayClient(std::unique_ptr<SerialLink> link,
                       const ClientOptions& opts = ClientOptions());
  ~RelayClient();

  RelayClient(const RelayClient&) = delete;
  RelayClient& operator=(const RelayClient&) = delete;

  /// Flush stale input, PING until PONG or the connect timeout, then flush
  /// any extra replies to PINGs the board answered late.
  void connect();
  void disconnect();
  bool is_connected() const { return connected_; }

  /// Send one command; returns the payload ("" for a bare OK).
  std::string send_command(CommandKind kind, const std::vector<std::string>& args = {});

  /// Send an unchecked line and return the trimmed response line verbatim.
  std::string send_raw(const std::string& line);

  // --- queries -----------------------------------------------------------------
  bool ping();
  BoardInfo info();
  std::string uid();
  std::string version();
  std::vector<std::string> help();
  std::map<int, bool> status();
  std::string get_name(int relay);
  std::vector<RelayState> relay_states();

  // --- relays ------------------------------------------------------------------
  void relay_on(int relay);
  void relay_off(int relay);
  void all_on();
  void all_off();
  void set_pattern(const std::string& pattern);
  void pulse(int relay, int duration_ms);

  // --- names -------------------------------------------------------------------
  void set_name(int relay, const std::string& name);
  void clear_name(int relay);

  // --- buzzer ------------------------------------------------------------------
  void beep();
  void beep(int duration_ms);
  void buzzer_on();
  void buzzer_off();
  void tone(int freq_hz, int duration_ms);

  // --- persistence ---------------------------------------------------------------
  void save_states();
  void load_states();
  void clear_states();

  const ClientOptions& options() const { return opts_; }

 private:
  std::string exchange(const std::string& wire, const char* label, uint32_t extra_ms);
  void require_link() const;

  std::unique_ptr<SerialLink> link_;
  ClientOptions               opts_;
  bool                        connected_;
};

} // namespace picorelay
