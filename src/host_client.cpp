// host_client.cpp — implementation for host_client.hpp
// See host_client.hpp for the error model and usage.

#include "host_client.hpp"
#include "relay_config.hpp"   // default_relay_name
#include "relay_log.hpp"

#include <chrono>
#include <cstdlib>            // strtol
#include <thread>

namespace picorelay {

// ============================================================================
// Helpers
// ============================================================================

// Duration the device will block for, taken from already-validated args.
static uint32_t blocking_ms(CommandKind kind, const std::vector<std::string>& args) {
  switch (kind) {
    case CommandKind::PULSE:
    case CommandKind::TONE:
      return static_cast<uint32_t>(std::strtol(args[1].c_str(), nullptr, 10));
    case CommandKind::BEEP:
      return args.empty() ? kDefaultBeepMs
                          : static_cast<uint32_t>(std::strtol(args[0].c_str(), nullptr, 10));
    default:
      return 0;
  }
}

static std::string strip_terminator(const std::string& wire) {
  std::string s = wire;
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
  return s;
}

// ============================================================================
// Lifecycle
// ============================================================================

RelayClient::RelayClient(std::unique_ptr<SerialLink> link, const ClientOptions& opts)
    : link_(std::move(link)), opts_(opts), connected_(false) {}

RelayClient::~RelayClient() {
  disconnect();
}

void RelayClient::require_link() const {
  if (!link_ || !link_->is_open()) throw ConnectionError("serial link is not open");
}

//
// connect()
// ---------
// The board may still be booting when the port opens, so PING is retried
// every poll interval until PONG arrives or the connect timeout expires.
// Stale bytes from a previous session are flushed first. A board that was
// still booting may answer several queued PINGs at once, so whatever is left
// after the first PONG is flushed too.
//
void RelayClient::connect() {
  require_link();
  link_->flush_input();

  typedef std::chrono::steady_clock clock;
  const clock::time_point deadline =
      clock::now() + std::chrono::milliseconds(opts_.connect_timeout_ms);
  const std::string ping = std::string(command_name(CommandKind::PING)) + kLineTerminator;

  do {
    if (!link_->write_line(ping)) throw ConnectionError("write failed during connect");

    std::string line;
    const ReadStatus st = link_->read_line(line, opts_.read_timeout_ms);
    if (st == ReadStatus::IO_ERROR) throw ConnectionError("link failed during connect");
    if (st == ReadStatus::LINE && trim(line) == kPongResponse) {
      std::this_thread::sleep_for(std::chrono::milliseconds(opts_.poll_interval_ms));
      link_->flush_input();
      connected_ = true;
      PICORELAY_LOG_INFO("connected");
      return;
    }
    if (st == ReadStatus::LINE) {
      PICORELAY_LOG_DEBUG("connect: ignoring '%s'", trim(line).c_str());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(opts_.poll_interval_ms));
  } while (clock::now() < deadline);

  throw ConnectionError("board not responding to PING");
}

void RelayClient::disconnect() {
  if (link_ && link_->is_open()) link_->close();
  connected_ = false;
}

// ============================================================================
// Exchange
// ============================================================================

//
// exchange()
// ----------
// One request, one response line. Input is flushed before writing so a late
// answer to an earlier, timed-out request can never be taken for this one.
//
std::string RelayClient::exchange(const std::string& wire, const char* label, uint32_t extra_ms) {
  require_link();
  link_->flush_input();
  PICORELAY_LOG_DEBUG("[TX] %s", strip_terminator(wire).c_str());
  if (!link_->write_line(wire)) throw ConnectionError(std::string("write failed: ") + label);

  std::string line;
  switch (link_->read_line(line, opts_.read_timeout_ms + extra_ms)) {
    case ReadStatus::LINE:
      break;
    case ReadStatus::TIMEOUT:
      throw TimeoutError(std::string("no response to ") + label);
    case ReadStatus::IO_ERROR:
      connected_ = false;
      throw ConnectionError(std::string("link failed during ") + label);
  }
  PICORELAY_LOG_DEBUG("[RX] %s", line.c_str());
  return trim(line);
}

std::string RelayClient::send_command(CommandKind kind, const std::vector<std::string>& args) {
  std::string wire, err;
  if (!build_request(kind, args, wire, err)) throw ValidationError(err);
  if (!connected_) throw ConnectionError("not connected");

  const char* label = command_name(kind);
  Response r = decode_response(exchange(wire, label, blocking_ms(kind, args)));
  if (!r.ok) {
    PICORELAY_LOG_WARN("%s rejected: %s", label, r.error_code.c_str());
    throw CommandError(label, r.error_code);
  }
  return r.data;
}

std::string RelayClient::send_raw(const std::string& line) {
  if (!connected_) throw ConnectionError("not connected");
  return exchange(strip_terminator(line) + kLineTerminator, "raw", 0);
}

// ============================================================================
// Typed operations
// ============================================================================

bool RelayClient::ping() {
  return send_command(CommandKind::PING) == kPongResponse;
}

BoardInfo RelayClient::info() {
  return parse_info(send_command(CommandKind::INFO));
}

std::string RelayClient::uid() {
  return send_command(CommandKind::UID);
}

std::string RelayClient::version() {
  return send_command(CommandKind::VERSION);
}

std::vector<std::string> RelayClient::help() {
  return parse_help(send_command(CommandKind::HELP));
}

std::map<int, bool> RelayClient::status() {
  const std::string pattern = send_command(CommandKind::STATUS);
  std::map<int, bool> out;
  if (!parse_status(pattern, out)) {
    throw ClientError("malformed STATUS response '" + pattern + "'");
  }
  return out;
}

std::string RelayClient::get_name(int relay) {
  return send_command(CommandKind::GET, {"NAME", std::to_string(relay)});
}

//
// relay_states()
// --------------
// One STATUS plus one GET NAME per relay. A name that is empty or whose
// lookup was refused or timed out shows as "Relay <n>". Connection loss is
// not papered over.
//
std::vector<RelayState> RelayClient::relay_states() {
  const std::map<int, bool> st = status();
  std::vector<RelayState> out;
  for (int r = kMinRelay; r <= kMaxRelay; ++r) {
    RelayState rs;
    rs.relay = r;
    rs.on = st.at(r);
    try {
      rs.name = get_name(r);
    } catch (const CommandError& e) {
      PICORELAY_LOG_DEBUG("name %d: %s", r, e.what());
    } catch (const TimeoutError& e) {
      PICORELAY_LOG_DEBUG("name %d: %s", r, e.what());
    }
    if (rs.name.empty()) rs.name = default_relay_name(static_cast<uint8_t>(r));
    out.push_back(rs);
  }
  return out;
}

void RelayClient::relay_on(int relay)  { send_command(CommandKind::ON,  {std::to_string(relay)}); }
void RelayClient::relay_off(int relay) { send_command(CommandKind::OFF, {std::to_string(relay)}); }
void RelayClient::all_on()             { send_command(CommandKind::ALL, {"ON"}); }
void RelayClient::all_off()            { send_command(CommandKind::ALL, {"OFF"}); }

void RelayClient::set_pattern(const std::string& pattern) {
  send_command(CommandKind::SET, {pattern});
}

void RelayClient::pulse(int relay, int duration_ms) {
  send_command(CommandKind::PULSE, {std::to_string(relay), std::to_string(duration_ms)});
}

void RelayClient::set_name(int relay, const std::string& name) {
  send_command(CommandKind::NAME, {std::to_string(relay), name});
}

void RelayClient::clear_name(int relay) {
  send_command(CommandKind::NAME, {std::to_string(relay)});
}

// Bare BEEP leaves the duration to the device default.
void RelayClient::beep() {
  send_command(CommandKind::BEEP);
}

void RelayClient::beep(int duration_ms) {
  send_command(CommandKind::BEEP, {std::to_string(duration_ms)});
}

void RelayClient::buzzer_on()  { send_command(CommandKind::BUZZ, {"ON"}); }
void RelayClient::buzzer_off() { send_command(CommandKind::BUZZ, {"OFF"}); }

void RelayClient::tone(int freq_hz, int duration_ms) {
  send_command(CommandKind::TONE, {std::to_string(freq_hz), std::to_string(duration_ms)});
}

// SAVE / LOAD / CLEAR answer with a word, not OK; anything else is a protocol
// mismatch worth surfacing.
static void expect_word(const std::string& got, const char* want, const char* label) {
  if (got != want) {
    throw ClientError(std::string(label) + ": unexpected response '" + got + "'");
  }
}

void RelayClient::save_states()  { expect_word(send_command(CommandKind::SAVE),  kSavedResponse,   "SAVE"); }
void RelayClient::load_states()  { expect_word(send_command(CommandKind::LOAD),  kLoadedResponse,  "LOAD"); }
void RelayClient::clear_states() { expect_word(send_command(CommandKind::CLEAR), kClearedResponse, "CLEAR"); }

} // namespace picorelay
