// relay_dispatch.cpp — implementation for relay_dispatch.hpp
// See relay_dispatch.hpp for the per-line pipeline and invariants.

#include "relay_dispatch.hpp"
#include "relay_log.hpp"

#include <cctype>    // std::toupper, std::isspace
#include <cstdio>    // snprintf

namespace picorelay {

// ============================================================================
// Line helpers
// ============================================================================

static bool is_blank(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

std::string normalize_line(const std::string& raw) {
  size_t b = 0, e = raw.size();
  while (b < e && is_blank(raw[b])) ++b;
  while (e > b && is_blank(raw[e - 1])) --e;

  std::string out = raw.substr(b, e - b);
  for (char& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

std::vector<std::string> tokenize(const std::string& line) {
  std::vector<std::string> toks;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && is_blank(line[i])) ++i;
    size_t start = i;
    while (i < line.size() && !is_blank(line[i])) ++i;
    if (i > start) toks.push_back(line.substr(start, i - start));
  }
  return toks;
}

std::string format_error(ErrorCode code) {
  return std::string(kErrorPrefix) + error_code_name(code);
}

double ProtocolStatistics::error_rate() const {
  if (command_count == 0) return 0.0;
  return static_cast<double>(error_count) / static_cast<double>(command_count);
}

// ============================================================================
// Dispatcher
// ============================================================================

Dispatcher::Dispatcher(RelayBackend& backend,
                       ConfigStore& store,
                       Clock& clock,
                       const BoardIdentity& identity)
    : backend_(backend),
      store_(store),
      clock_(clock),
      identity_(identity),
      last_failed_(false) {}

void Dispatcher::reset_statistics() {
  stats_ = ProtocolStatistics();
}

std::string Dispatcher::fail(ErrorCode code) {
  ++stats_.error_count;
  last_failed_ = true;
  return format_error(code);
}

// hw() — collapse a backend status into OK or HARDWARE_ERROR.
std::string Dispatcher::hw(HwStatus s, const char* what) {
  if (s == HwStatus::OK) return kOkResponse;
  PICORELAY_LOG_WARN("%s failed: %s", what, hw_status_name(s));
  return fail(ErrorCode::HARDWARE_ERROR);
}

std::string Dispatcher::info_line() const {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "%s,V%s,%uCH,UID:%s",
                identity_.board_name.c_str(),
                identity_.board_version.c_str(),
                static_cast<unsigned>(kRelayCount),
                identity_.uid.c_str());
  return buf;
}

//
// process_line()
// --------------
// Count first, so a line that fails anywhere below is still accounted for.
//
std::string Dispatcher::process_line(const std::string& raw) {
  ++stats_.command_count;
  stats_.last_command_time = clock_.millis();
  last_failed_ = false;

  const std::string line = normalize_line(raw);
  PICORELAY_LOG_DEBUG("[RX] %s", line.c_str());

  Command cmd;
  ErrorCode err = ErrorCode::INVALID_COMMAND;
  if (!validate_tokens(tokenize(line), cmd, err)) {
    PICORELAY_LOG_WARN("rejected '%s': %s", line.c_str(), error_code_name(err));
    return fail(err);
  }
  return execute(cmd);
}

std::string Dispatcher::reject_line(ErrorCode code) {
  ++stats_.command_count;
  stats_.last_command_time = clock_.millis();
  PICORELAY_LOG_WARN("rejected line: %s", error_code_name(code));
  return fail(code);
}

std::string Dispatcher::execute(const Command& cmd) {
  switch (cmd.kind) {
    case CommandKind::PING:
      return kPongResponse;

    case CommandKind::STATUS:
      return backend_.status_binary();

    case CommandKind::ON:
      return hw(backend_.relay_on(cmd.relay), "relay_on");

    case CommandKind::OFF:
      return hw(backend_.relay_off(cmd.relay), "relay_off");

    case CommandKind::ALL:
      return cmd.on ? hw(backend_.all_on(), "all_on")
                    : hw(backend_.all_off(), "all_off");

    case CommandKind::SET:
      return hw(backend_.set_pattern(cmd.pattern), "set_pattern");

    case CommandKind::PULSE: {
      HwStatus s = backend_.relay_on(cmd.relay);
      if (s != HwStatus::OK) return hw(s, "pulse on");
      clock_.delay_ms(cmd.duration_ms);
      return hw(backend_.relay_off(cmd.relay), "pulse off");
    }

    case CommandKind::INFO:
      return info_line();

    case CommandKind::UID:
      return identity_.uid;

    case CommandKind::VERSION:
      return identity_.firmware_version;

    case CommandKind::HELP:
      return help_text();

    case CommandKind::NAME:
      if (!store_.set_name(cmd.relay, cmd.has_name ? cmd.name : std::string())) {
        PICORELAY_LOG_WARN("set_name %u failed", static_cast<unsigned>(cmd.relay));
        return fail(ErrorCode::HARDWARE_ERROR);
      }
      return kOkResponse;

    case CommandKind::GET: {
      std::string name;
      if (!store_.get_name(cmd.relay, name)) {
        PICORELAY_LOG_WARN("get_name %u failed", static_cast<unsigned>(cmd.relay));
        return fail(ErrorCode::HARDWARE_ERROR);
      }
      return name;   // may be empty
    }

    case CommandKind::BEEP:
      return hw(backend_.beep(cmd.duration_ms, kDefaultBuzzerHz), "beep");

    case CommandKind::BUZZ:
      return cmd.on ? hw(backend_.buzzer_on(kDefaultBuzzerHz), "buzzer_on")
                    : hw(backend_.buzzer_off(), "buzzer_off");

    case CommandKind::TONE:
      return hw(backend_.tone(cmd.freq_hz, cmd.duration_ms), "tone");

    case CommandKind::SAVE:
      if (!store_.save_states(reverse_pattern(backend_.status_binary()))) {
        return fail(ErrorCode::SAVE_FAILED);
      }
      return kSavedResponse;

    case CommandKind::LOAD: {
      std::string storage;
      switch (store_.load_states(storage)) {
        case LoadResult::LOADED:
          break;
        case LoadResult::ABSENT:
          return fail(ErrorCode::NO_SAVED_STATE);
      }
      // LOAD_FAILED means the snapshot was read but could not be applied.
      if (backend_.set_states_from_storage_format(storage) != HwStatus::OK) {
        return fail(ErrorCode::LOAD_FAILED);
      }
      return kLoadedResponse;
    }

    case CommandKind::CLEAR:
      if (!store_.clear_states()) return fail(ErrorCode::CLEAR_FAILED);
      return kClearedResponse;
  }
  return fail(ErrorCode::INVALID_COMMAND);
}

//
// apply_boot_state()
// ------------------
// Runs once from setup(), before the first request. An all-zero snapshot is
// skipped because the relays already boot OFF.
//
bool Dispatcher::apply_boot_state() {
  bool auto_load = false;
  if (!store_.get_auto_load(auto_load) || !auto_load) return false;

  std::string storage;
  if (store_.load_states(storage) != LoadResult::LOADED) return false;
  if (storage == std::string(kPatternLength, '0')) return false;

  if (backend_.set_states_from_storage_format(storage) != HwStatus::OK) {
    PICORELAY_LOG_ERROR("boot restore of %s failed", storage.c_str());
    return false;
  }
  PICORELAY_LOG_INFO("restored saved states %s", storage.c_str());
  return true;
}

} // namespace picorelay
