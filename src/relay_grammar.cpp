// -----------------------------------------------------------------------------
// relay_grammar.cpp
// Implementation of the shared grammar declared in relay_grammar.hpp.
//
// Notes:
//  * The header carries the command table and the validation order.
//  * Everything here is exception-free and allocation-light so it can run on
//    the firmware as-is.
// -----------------------------------------------------------------------------

#include "relay_grammar.hpp"

#include <algorithm>   // std::reverse
#include <cctype>      // std::toupper
#include <climits>     // INT32_MAX / INT32_MIN

namespace picorelay {

// ============================================================================
// Vocabulary tables
// ============================================================================

const char* command_name(CommandKind kind) {
  switch (kind) {
    case CommandKind::PING:    return "PING";
    case CommandKind::STATUS:  return "STATUS";
    case CommandKind::ON:      return "ON";
    case CommandKind::OFF:     return "OFF";
    case CommandKind::ALL:     return "ALL";
    case CommandKind::SET:     return "SET";
    case CommandKind::PULSE:   return "PULSE";
    case CommandKind::INFO:    return "INFO";
    case CommandKind::UID:     return "UID";
    case CommandKind::NAME:    return "NAME";
    case CommandKind::GET:     return "GET";
    case CommandKind::BEEP:    return "BEEP";
    case CommandKind::BUZZ:    return "BUZZ";
    case CommandKind::TONE:    return "TONE";
    case CommandKind::VERSION: return "VERSION";
    case CommandKind::HELP:    return "HELP";
    case CommandKind::SAVE:    return "SAVE";
    case CommandKind::LOAD:    return "LOAD";
    case CommandKind::CLEAR:   return "CLEAR";
  }
  return "";
}

Arity command_arity(CommandKind kind) {
  switch (kind) {
    case CommandKind::PING:
    case CommandKind::STATUS:
    case CommandKind::INFO:
    case CommandKind::UID:
    case CommandKind::VERSION:
    case CommandKind::HELP:
    case CommandKind::SAVE:
    case CommandKind::LOAD:
    case CommandKind::CLEAR:   return Arity{0, 0};

    case CommandKind::ON:
    case CommandKind::OFF:
    case CommandKind::ALL:
    case CommandKind::SET:
    case CommandKind::BUZZ:    return Arity{1, 1};

    case CommandKind::PULSE:
    case CommandKind::GET:
    case CommandKind::TONE:    return Arity{2, 2};

    case CommandKind::NAME:    return Arity{1, 2};
    case CommandKind::BEEP:    return Arity{0, 1};
  }
  return Arity{0, 0};
}

bool command_from_name(const std::string& name, CommandKind& out) {
  // Linear scan over the closed set; 19 entries, clarity wins.
  for (size_t i = 0; i < kCommandKindCount; ++i) {
    const CommandKind k = static_cast<CommandKind>(i);
    if (equals_ignore_case(name, command_name(k))) {
      out = k;
      return true;
    }
  }
  return false;
}

const char* error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::INVALID_COMMAND:         return "INVALID_COMMAND";
    case ErrorCode::INVALID_RELAY_NUMBER:    return "INVALID_RELAY_NUMBER";
    case ErrorCode::INVALID_PARAMETER:       return "INVALID_PARAMETER";
    case ErrorCode::INVALID_PARAMETER_COUNT: return "INVALID_PARAMETER_COUNT";
    case ErrorCode::RELAY_BUSY:              return "RELAY_BUSY";
    case ErrorCode::TIMEOUT:                 return "TIMEOUT";
    case ErrorCode::HARDWARE_ERROR:          return "HARDWARE_ERROR";
    case ErrorCode::SAVE_FAILED:             return "SAVE_FAILED";
    case ErrorCode::LOAD_FAILED:             return "LOAD_FAILED";
    case ErrorCode::NO_SAVED_STATE:          return "NO_SAVED_STATE";
    case ErrorCode::CLEAR_FAILED:            return "CLEAR_FAILED";
  }
  return "INVALID_COMMAND";
}

bool error_code_from_name(const std::string& name, ErrorCode& out) {
  for (uint8_t i = 0; i <= static_cast<uint8_t>(ErrorCode::CLEAR_FAILED); ++i) {
    const ErrorCode c = static_cast<ErrorCode>(i);
    if (name == error_code_name(c)) { out = c; return true; }
  }
  return false;
}

std::string help_text() {
  std::string s = kHelpPrefix;
  for (size_t i = 0; i < kCommandKindCount; ++i) {
    if (i) s += ',';
    s += command_name(static_cast<CommandKind>(i));
  }
  return s;
}

// ============================================================================
// Value checks
// ============================================================================

bool equals_ignore_case(const std::string& a, const char* b) {
  size_t i = 0;
  for (; i < a.size(); ++i) {
    if (b[i] == '\0') return false;
    if (std::toupper(static_cast<unsigned char>(a[i])) !=
        std::toupper(static_cast<unsigned char>(b[i]))) return false;
  }
  return b[i] == '\0';
}

// parse_int() — sign + digits, saturating.
// Saturation keeps "99999999999" in the "parsed but out of range" bucket,
// which decides between INVALID_RELAY_NUMBER and INVALID_PARAMETER upstream.
bool parse_int(const std::string& token, int32_t& out) {
  size_t i = 0;
  bool neg = false;
  if (i < token.size() && (token[i] == '+' || token[i] == '-')) {
    neg = (token[i] == '-');
    ++i;
  }
  if (i >= token.size()) return false;   // empty or bare sign

  int64_t acc = 0;
  for (; i < token.size(); ++i) {
    const char c = token[i];
    if (c < '0' || c > '9') return false;
    if (acc <= INT32_MAX) acc = acc * 10 + (c - '0');   // stop growing once saturated
  }
  if (acc > INT32_MAX) acc = INT32_MAX;
  out = static_cast<int32_t>(neg ? -acc : acc);
  return true;
}

bool is_valid_relay(int32_t relay) {
  return relay >= kMinRelay && relay <= kMaxRelay;
}

bool is_valid_duration(int32_t ms) {
  return ms >= kMinDurationMs && ms <= kMaxDurationMs;
}

bool is_valid_frequency(int32_t hz) {
  return hz >= kMinToneHz && hz <= kMaxToneHz;
}

bool is_binary_pattern(const std::string& s) {
  if (s.size() != kPatternLength) return false;
  for (char c : s) {
    if (c != '0' && c != '1') return false;
  }
  return true;
}

bool is_valid_name_length(const std::string& name) {
  return name.size() <= kNameMaxLength;
}

std::string reverse_pattern(const std::string& s) {
  std::string r(s);
  std::reverse(r.begin(), r.end());
  return r;
}

// ============================================================================
// Device-side validation
// ============================================================================

// parse_on_off() — keyword parameter used by ALL and BUZZ.
static bool parse_on_off(const std::string& tok, bool& on) {
  if (equals_ignore_case(tok, "ON"))  { on = true;  return true; }
  if (equals_ignore_case(tok, "OFF")) { on = false; return true; }
  return false;
}

// parse_relay() — ON/OFF/NAME/GET flavor: anything but a valid 1..8 integer
// is a relay-number error, malformed or not.
static bool parse_relay(const std::string& tok, uint8_t& relay) {
  int32_t v = 0;
  if (!parse_int(tok, v) || !is_valid_relay(v)) return false;
  relay = static_cast<uint8_t>(v);
  return true;
}

// validate_tokens() — name -> count -> values, first failure wins.
bool validate_tokens(const std::vector<std::string>& tokens,
                     Command& out,
                     ErrorCode& err) {
  if (tokens.empty()) { err = ErrorCode::INVALID_COMMAND; return false; }

  CommandKind kind;
  if (!command_from_name(tokens[0], kind)) {
    err = ErrorCode::INVALID_COMMAND;
    return false;
  }

  const size_t n = tokens.size() - 1;
  const Arity a = command_arity(kind);
  if (n < a.min || n > a.max) {
    err = ErrorCode::INVALID_PARAMETER_COUNT;
    return false;
  }

  Command cmd;
  cmd.kind = kind;
  int32_t v = 0;

  switch (kind) {
    case CommandKind::PING:
    case CommandKind::STATUS:
    case CommandKind::INFO:
    case CommandKind::UID:
    case CommandKind::VERSION:
    case CommandKind::HELP:
    case CommandKind::SAVE:
    case CommandKind::LOAD:
    case CommandKind::CLEAR:
      break;

    case CommandKind::ON:
    case CommandKind::OFF:
      if (!parse_relay(tokens[1], cmd.relay)) { err = ErrorCode::INVALID_RELAY_NUMBER; return false; }
      break;

    case CommandKind::ALL:
    case CommandKind::BUZZ:
      if (!parse_on_off(tokens[1], cmd.on)) { err = ErrorCode::INVALID_PARAMETER; return false; }
      break;

    case CommandKind::SET:
      if (!is_binary_pattern(tokens[1])) { err = ErrorCode::INVALID_PARAMETER; return false; }
      cmd.pattern = tokens[1];
      break;

    case CommandKind::PULSE: {
      // Malformed numbers are parameter errors here; only a well-formed
      // relay outside 1..8 is a relay-number error.
      int32_t relay = 0, ms = 0;
      if (!parse_int(tokens[1], relay)) { err = ErrorCode::INVALID_PARAMETER; return false; }
      if (!is_valid_relay(relay))       { err = ErrorCode::INVALID_RELAY_NUMBER; return false; }
      if (!parse_int(tokens[2], ms) || !is_valid_duration(ms)) {
        err = ErrorCode::INVALID_PARAMETER;
        return false;
      }
      cmd.relay = static_cast<uint8_t>(relay);
      cmd.duration_ms = static_cast<uint16_t>(ms);
      break;
    }

    case CommandKind::NAME:
      if (!parse_relay(tokens[1], cmd.relay)) { err = ErrorCode::INVALID_RELAY_NUMBER; return false; }
      if (n == 2) {
        if (!is_valid_name_length(tokens[2])) { err = ErrorCode::INVALID_PARAMETER; return false; }
        cmd.has_name = true;
        cmd.name = tokens[2];
      }
      break;

    case CommandKind::GET:
      if (!equals_ignore_case(tokens[1], "NAME")) { err = ErrorCode::INVALID_PARAMETER; return false; }
      if (!parse_relay(tokens[2], cmd.relay))     { err = ErrorCode::INVALID_RELAY_NUMBER; return false; }
      break;

    case CommandKind::BEEP:
      cmd.duration_ms = kDefaultBeepMs;
      if (n == 1) {
        if (!parse_int(tokens[1], v) || !is_valid_duration(v)) {
          err = ErrorCode::INVALID_PARAMETER;
          return false;
        }
        cmd.duration_ms = static_cast<uint16_t>(v);
      }
      break;

    case CommandKind::TONE: {
      int32_t hz = 0, ms = 0;
      if (!parse_int(tokens[1], hz) || !parse_int(tokens[2], ms)) {
        err = ErrorCode::INVALID_PARAMETER;
        return false;
      }
      if (!is_valid_frequency(hz) || !is_valid_duration(ms)) {
        err = ErrorCode::INVALID_PARAMETER;
        return false;
      }
      cmd.freq_hz = static_cast<uint16_t>(hz);
      cmd.duration_ms = static_cast<uint16_t>(ms);
      break;
    }
  }

  out = cmd;
  return true;
}

} // namespace picorelay
