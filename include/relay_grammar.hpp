#pragma once
/**
 * @page pr-grammar PicoRelay Command Grammar (shared contract)
 * @file relay_grammar.hpp
 * @brief Command vocabulary, parameter rules, error codes, and value checks.
 *
 * Overview
 * --------
 * This header is the single source of truth for what a valid PicoRelay
 * command looks like. The firmware dispatcher validates inbound lines with
 * validate_tokens(); the host encoder (host_protocol.*) applies its own,
 * independently written checks built from the same constants. Both sides
 * must agree bit-for-bit on the wire, so every range, count, and error code
 * the protocol knows about lives here.
 *
 * Wire Format
 * -----------
 *   request  : <COMMAND>[ <P1>[ <P2>]]\n      (ASCII, case-insensitive)
 *   response : OK\n | <data>\n | ERROR:<CODE>\n
 *
 * Command Table
 * -------------
 *   PING      0      -> PONG
 *   STATUS    0      -> 8-char pattern, MSB = relay 8
 *   ON/OFF    1      relay 1..8
 *   ALL       1      ON | OFF
 *   SET       1      8-char pattern of '0'/'1', MSB = relay 8
 *   PULSE     2      relay 1..8, duration 1..5000 ms (blocks)
 *   INFO      0      -> NAME,V<ver>,<n>CH,UID:<hex16>
 *   UID       0      -> 16 uppercase hex chars
 *   VERSION   0      -> firmware version string
 *   HELP      0      -> "Commands: " + comma list
 *   NAME      1..2   relay 1..8 [, name <= 32 chars] (absent = clear)
 *   GET       2      literal NAME, relay 1..8
 *   BEEP      0..1   [duration 1..5000 ms, default 100]
 *   BUZZ      1      ON | OFF
 *   TONE      2      frequency 50..20000 Hz, duration 1..5000 ms
 *   SAVE      0      -> SAVED
 *   LOAD      0      -> LOADED | ERROR:NO_SAVED_STATE
 *   CLEAR     0      -> CLEARED
 *
 * Bit Order
 * ---------
 * Wire patterns (STATUS, SET) put relay 8 at index 0. Persisted state strings
 * put relay 1 at index 0. reverse_pattern() is the only sanctioned crossing.
 *
 * Validation Order
 * ----------------
 * 1) unknown name            -> INVALID_COMMAND
 * 2) parameter count         -> INVALID_PARAMETER_COUNT
 * 3) per-command value rules -> INVALID_RELAY_NUMBER / INVALID_PARAMETER
 *
 * Durations are capped at 5000 ms so a blocking PULSE/BEEP/TONE always
 * finishes inside the firmware watchdog window. Treat that bound as a
 * correctness limit, not a tuning knob.
 *
 * @author Leo
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace picorelay {

// -----------------------------------------------------------------------------
// Protocol constants
// -----------------------------------------------------------------------------

constexpr uint8_t  kRelayCount      = 8;
constexpr uint8_t  kMinRelay        = 1;
constexpr uint8_t  kMaxRelay        = 8;
constexpr size_t   kPatternLength   = 8;
constexpr size_t   kNameMaxLength   = 32;
constexpr uint16_t kMinDurationMs   = 1;
constexpr uint16_t kMaxDurationMs   = 5000;   // watchdog-safe upper bound
constexpr uint16_t kDefaultBeepMs   = 100;
constexpr uint16_t kMinToneHz       = 50;
constexpr uint16_t kMaxToneHz       = 20000;
constexpr size_t   kMaxLineLength   = 64;     // request bytes, excluding terminator

constexpr char kLineTerminator  = '\n';
constexpr const char* kOkResponse    = "OK";
constexpr const char* kPongResponse  = "PONG";
constexpr const char* kErrorPrefix   = "ERROR:";
constexpr const char* kHelpPrefix    = "Commands: ";
constexpr const char* kSavedResponse   = "SAVED";
constexpr const char* kLoadedResponse  = "LOADED";
constexpr const char* kClearedResponse = "CLEARED";

// -----------------------------------------------------------------------------
// Vocabulary
// -----------------------------------------------------------------------------

/**
 * @enum CommandKind
 * @brief Closed set of wire commands. Declaration order is the HELP order.
 *
 * The validator, dispatcher and host encoder switch over CommandKind
 * exhaustively with no default branch, so a new entry here fails the build
 * (-Wswitch) until each of them handles it.
 */
enum class CommandKind : uint8_t {
  PING,
  STATUS,
  ON,
  OFF,
  ALL,
  SET,
  PULSE,
  INFO,
  UID,
  NAME,
  GET,
  BEEP,
  BUZZ,
  TONE,
  VERSION,
  HELP,
  SAVE,
  LOAD,
  CLEAR
};

constexpr size_t kCommandKindCount = 19;

/**
 * @enum ErrorCode
 * @brief Every code that may follow "ERROR:" on the wire.
 *
 * RELAY_BUSY is reserved and never produced by the dispatcher. TIMEOUT is
 * host-local: the device never sends it, the host client uses it to label a
 * read that produced no line.
 */
enum class ErrorCode : uint8_t {
  INVALID_COMMAND,
  INVALID_RELAY_NUMBER,
  INVALID_PARAMETER,
  INVALID_PARAMETER_COUNT,
  RELAY_BUSY,
  TIMEOUT,
  HARDWARE_ERROR,
  SAVE_FAILED,
  LOAD_FAILED,
  NO_SAVED_STATE,
  CLEAR_FAILED
};

/// Inclusive parameter-count range for a command.
struct Arity {
  uint8_t min;
  uint8_t max;
};

/**
 * @struct Command
 * @brief A fully validated request. Only the fields its kind uses are set.
 */
struct Command {
  CommandKind kind        = CommandKind::PING;
  uint8_t     relay       = 0;      ///< ON, OFF, PULSE, NAME, GET
  bool        on          = false;  ///< ALL, BUZZ
  std::string pattern;              ///< SET (wire order, MSB = relay 8)
  uint16_t    duration_ms = 0;      ///< PULSE, BEEP, TONE
  uint16_t    freq_hz     = 0;      ///< TONE
  bool        has_name    = false;  ///< NAME: false means "clear"
  std::string name;                 ///< NAME
};

// -----------------------------------------------------------------------------
// Lookup
// -----------------------------------------------------------------------------

/// Canonical uppercase wire name ("PING", "GET", ...).
const char* command_name(CommandKind kind);

/**
 * @brief Resolve a wire name (any case) to its CommandKind.
 * @retval false Name is not in the vocabulary; @p out is untouched.
 */
bool command_from_name(const std::string& name, CommandKind& out);

Arity command_arity(CommandKind kind);

/// Wire spelling of an error code, without the "ERROR:" prefix.
const char* error_code_name(ErrorCode code);

/// Reverse of error_code_name(); exact uppercase match.
bool error_code_from_name(const std::string& name, ErrorCode& out);

/// "Commands: PING,STATUS,...,CLEAR" in declaration order.
std::string help_text();

// -----------------------------------------------------------------------------
// Value checks (shared by device validation and host encoding)
// -----------------------------------------------------------------------------

/**
 * @brief Parse a decimal integer token.
 *
 * Accepts an optional leading '+' or '-' and leading zeros. Anything else
 * (empty, bare sign, non-digit) fails. Magnitudes beyond int32 range
 * saturate, so a huge token still parses and is rejected later as out of
 * range rather than as malformed.
 */
bool parse_int(const std::string& token, int32_t& out);

bool is_valid_relay(int32_t relay);
bool is_valid_duration(int32_t ms);
bool is_valid_frequency(int32_t hz);

/// Exactly kPatternLength characters, each '0' or '1'.
bool is_binary_pattern(const std::string& s);

/// Length-only check (0..kNameMaxLength). Content is not restricted.
bool is_valid_name_length(const std::string& name);

/// ASCII case-insensitive equality.
bool equals_ignore_case(const std::string& a, const char* b);

/// Reverse an 8-char state string (wire order <-> storage order).
std::string reverse_pattern(const std::string& s);

// -----------------------------------------------------------------------------
// Device-side validation
// -----------------------------------------------------------------------------

/**
 * @brief Validate a tokenized request against the grammar.
 *
 * @param tokens  tokens[0] is the command name, the rest are parameters.
 * @param out     Filled on success with typed fields for the command.
 * @param err     Filled on failure with the wire error code.
 *
 * @retval true   @p out is ready to execute.
 * @retval false  @p err says why; nothing must be executed.
 *
 * @note Keyword parameters (ON/OFF/NAME) compare case-insensitively. NAME
 *       values are copied verbatim; callers that uppercase the whole line
 *       first will store uppercase names.
 */
bool validate_tokens(const std::vector<std::string>& tokens,
                     Command& out,
                     ErrorCode& err);

} // namespace picorelay
