#pragma once
/**
 * @page pr-host-protocol PicoRelay Host Encoder / Decoder
 * @file host_protocol.hpp
 * @brief Typed host requests to wire lines, and wire responses back to data.
 *
 * @details
 * PURPOSE
 * -------
 * This is the host half of the line protocol. It never touches a serial
 * port. It only knows how to:
 *   - turn a command kind plus string arguments into one request line,
 *     refusing anything the device would reject (no wire traffic on a bad
 *     call);
 *   - split one response line into success / data / device error code;
 *   - parse structured payloads (STATUS pattern, INFO csv, HELP list).
 *
 * HOST RULES
 * ----------
 * The host checks are written independently of the device validator and are
 * at least as strict:
 *   - relay numbers must be decimal 1..8;
 *   - durations 1..5000, frequency 50..20000;
 *   - ALL / BUZZ take on|off (any case, emitted uppercase);
 *   - SET takes exactly 8 chars of 0/1;
 *   - NAME values must be 1..32 printable chars with no whitespace, because
 *     a space would split into an extra parameter on the device.
 *
 * ERRORS
 * ------
 * Encoder failures are reported as stable strings so scripts can key on
 * them: "bad_count:ON(1)", "bad_value:relay(1..8)", "bad_value:name(no_space)".
 *
 * EXAMPLE
 * -------
 *   std::string line, err;
 *   if (!picorelay::build_request(picorelay::CommandKind::ON, {"3"}, line, err)) {
 *     std::cerr << "status=error reason=" << err << "\n";
 *     return 2;
 *   }
 *   // line == "ON 3\n"
 *
 * @see relay_grammar.hpp  Command table and error codes
 * @see host_client.hpp    Transport + typed exceptions on top of this
 */

#include <map>
#include <string>
#include <vector>

#include "relay_grammar.hpp"

namespace picorelay {

/// One decoded response line.
struct Response {
  bool        ok = false;
  std::string data;         ///< payload; empty for a bare "OK"
  std::string error_code;   ///< text after "ERROR:" when !ok
};

/// Positional INFO fields. Missing trailing fields stay empty.
struct BoardInfo {
  std::string board_name;
  std::string version;      ///< as sent, e.g. "V1.0"
  std::string channels;     ///< as sent, e.g. "8CH"
  std::string uid;          ///< without the "UID:" prefix
};

/**
 * @brief Validate and format one request line (with trailing '\n').
 *
 * @param kind  Command to send.
 * @param args  Parameters as the caller typed them.
 * @param out   Receives the wire line on success.
 * @param err   Receives a stable reason string on failure.
 */
bool build_request(CommandKind kind,
                   const std::vector<std::string>& args,
                   std::string& out,
                   std::string& err);

/// Trim, then classify: "ERROR:<code>" (code non-empty) fails, "OK" succeeds
/// with no data, anything else succeeds with the line as data.
Response decode_response(const std::string& line);

/**
 * @brief STATUS pattern to relay -> on map (keys 1..8).
 * @retval false Pattern is not 8 chars of 0/1.
 */
bool parse_status(const std::string& pattern, std::map<int, bool>& out);

/// Split INFO csv into positional fields; strips "UID:" if present.
BoardInfo parse_info(const std::string& csv);

/// Strip "Commands: " and split on ','; blank entries are dropped.
std::vector<std::string> parse_help(const std::string& text);

/// ASCII trim of spaces, tabs, CR and LF.
std::string trim(const std::string& s);

} // namespace picorelay
