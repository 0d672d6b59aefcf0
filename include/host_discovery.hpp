#pragma once
/**
 * @file host_discovery.hpp
 * @brief Find PicoRelay boards among the attached USB serial ports.
 *
 * A port qualifies when:
 *   1) its USB vendor id is one the board family ships with (RP2040 native
 *      USB, Espressif native USB, CH340 bridge);
 *   2) it answers PING with PONG inside the discovery connect timeout;
 *   3) its INFO board name contains both "PICO" and "RELAY".
 *
 * Ports that fail any step are skipped quietly (logged at DEBUG). Discovery
 * never throws for a single bad port.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "host_client.hpp"
#include "host_protocol.hpp"

namespace picorelay {

constexpr uint32_t kDiscoveryTimeoutMs = 2000;

struct BoardCandidate {
  std::string port;
  std::string serial_number;   ///< "RELAY-" + first 8 UID chars
  std::string manufacturer;
  std::string product;
};

bool is_relay_vendor(uint16_t vendor_id);

/// Board-name check, case-insensitive.
bool is_relay_board(const BoardInfo& info);

/// "RELAY-" + uid[0:8] (shorter UIDs are used whole).
std::string board_serial_number(const std::string& uid);

/**
 * @brief Handshake and identify one already-open link.
 *
 * Takes ownership of @p link and closes it before returning.
 *
 * @retval true   The link is a PicoRelay; @p out is filled (port left empty).
 */
bool identify_link(std::unique_ptr<SerialLink> link,
                  const ClientOptions& opts,
                  BoardCandidate& out);

/// Enumerate, filter, open and identify every USB serial port.
std::vector<BoardCandidate> discover_boards(uint32_t baud = 115200);

/// First board found, if any.
bool find_first_board(BoardCandidate& out, uint32_t baud = 115200);

} // namespace picorelay
