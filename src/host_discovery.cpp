// host_discovery.cpp — implementation for host_discovery.hpp

#include "host_discovery.hpp"
#include "host_serial.hpp"
#include "relay_log.hpp"

#include <cctype>

namespace picorelay {

static const uint16_t kRelayVendors[] = {
  0x2E8A,   // Raspberry Pi (RP2040 native USB)
  0x303A,   // Espressif (native USB CDC)
  0x1A86    // WCH CH340 bridge
};

static const char* kManufacturer = "Waveshare";
static const char* kProduct      = "Pico Relay B Controller";

bool is_relay_vendor(uint16_t vendor_id) {
  for (uint16_t v : kRelayVendors) {
    if (v == vendor_id) return true;
  }
  return false;
}

bool is_relay_board(const BoardInfo& info) {
  std::string up = info.board_name;
  for (auto& c : up) c = (char)std::toupper((unsigned char)c);
  return up.find("PICO") != std::string::npos && up.find("RELAY") != std::string::npos;
}

std::string board_serial_number(const std::string& uid) {
  return "RELAY-" + uid.substr(0, 8);
}

bool identify_link(std::unique_ptr<SerialLink> link,
                  const ClientOptions& opts,
                  BoardCandidate& out) {
  RelayClient client(std::move(link), opts);
  try {
    client.connect();
    const BoardInfo info = client.info();
    if (!is_relay_board(info)) {
      PICORELAY_LOG_DEBUG("identify: '%s' is not a relay board", info.board_name.c_str());
      return false;
    }
    const std::string uid = client.uid();
    out.serial_number = board_serial_number(uid);
    out.manufacturer  = kManufacturer;
    out.product       = kProduct;
    return true;
  } catch (const ClientError& e) {
    PICORELAY_LOG_DEBUG("identify: %s", e.what());
    return false;
  }
}

std::vector<BoardCandidate> discover_boards(uint32_t baud) {
  std::vector<BoardCandidate> boards;

  ClientOptions opts;
  opts.baud = baud;
  opts.connect_timeout_ms = kDiscoveryTimeoutMs;

  for (const UsbSerialPort& p : list_usb_serial_ports()) {
    PICORELAY_LOG_DEBUG("port %s vid=%04x pid=%04x '%s'", p.device.c_str(),
                        p.vendor_id, p.product_id, p.product.c_str());
    if (!is_relay_vendor(p.vendor_id)) continue;

    auto link = std::make_unique<PosixSerialLink>();
    std::string err;
    if (!link->open(p.device, baud, err)) {
      PICORELAY_LOG_DEBUG("skip %s: %s", p.device.c_str(), err.c_str());
      continue;
    }

    BoardCandidate c;
    if (identify_link(std::move(link), opts, c)) {
      c.port = p.device;
      PICORELAY_LOG_INFO("found %s at %s", c.serial_number.c_str(), c.port.c_str());
      boards.push_back(c);
    }
  }
  return boards;
}

bool find_first_board(BoardCandidate& out, uint32_t baud) {
  std::vector<BoardCandidate> boards = discover_boards(baud);
  if (boards.empty()) return false;
  out = boards.front();
  return true;
}

} // namespace picorelay
