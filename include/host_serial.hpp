#pragma once
/**
 * @file host_serial.hpp
 * @brief POSIX tty transport for RelayClient, plus USB serial port listing.
 *
 * PosixSerialLink opens a tty in raw 8N1 mode with no flow control and
 * implements SerialLink with poll()-bounded reads. Lines are split on '\n';
 * a trailing '\r' is dropped. An empty response line (GET NAME on a cleared
 * name) is returned as an empty LINE, never skipped.
 *
 * list_usb_serial_ports() walks /sys/class/tty and reports ttyACM / ttyUSB
 * devices together with the USB descriptors of the interface they hang off.
 * It is Linux-only by nature; on other systems it returns an empty list.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "host_client.hpp"   // SerialLink, ReadStatus

namespace picorelay {

class PosixSerialLink : public SerialLink {
 public:
  PosixSerialLink();
  ~PosixSerialLink() override;

  PosixSerialLink(const PosixSerialLink&) = delete;
  PosixSerialLink& operator=(const PosixSerialLink&) = delete;

  /**
   * @brief Open and configure @p port.
   * @param err Receives "open_failed:<errno text>" or "bad_baud:<n>".
   */
  bool open(const std::string& port, uint32_t baud, std::string& err);

  bool is_open() const override { return fd_ >= 0; }
  void close() override;
  bool write_line(const std::string& line) override;
  ReadStatus read_line(std::string& line, uint32_t timeout_ms) override;
  void flush_input() override;

  const std::string& port() const { return port_; }

 private:
  int         fd_;
  std::string port_;
  std::string rx_;   ///< bytes read past the last returned line
};

/// One USB CDC / UART bridge tty seen in sysfs.
struct UsbSerialPort {
  std::string device;         ///< "/dev/ttyACM0"
  uint16_t    vendor_id  = 0;
  uint16_t    product_id = 0;
  std::string manufacturer;
  std::string product;
  std::string serial;
};

std::vector<UsbSerialPort> list_usb_serial_ports();

} // namespace picorelay
