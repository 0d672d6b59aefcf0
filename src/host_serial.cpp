// host_serial.cpp — implementation for host_serial.hpp
// termios setup, poll()-bounded line reads, sysfs port listing.

#include "host_serial.hpp"
#include "relay_log.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>    // strtoul
#include <cstring>    // strerror
#include <fstream>

#include <dirent.h>
#include <fcntl.h>
#include <limits.h>   // PATH_MAX
#include <poll.h>
#include <stdlib.h>   // realpath
#include <termios.h>
#include <unistd.h>

namespace picorelay {

// ============================================================================
// Baud mapping
// ============================================================================

static bool to_speed(uint32_t baud, speed_t& out) {
  switch (baud) {
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
    case 230400: out = B230400; return true;
    default:     return false;
  }
}

// ============================================================================
// PosixSerialLink
// ============================================================================

PosixSerialLink::PosixSerialLink() : fd_(-1) {}

PosixSerialLink::~PosixSerialLink() {
  close();
}

//
// open()
// ------
// Raw mode: no echo, no canonical processing, no CR/LF translation, no
// software or hardware flow control. VMIN/VTIME are zero because every read
// is gated by poll().
//
bool PosixSerialLink::open(const std::string& port, uint32_t baud, std::string& err) {
  close();

  speed_t speed;
  if (!to_speed(baud, speed)) { err = "bad_baud:" + std::to_string(baud); return false; }

  int fd = ::open(port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    err = std::string("open_failed:") + std::strerror(errno);
    return false;
  }

  struct termios tio;
  if (::tcgetattr(fd, &tio) != 0) {
    err = std::string("tcgetattr_failed:") + std::strerror(errno);
    ::close(fd);
    return false;
  }
  ::cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CSTOPB;
  tio.c_cflag &= ~CRTSCTS;
  tio.c_iflag &= ~(IXON | IXOFF | IXANY);
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;
  ::cfsetispeed(&tio, speed);
  ::cfsetospeed(&tio, speed);

  if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
    err = std::string("tcsetattr_failed:") + std::strerror(errno);
    ::close(fd);
    return false;
  }

  fd_ = fd;
  port_ = port;
  rx_.clear();
  PICORELAY_LOG_DEBUG("opened %s @ %u", port.c_str(), static_cast<unsigned>(baud));
  return true;
}

void PosixSerialLink::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    PICORELAY_LOG_DEBUG("closed %s", port_.c_str());
  }
  fd_ = -1;
  rx_.clear();
}

bool PosixSerialLink::write_line(const std::string& line) {
  if (fd_ < 0) return false;

  size_t off = 0;
  while (off < line.size()) {
    ssize_t n = ::write(fd_, line.data() + off, line.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        struct pollfd p = {fd_, POLLOUT, 0};
        if (::poll(&p, 1, 1000) <= 0) return false;
        continue;
      }
      PICORELAY_LOG_ERROR("write %s: %s", port_.c_str(), std::strerror(errno));
      return false;
    }
    off += static_cast<size_t>(n);
  }
  ::tcdrain(fd_);
  return true;
}

//
// read_line()
// -----------
// Serve from rx_ first. Otherwise poll() in slices until a '\n' shows up or
// the overall deadline passes. Partial bytes stay buffered for the next call.
//
ReadStatus PosixSerialLink::read_line(std::string& line, uint32_t timeout_ms) {
  if (fd_ < 0) return ReadStatus::IO_ERROR;

  typedef std::chrono::steady_clock clock;
  const clock::time_point deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

  for (;;) {
    const size_t nl = rx_.find('\n');
    if (nl != std::string::npos) {
      line = rx_.substr(0, nl);
      rx_.erase(0, nl + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      return ReadStatus::LINE;
    }

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - clock::now()).count();
    if (left <= 0) return ReadStatus::TIMEOUT;

    struct pollfd p = {fd_, POLLIN, 0};
    int rc = ::poll(&p, 1, static_cast<int>(left));
    if (rc < 0) {
      if (errno == EINTR) continue;
      return ReadStatus::IO_ERROR;
    }
    if (rc == 0) return ReadStatus::TIMEOUT;
    if (p.revents & (POLLERR | POLLHUP | POLLNVAL)) return ReadStatus::IO_ERROR;

    char buf[128];
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      return ReadStatus::IO_ERROR;
    }
    if (n == 0) return ReadStatus::IO_ERROR;   // device went away
    rx_.append(buf, static_cast<size_t>(n));
  }
}

void PosixSerialLink::flush_input() {
  rx_.clear();
  if (fd_ >= 0) ::tcflush(fd_, TCIFLUSH);
}

// ============================================================================
// sysfs port listing
// ============================================================================

static std::string read_attr(const std::string& dir, const char* name) {
  std::ifstream f(dir + "/" + name);
  std::string s;
  if (f) std::getline(f, s);
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
  return s;
}

static std::string parent_dir(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  return (slash == std::string::npos || slash == 0) ? std::string() : path.substr(0, slash);
}

//
// list_usb_serial_ports()
// -----------------------
// /sys/class/tty/<name>/device resolves to the USB interface (ttyACM) or a
// child of it (ttyUSB). Walk up from there until a directory carries
// idVendor; that is the USB device with the descriptors we want.
//
std::vector<UsbSerialPort> list_usb_serial_ports() {
  std::vector<UsbSerialPort> out;

  DIR* d = ::opendir("/sys/class/tty");
  if (!d) return out;

  while (struct dirent* e = ::readdir(d)) {
    const std::string name = e->d_name;
    if (name.compare(0, 6, "ttyACM") != 0 && name.compare(0, 6, "ttyUSB") != 0) continue;

    const std::string link = "/sys/class/tty/" + name + "/device";
    char resolved[PATH_MAX];
    if (!::realpath(link.c_str(), resolved)) continue;

    std::string dir = resolved;
    std::string vid;
    for (int depth = 0; depth < 4 && !dir.empty(); ++depth) {
      vid = read_attr(dir, "idVendor");
      if (!vid.empty()) break;
      dir = parent_dir(dir);
    }
    if (vid.empty()) continue;

    UsbSerialPort p;
    p.device       = "/dev/" + name;
    p.vendor_id    = static_cast<uint16_t>(std::strtoul(vid.c_str(), nullptr, 16));
    p.product_id   = static_cast<uint16_t>(std::strtoul(read_attr(dir, "idProduct").c_str(), nullptr, 16));
    p.manufacturer = read_attr(dir, "manufacturer");
    p.product      = read_attr(dir, "product");
    p.serial       = read_attr(dir, "serial");
    out.push_back(p);
  }
  ::closedir(d);

  std::sort(out.begin(), out.end(),
            [](const UsbSerialPort& a, const UsbSerialPort& b) { return a.device < b.device; });
  return out;
}

} // namespace picorelay
