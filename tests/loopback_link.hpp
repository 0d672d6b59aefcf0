#pragma once
// loopback_link.hpp — SerialLink that answers through a real Dispatcher.
//
// Every written line goes through Dispatcher::process_line() and its
// response is queued for the next read_line(). Lines matching mute_prefix
// get no answer, which the client sees as a timeout; lines matching
// reply_prefix are answered with reply_line instead of the dispatcher.

#include <deque>
#include <string>
#include <vector>

#include "host_client.hpp"
#include "relay_dispatch.hpp"

namespace picorelay {
namespace test {

class LoopbackLink : public SerialLink {
 public:
  explicit LoopbackLink(Dispatcher& d) : dispatcher_(d) {}

  bool is_open() const override { return open_; }
  void close() override { open_ = false; }

  bool write_line(const std::string& line) override {
    if (!open_ || write_fails) return false;
    written.push_back(line);

    std::string req = line;
    while (!req.empty() && (req.back() == '\n' || req.back() == '\r')) req.pop_back();
    if (silent) return true;
    if (!mute_prefix.empty() && req.compare(0, mute_prefix.size(), mute_prefix) == 0) return true;
    if (!reply_prefix.empty() && req.compare(0, reply_prefix.size(), reply_prefix) == 0) {
      rx_.push_back(reply_line + "\n");
      return true;
    }

    rx_.push_back(dispatcher_.process_line(req) + "\n");
    return true;
  }

  ReadStatus read_line(std::string& line, uint32_t timeout_ms) override {
    timeouts.push_back(timeout_ms);
    if (!open_ || read_fails) return ReadStatus::IO_ERROR;
    if (rx_.empty()) return ReadStatus::TIMEOUT;
    line = rx_.front();
    rx_.pop_front();
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    return ReadStatus::LINE;
  }

  void flush_input() override {
    ++flushes;
    rx_.clear();
  }

  /// Queue a line as if the device had sent it unprompted.
  void inject(const std::string& line) { rx_.push_back(line); }

  bool                     silent      = false;
  bool                     write_fails = false;
  bool                     read_fails  = false;
  std::string              mute_prefix;
  std::string              reply_prefix;
  std::string              reply_line;
  std::vector<std::string> written;
  std::vector<uint32_t>    timeouts;
  int                      flushes = 0;

 private:
  Dispatcher&             dispatcher_;
  std::deque<std::string> rx_;
  bool                    open_ = true;
};

} // namespace test
} // namespace picorelay
