// relay_line.cpp — implementation for relay_line.hpp

#include "relay_line.hpp"

namespace picorelay {

LineAssembler::LineAssembler(size_t max_len)
    : max_len_(max_len), discarding_(false) {
  buf_.reserve(max_len_);
}

void LineAssembler::reset() {
  buf_.clear();
  discarding_ = false;
}

LineAssembler::Event LineAssembler::push(char c, std::string& line) {
  if (c == '\n' || c == '\r') {
    if (discarding_) {
      reset();
      return Event::TOO_LONG;
    }
    if (buf_.empty()) return Event::NONE;
    line.swap(buf_);
    buf_.clear();
    return Event::LINE;
  }

  if (discarding_) return Event::NONE;

  if (buf_.size() >= max_len_) {
    // Too long: drop what we have and swallow the rest of this line.
    buf_.clear();
    discarding_ = true;
    return Event::NONE;
  }
  buf_.push_back(c);
  return Event::NONE;
}

LineAssembler::Event LineAssembler::poll(ByteSource& src, std::string& line) {
  for (int c = src.read(); c >= 0; c = src.read()) {
    const Event ev = push(static_cast<char>(c), line);
    if (ev != Event::NONE) return ev;
  }
  return Event::NONE;
}

} // namespace picorelay
