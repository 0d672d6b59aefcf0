// -----------------------------------------------------------------------------
// Implementation for host_protocol.hpp
//
// - Encoder: per-command switch with local checks, no exceptions.
// - Decoder and payload parsers are total: any input yields a value.
// -----------------------------------------------------------------------------

#include "host_protocol.hpp"

#include <cctype>    // std::isprint, std::isspace, std::toupper
#include <cstdlib>   // strtol

namespace picorelay {

// ---------- local parsing helpers (no exceptions) ----------
// Decimal only: the device does not understand 0x or octal prefixes.

static bool parse_ranged(const std::string& s, long lo, long hi, long& out) {
  if (s.empty()) return false;
  char* e = nullptr;
  long v = std::strtol(s.c_str(), &e, 10);
  if (!e || *e) return false;
  if (v < lo || v > hi) return false;
  out = v;
  return true;
}

static std::string upper(std::string s) {
  for (auto& c : s) c = (char)std::toupper((unsigned char)c);
  return s;
}

static bool is_on_off(const std::string& s) {
  const std::string u = upper(s);
  return u == "ON" || u == "OFF";
}

// Relay token: decimal 1..8, re-emitted canonically ("03" -> "3").
static bool check_relay(const std::string& s, std::string& canon, std::string& err) {
  long v = 0;
  if (!parse_ranged(s, kMinRelay, kMaxRelay, v)) { err = "bad_value:relay(1..8)"; return false; }
  canon = std::to_string(v);
  return true;
}

static bool check_duration(const std::string& s, std::string& canon, std::string& err) {
  long v = 0;
  if (!parse_ranged(s, kMinDurationMs, kMaxDurationMs, v)) {
    err = "bad_value:duration_ms(1..5000)";
    return false;
  }
  canon = std::to_string(v);
  return true;
}

static bool check_name(const std::string& s, std::string& err) {
  if (s.empty())                      { err = "bad_value:name(empty)";   return false; }
  if (!is_valid_name_length(s))       { err = "bad_value:name(<=32)";    return false; }
  for (char c : s) {
    unsigned char u = (unsigned char)c;
    if (std::isspace(u))              { err = "bad_value:name(no_space)"; return false; }
    if (!std::isprint(u))             { err = "bad_value:name(printable)"; return false; }
  }
  return true;
}

// ---------- encoder ----------

bool build_request(CommandKind kind,
                   const std::vector<std::string>& args,
                   std::string& out,
                   std::string& err) {
  const Arity a = command_arity(kind);
  if (args.size() < a.min || args.size() > a.max) {
    err = std::string("bad_count:") + command_name(kind) + "(" +
          std::to_string(a.min) + (a.min == a.max ? "" : ".." + std::to_string(a.max)) + ")";
    return false;
  }

  std::vector<std::string> p;   // canonical parameters to emit

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
    case CommandKind::OFF: {
      std::string r;
      if (!check_relay(args[0], r, err)) return false;
      p.push_back(r);
      break;
    }

    case CommandKind::ALL:
    case CommandKind::BUZZ:
      if (!is_on_off(args[0])) { err = "bad_value:state(on|off)"; return false; }
      p.push_back(upper(args[0]));
      break;

    case CommandKind::SET:
      if (!is_binary_pattern(args[0])) { err = "bad_value:pattern(8x0|1)"; return false; }
      p.push_back(args[0]);
      break;

    case CommandKind::PULSE: {
      std::string r, ms;
      if (!check_relay(args[0], r, err)) return false;
      if (!check_duration(args[1], ms, err)) return false;
      p.push_back(r);
      p.push_back(ms);
      break;
    }

    case CommandKind::NAME: {
      std::string r;
      if (!check_relay(args[0], r, err)) return false;
      p.push_back(r);
      if (args.size() == 2) {
        if (!check_name(args[1], err)) return false;
        p.push_back(args[1]);
      }
      break;
    }

    case CommandKind::GET: {
      if (upper(args[0]) != "NAME") { err = "bad_value:get(name)"; return false; }
      std::string r;
      if (!check_relay(args[1], r, err)) return false;
      p.push_back("NAME");
      p.push_back(r);
      break;
    }

    case CommandKind::BEEP:
      if (args.size() == 1) {
        std::string ms;
        if (!check_duration(args[0], ms, err)) return false;
        p.push_back(ms);
      }
      break;

    case CommandKind::TONE: {
      long hz = 0;
      if (!parse_ranged(args[0], kMinToneHz, kMaxToneHz, hz)) {
        err = "bad_value:freq_hz(50..20000)";
        return false;
      }
      std::string ms;
      if (!check_duration(args[1], ms, err)) return false;
      p.push_back(std::to_string(hz));
      p.push_back(ms);
      break;
    }
  }

  out = command_name(kind);
  for (const auto& s : p) {
    out += ' ';
    out += s;
  }
  out += kLineTerminator;
  return true;
}

// ---------- decoder ----------

std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) ++b;
  while (e > b && (s[e-1] == ' ' || s[e-1] == '\t' || s[e-1] == '\r' || s[e-1] == '\n')) --e;
  return s.substr(b, e - b);
}

Response decode_response(const std::string& line) {
  Response r;
  const std::string t = trim(line);
  const std::string prefix = kErrorPrefix;

  // "ERROR:" with no code is not an error line; it falls through as data.
  if (t.size() > prefix.size() && t.compare(0, prefix.size(), prefix) == 0) {
    r.ok = false;
    r.error_code = t.substr(prefix.size());
    return r;
  }
  r.ok = true;
  if (t != kOkResponse) r.data = t;
  return r;
}

bool parse_status(const std::string& pattern, std::map<int, bool>& out) {
  const std::string t = trim(pattern);
  if (!is_binary_pattern(t)) return false;
  out.clear();
  for (int relay = 1; relay <= kRelayCount; ++relay) {
    out[relay] = (t[kPatternLength - relay] == '1');   // index 7-(relay-1)
  }
  return true;
}

BoardInfo parse_info(const std::string& csv) {
  BoardInfo info;
  std::string* fields[] = {&info.board_name, &info.version, &info.channels, &info.uid};
  const std::string t = trim(csv);

  size_t start = 0;
  for (size_t i = 0; i < 4 && start <= t.size(); ++i) {
    size_t comma = t.find(',', start);
    if (comma == std::string::npos) comma = t.size();
    *fields[i] = t.substr(start, comma - start);
    start = comma + 1;
  }

  static const std::string uid_prefix = "UID:";
  if (info.uid.compare(0, uid_prefix.size(), uid_prefix) == 0) {
    info.uid = info.uid.substr(uid_prefix.size());
  }
  return info;
}

std::vector<std::string> parse_help(const std::string& text) {
  std::string t = trim(text);
  const std::string prefix = kHelpPrefix;
  if (t.compare(0, prefix.size(), prefix) == 0) t = t.substr(prefix.size());

  std::vector<std::string> names;
  size_t start = 0;
  while (start <= t.size()) {
    size_t comma = t.find(',', start);
    if (comma == std::string::npos) comma = t.size();
    std::string item = trim(t.substr(start, comma - start));
    if (!item.empty()) names.push_back(item);
    start = comma + 1;
  }
  return names;
}

} // namespace picorelay
