/**
 * @page pr-relayctl relayctl — PicoRelay command line
 * @file relayctl.cpp
 * @brief Scriptable front end for RelayClient.
 *
 * Usage
 * -----
 *   relayctl [--port DEV] [--baud N] [--timeout MS] [-v|-vv] <command> [args]
 *
 *   discover                  list boards found on USB serial ports
 *   ping | info | uid | version | help | status | states
 *   on <n> | off <n>          single relay
 *   all on|off
 *   set <pattern>             8 chars, leftmost = relay 8
 *   pulse <n> <ms>
 *   name <n> [label]          no label clears it
 *   get-name <n>
 *   beep [ms] | buzz on|off | tone <hz> <ms>
 *   save | load | clear
 *   raw <line...>             send a line unchecked, print the reply
 *
 * Port Selection
 * --------------
 * --port wins, then $PICORELAY_PORT, then the first board discovery finds.
 *
 * Output
 * ------
 * One "status=ok ..." line on stdout per success; "status=error reason=..."
 * on stderr otherwise. Exit codes are stable:
 *
 *   0 ok   1 device error   2 usage/validation   3 connection   4 timeout
 *   5 no board found
 *
 * @author Leo
 */

#include "host_client.hpp"
#include "host_discovery.hpp"
#include "host_serial.hpp"
#include "relay_log.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>   // getenv, strtoull
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace picorelay;

namespace {

enum Exit {
  EXIT_OK_        = 0,
  EXIT_DEVICE     = 1,
  EXIT_USAGE      = 2,
  EXIT_CONNECTION = 3,
  EXIT_TIMEOUT    = 4,
  EXIT_NOT_FOUND  = 5
};

struct Cli {
  std::string              port;
  uint32_t                 baud = 115200;
  uint32_t                 timeout_ms = 1000;
  int                      verbosity = 0;
  std::string              command;
  std::vector<std::string> args;
};

void stderr_sink(LogLevel lvl, const char* msg) {
  std::fprintf(stderr, "[%s] %s\n", log_level_name(lvl), msg);
}

void usage() {
  std::cerr <<
    "usage: relayctl [--port DEV] [--baud N] [--timeout MS] [-v|-vv] <command> [args]\n"
    "commands: discover ping info uid version help status states on off all set\n"
    "          pulse name get-name beep buzz tone save load clear raw\n";
}

int fail(int code, const std::string& reason) {
  std::cerr << "status=error reason=" << reason << "\n";
  return code;
}

// Digits only, and nothing past UINT32_MAX: strtoul would accept "-1" and
// wrap it, and a 64-bit long silently holds values a uint32_t cannot.
bool parse_u32(const std::string& s, uint32_t& out) {
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) return false;
  errno = 0;
  char* e = nullptr;
  unsigned long long v = std::strtoull(s.c_str(), &e, 10);
  if (!e || *e || errno == ERANGE || v > UINT32_MAX) return false;
  out = static_cast<uint32_t>(v);
  return true;
}

bool parse_cli(int argc, char** argv, Cli& cli, std::string& err) {
  int i = 1;
  for (; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--port" || a == "--baud" || a == "--timeout") {
      if (i + 1 >= argc) { err = "missing_value:" + a.substr(2); return false; }
      const std::string v = argv[++i];
      if (a == "--port") {
        cli.port = v;
      } else if (a == "--baud") {
        if (!parse_u32(v, cli.baud)) { err = "bad_value:baud"; return false; }
      } else {
        if (!parse_u32(v, cli.timeout_ms)) { err = "bad_value:timeout"; return false; }
      }
    } else if (a == "-v") {
      cli.verbosity = 1;
    } else if (a == "-vv") {
      cli.verbosity = 2;
    } else if (!a.empty() && a[0] == '-') {
      err = "unknown_option:" + a;
      return false;
    } else {
      break;
    }
  }
  if (i >= argc) { err = "need_command"; return false; }
  cli.command = argv[i++];
  for (; i < argc; ++i) cli.args.push_back(argv[i]);
  return true;
}

bool need_args(const Cli& cli, size_t lo, size_t hi, std::string& err) {
  if (cli.args.size() < lo || cli.args.size() > hi) {
    err = "bad_count:" + cli.command;
    return false;
  }
  return true;
}

int run_discover(const Cli& cli) {
  std::vector<BoardCandidate> boards = discover_boards(cli.baud);
  if (boards.empty()) return fail(EXIT_NOT_FOUND, "no_board_found");
  for (const auto& b : boards) {
    std::cout << "status=ok port=" << b.port
              << " serial=" << b.serial_number
              << " manufacturer=\"" << b.manufacturer << "\""
              << " product=\"" << b.product << "\"\n";
  }
  return EXIT_OK_;
}

//
// run_command()
// -------------
// One client call per CLI command. Numeric arguments go to the encoder as
// the user typed them, so range checks see the real value. Errors propagate
// as ClientError subclasses and are mapped to exit codes by main().
//
int run_command(RelayClient& c, const Cli& cli) {
  const std::string& cmd = cli.command;
  const std::vector<std::string>& a = cli.args;
  std::string err;

  if (cmd == "ping") {
    if (!need_args(cli, 0, 0, err)) return fail(EXIT_USAGE, err);
    std::cout << "status=ok reply=" << (c.ping() ? "PONG" : "unexpected") << "\n";
  } else if (cmd == "info") {
    if (!need_args(cli, 0, 0, err)) return fail(EXIT_USAGE, err);
    BoardInfo i = c.info();
    std::cout << "status=ok board=" << i.board_name << " version=" << i.version
              << " channels=" << i.channels << " uid=" << i.uid << "\n";
  } else if (cmd == "uid") {
    if (!need_args(cli, 0, 0, err)) return fail(EXIT_USAGE, err);
    std::cout << "status=ok uid=" << c.uid() << "\n";
  } else if (cmd == "version") {
    if (!need_args(cli, 0, 0, err)) return fail(EXIT_USAGE, err);
    std::cout << "status=ok version=" << c.version() << "\n";
  } else if (cmd == "help") {
    if (!need_args(cli, 0, 0, err)) return fail(EXIT_USAGE, err);
    std::cout << "status=ok commands=";
    std::vector<std::string> names = c.help();
    for (size_t i = 0; i < names.size(); ++i) std::cout << (i ? "," : "") << names[i];
    std::cout << "\n";
  } else if (cmd == "status") {
    if (!need_args(cli, 0, 0, err)) return fail(EXIT_USAGE, err);
    std::cout << "status=ok";
    for (const auto& kv : c.status()) std::cout << " r" << kv.first << "=" << (kv.second ? 1 : 0);
    std::cout << "\n";
  } else if (cmd == "states") {
    if (!need_args(cli, 0, 0, err)) return fail(EXIT_USAGE, err);
    for (const RelayState& s : c.relay_states()) {
      std::cout << "status=ok relay=" << s.relay << " state=" << (s.on ? "on" : "off")
                << " name=\"" << s.name << "\"\n";
    }
  } else if (cmd == "on" || cmd == "off") {
    if (!need_args(cli, 1, 1, err)) return fail(EXIT_USAGE, err);
    c.send_command(cmd == "on" ? CommandKind::ON : CommandKind::OFF, a);
    std::cout << "status=ok relay=" << a[0] << " state=" << cmd << "\n";
  } else if (cmd == "all") {
    if (!need_args(cli, 1, 1, err)) return fail(EXIT_USAGE, err);
    c.send_command(CommandKind::ALL, {a[0]});
    std::cout << "status=ok all=" << a[0] << "\n";
  } else if (cmd == "set") {
    if (!need_args(cli, 1, 1, err)) return fail(EXIT_USAGE, err);
    c.set_pattern(a[0]);
    std::cout << "status=ok pattern=" << a[0] << "\n";
  } else if (cmd == "pulse") {
    if (!need_args(cli, 2, 2, err)) return fail(EXIT_USAGE, err);
    c.send_command(CommandKind::PULSE, a);
    std::cout << "status=ok relay=" << a[0] << " pulse_ms=" << a[1] << "\n";
  } else if (cmd == "name") {
    if (!need_args(cli, 1, 2, err)) return fail(EXIT_USAGE, err);
    c.send_command(CommandKind::NAME, a);
    std::cout << "status=ok relay=" << a[0] << "\n";
  } else if (cmd == "get-name") {
    if (!need_args(cli, 1, 1, err)) return fail(EXIT_USAGE, err);
    std::cout << "status=ok relay=" << a[0] << " name=\""
              << c.send_command(CommandKind::GET, {"NAME", a[0]}) << "\"\n";
  } else if (cmd == "beep") {
    if (!need_args(cli, 0, 1, err)) return fail(EXIT_USAGE, err);
    c.send_command(CommandKind::BEEP, a);
    std::cout << "status=ok\n";
  } else if (cmd == "buzz") {
    if (!need_args(cli, 1, 1, err)) return fail(EXIT_USAGE, err);
    c.send_command(CommandKind::BUZZ, {a[0]});
    std::cout << "status=ok buzzer=" << a[0] << "\n";
  } else if (cmd == "tone") {
    if (!need_args(cli, 2, 2, err)) return fail(EXIT_USAGE, err);
    c.send_command(CommandKind::TONE, a);
    std::cout << "status=ok\n";
  } else if (cmd == "save") {
    if (!need_args(cli, 0, 0, err)) return fail(EXIT_USAGE, err);
    c.save_states();
    std::cout << "status=ok saved\n";
  } else if (cmd == "load") {
    if (!need_args(cli, 0, 0, err)) return fail(EXIT_USAGE, err);
    c.load_states();
    std::cout << "status=ok loaded\n";
  } else if (cmd == "clear") {
    if (!need_args(cli, 0, 0, err)) return fail(EXIT_USAGE, err);
    c.clear_states();
    std::cout << "status=ok cleared\n";
  } else if (cmd == "raw") {
    if (a.empty()) return fail(EXIT_USAGE, "bad_count:raw");
    std::string line;
    for (size_t i = 0; i < a.size(); ++i) line += (i ? " " : "") + a[i];
    std::cout << "status=ok reply=" << c.send_raw(line) << "\n";
  } else {
    usage();
    return fail(EXIT_USAGE, "unknown_command:" + cmd);
  }
  return EXIT_OK_;
}

} // namespace

int main(int argc, char** argv) {
  Cli cli;
  std::string err;
  if (!parse_cli(argc, argv, cli, err)) {
    usage();
    return fail(EXIT_USAGE, err);
  }

  log_set_sink(&stderr_sink);
  log_set_level(cli.verbosity > 1  ? LogLevel::DEBUG
              : cli.verbosity == 1 ? LogLevel::INFO
                                   : LogLevel::ERROR);

  if (cli.command == "discover") return run_discover(cli);

  // 1) port: flag, environment, discovery
  if (cli.port.empty()) {
    const char* env = std::getenv("PICORELAY_PORT");
    if (env && *env) cli.port = env;
  }
  if (cli.port.empty()) {
    BoardCandidate first;
    if (!find_first_board(first, cli.baud)) return fail(EXIT_NOT_FOUND, "no_board_found");
    cli.port = first.port;
  }

  // 2) open + handshake
  auto link = std::make_unique<PosixSerialLink>();
  if (!link->open(cli.port, cli.baud, err)) return fail(EXIT_CONNECTION, err);

  ClientOptions opts;
  opts.baud = cli.baud;
  opts.read_timeout_ms = cli.timeout_ms;
  RelayClient client(std::move(link), opts);

  // 3) one command
  try {
    client.connect();
    return run_command(client, cli);
  } catch (const ValidationError& e) {
    return fail(EXIT_USAGE, e.what());
  } catch (const CommandError& e) {
    return fail(EXIT_DEVICE, "device:" + e.code());
  } catch (const TimeoutError& e) {
    return fail(EXIT_TIMEOUT, std::string("timeout:") + e.what());
  } catch (const ConnectionError& e) {
    return fail(EXIT_CONNECTION, std::string("connection:") + e.what());
  } catch (const ClientError& e) {
    return fail(EXIT_DEVICE, std::string("protocol:") + e.what());
  }
}
