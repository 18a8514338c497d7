/**
 * @file main.cpp
 * @brief xbeelink-cli: one-shot runner around xbeelink::Session.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); optional JSON config file underneath the flags.
 *  - Run exactly one command:
 *      --at CMD [--value V] [--remote ADDR64]   local or remote AT command
 *      --send TEXT --dest ADDR64                 transmit request, waits for status
 *      --listen SECONDS                          print received data and modem status
 *      --decode HEX                              parse one frame offline (no serial port)
 *  - Print results as pretty | json | raw.
 *
 * Exit codes:
 *   0 ok, 1 open/write failure, 2 usage, 3 timeout, 4 parse failure,
 *   5 AT or transmit status error.
 *
 * Errors go to stderr as `status=<code> reason="<text>"`.
 *
 * Notes:
 *  - --value is taken as hex when it is valid hex ("0x0A", "7E 00"), otherwise as ASCII text.
 *  - Flags override the config file; the config file overrides built-in defaults.
 */

#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "xbeelink/bytes.hpp"
#include "xbeelink/config.hpp"
#include "xbeelink/log.hpp"
#include "xbeelink/packet_json.hpp"
#include "xbeelink/parser.hpp"
#include "xbeelink/remote_node.hpp"
#include "xbeelink/session.hpp"
#include "xbeelink/status_codes.hpp"
#include "xbeelink/transport/serial_port.hpp"

using json = nlohmann::json;
using namespace xbeelink;

// ---------- exit codes ----------

enum ExitCode : int {
  RC_OK = 0,
  RC_IO = 1,
  RC_USAGE = 2,
  RC_TIMEOUT = 3,
  RC_PARSE = 4,
  RC_STATUS = 5,
};

static int exit_code_for(SendStatus s) {
  switch (s) {
    case SendStatus::Ok:                   return RC_OK;
    case SendStatus::Timeout:              return RC_TIMEOUT;
    case SendStatus::AtCommandError:
    case SendStatus::TransmitFailed:       return RC_STATUS;
    case SendStatus::InvalidOperatingMode:
    case SendStatus::InvalidArgument:      return RC_USAGE;
    default:                               return RC_IO;
  }
}

// ---------- small utilities ----------

static void print_error(const std::string& status, const std::string& reason) {
  std::cerr << "status=" << status << " reason=\"" << reason << "\"\n";
}

static ByteVector value_bytes(const std::string& v) {
  ByteVector out;
  if (!v.empty() && from_hex(v, out)) return out;
  return ByteVector(v.begin(), v.end());
}

static void print_packet(const Packet& p, const std::string& format) {
  if (format == "json")     std::cout << to_json(p).dump(2) << "\n";
  else if (format == "raw") std::cout << p.to_hex_string() << "\n";
  else                      std::cout << p.to_pretty_string() << "\n";
}

static void print_value(const std::string& cmd, const ByteVector& value, const std::string& format) {
  if (format == "json") {
    json j;
    j["command"] = cmd;
    j["hex"]     = to_hex(value);
    j["text"]    = to_printable(value);
    std::cout << j.dump(2) << "\n";
  } else if (format == "raw") {
    std::cout << to_hex(value) << "\n";
  } else {
    std::cout << cmd << " = " << (value.empty() ? "(empty)" : to_pretty_hex(value))
              << "  \"" << to_printable(value) << "\"\n";
  }
}

// ---------- commands ----------

static int cmd_decode(const std::string& hex, OperatingMode mode, const std::string& format) {
  PacketParser parser;
  Packet p;
  std::string err;
  const ParseStatus st = parser.parse_packet(hex, mode, p, err);
  if (st != ParseStatus::Ok) {
    print_error(to_string(st), err);
    return RC_PARSE;
  }
  print_packet(p, format);
  return RC_OK;
}

static int cmd_at(Session& session, const std::string& at, const std::string& value,
                  const std::string& remote, const std::string& format) {
  const bool is_query = value.empty();
  ByteVector result;
  SendStatus st;

  if (!remote.empty()) {
    Address64 addr;
    if (!Address64::from_string(remote, addr)) {
      print_error("usage", "invalid --remote address: " + remote);
      return RC_USAGE;
    }
    RemoteNode node(session, addr);
    st = is_query ? node.get_parameter(at, result) : node.set_parameter(at, value_bytes(value));
  } else {
    st = is_query ? session.get_parameter(at, result) : session.set_parameter(at, value_bytes(value));
  }

  if (st != SendStatus::Ok) {
    print_error(to_string(st), "AT " + at + " failed");
    return exit_code_for(st);
  }
  if (is_query) print_value(at, result, format);
  else if (format != "raw") std::cout << at << " set\n";
  return RC_OK;
}

static int cmd_send(Session& session, const std::string& text, const std::string& dest) {
  Address64 addr;
  if (!Address64::from_string(dest, addr)) {
    print_error("usage", "invalid --dest address: " + dest);
    return RC_USAGE;
  }
  uint8_t delivery = 0;
  const SendStatus st = session.send_data(RemoteAddress{addr, Address16::UNKNOWN},
                                          ByteVector(text.begin(), text.end()), &delivery);
  if (st != SendStatus::Ok) {
    const std::string reason = st == SendStatus::TransmitFailed
                             ? transmit_status_description(delivery)
                             : std::string("send to ") + dest + " failed";
    print_error(to_string(st), reason);
    return exit_code_for(st);
  }
  std::cout << "delivered to " << addr.to_string() << "\n";
  return RC_OK;
}

static int cmd_listen(Session& session, int seconds, const std::string& format) {
  std::mutex out_m;

  DataReader& reader = session.reader();
  const auto data_id = reader.add_data_listener([&](const XBeeMessage& m) {
    std::lock_guard<std::mutex> lk(out_m);
    if (format == "json")     std::cout << to_json(m).dump() << "\n";
    else if (format == "raw") std::cout << to_hex(m.data) << "\n";
    else std::cout << "from " << m.remote.to_string() << (m.broadcast ? " (broadcast)" : "")
                   << ": " << to_printable(m.data) << "\n";
  });
  const auto modem_id = reader.add_modem_status_listener([&](uint8_t status) {
    std::lock_guard<std::mutex> lk(out_m);
    std::cout << "modem status " << byte_to_hex(status) << " (" << modem_status_description(status) << ")\n";
  });

  int rc = RC_OK;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
  while (std::chrono::steady_clock::now() < deadline) {
    if (!reader.is_running()) {
      print_error("interrupted", "connection lost");
      rc = RC_IO;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // Listeners reference locals of this frame; stop the reader before they go.
  session.close();
  reader.remove_listener(data_id);
  reader.remove_listener(modem_id);
  return rc;
}

// ---------- main ----------

int main(int argc, char** argv) {
  log::init_from_env();

  std::string opt_dev;
  int opt_baud = 0;
  std::string opt_mode;
  std::string opt_config;
  int opt_timeout = 0;
  std::string opt_format = "pretty";
  std::string opt_log_level;

  std::string opt_at;
  std::string opt_value;
  std::string opt_remote;
  std::string opt_send;
  std::string opt_dest;
  int opt_listen = 0;
  std::string opt_decode;

  CLI::App app{"xbeelink CLI: talk to an XBee module in API mode"};

  app.add_option("--dev", opt_dev, "Serial device (e.g. /dev/ttyUSB0)");
  app.add_option("--baud", opt_baud, "Baud rate")->check(CLI::PositiveNumber);
  app.add_option("--mode", opt_mode, "Operating mode: api|api2")->check(CLI::IsMember({"api", "api2"}));
  app.add_option("--config", opt_config, "JSON config file")->check(CLI::ExistingFile);
  app.add_option("--timeout", opt_timeout, "Response timeout in ms")->check(CLI::PositiveNumber);
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")
     ->capture_default_str()->check(CLI::IsMember({"pretty", "json", "raw"}));
  app.add_option("--log-level", opt_log_level, "debug|info|warn|error|off")
     ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}));

  auto* at_opt     = app.add_option("--at", opt_at, "AT command (two letters); query unless --value is given");
  auto* value_opt  = app.add_option("--value", opt_value, "Parameter for --at (hex or text)");
  auto* remote_opt = app.add_option("--remote", opt_remote, "64-bit address of a remote node for --at");
  auto* send_opt   = app.add_option("--send", opt_send, "Text to transmit");
  auto* dest_opt   = app.add_option("--dest", opt_dest, "64-bit destination address for --send");
  auto* listen_opt = app.add_option("--listen", opt_listen, "Print received data for N seconds")->check(CLI::PositiveNumber);
  auto* decode_opt = app.add_option("--decode", opt_decode, "Decode one hex frame offline");

  value_opt->needs(at_opt);
  remote_opt->needs(at_opt);
  send_opt->needs(dest_opt);
  dest_opt->needs(send_opt);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  const int commands = static_cast<int>(at_opt->count() > 0) + static_cast<int>(send_opt->count() > 0) +
                       static_cast<int>(listen_opt->count() > 0) + static_cast<int>(decode_opt->count() > 0);
  if (commands != 1) {
    print_error("usage", "exactly one of --at, --send, --listen, --decode is required");
    return RC_USAGE;
  }

  if (!opt_log_level.empty()) {
    log::Level lvl;
    if (log::level_from_string(opt_log_level, lvl)) log::set_level(lvl);
  }

  // Defaults <- config file <- flags
  SessionConfig session_cfg;
  SerialConfig serial_cfg;
  std::string err;
  if (!opt_config.empty() && !load_config(opt_config, session_cfg, serial_cfg, err)) {
    print_error("usage", err);
    return RC_USAGE;
  }
  if (!opt_dev.empty())  serial_cfg.path = opt_dev;
  if (opt_baud > 0)      serial_cfg.baud = opt_baud;
  if (!opt_mode.empty()) session_cfg.mode = operating_mode_from_string(opt_mode);
  if (opt_timeout > 0)   session_cfg.receive_timeout_ms = opt_timeout;

  if (!validate_config(session_cfg, serial_cfg, err)) {
    print_error("usage", err);
    return RC_USAGE;
  }

  if (decode_opt->count() > 0) return cmd_decode(opt_decode, session_cfg.mode, opt_format);

  transport::SerialPort port(serial_cfg.path, serial_cfg.baud);
  Session session(port, session_cfg);
  if (!session.open(err)) {
    print_error("open_failed", err);
    return RC_IO;
  }

  int rc = RC_OK;
  if (at_opt->count() > 0)        rc = cmd_at(session, opt_at, opt_value, opt_remote, opt_format);
  else if (send_opt->count() > 0) rc = cmd_send(session, opt_send, opt_dest);
  else                            rc = cmd_listen(session, opt_listen, opt_format);

  session.close();
  return rc;
}
