// -----------------------------------------------------------------------------
// config.cpp: JSON settings loader (nlohmann::json).
//
// Keys missing from the file keep the value already in the struct; keys with
// the wrong JSON type are an error rather than being silently defaulted.
// -----------------------------------------------------------------------------
#include "xbeelink/config.hpp"
#include "nlohmann/json.hpp"

#include <fstream>
#include <sstream>

namespace xbeelink {

using json = nlohmann::json;

namespace {

bool read_int(const json& j, const char* key, int& out, std::string& err) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_number_integer()) {
    err = std::string("config: \"") + key + "\" must be an integer";
    return false;
  }
  out = v.get<int>();
  return true;
}

bool read_string(const json& j, const char* key, std::string& out, std::string& err) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_string()) {
    err = std::string("config: \"") + key + "\" must be a string";
    return false;
  }
  out = v.get<std::string>();
  return true;
}

} // namespace

bool validate_config(const SessionConfig& session, const SerialConfig& serial, std::string& err) {
  if (!is_api_mode(session.mode)) {
    err = "config: mode must be api or api2";
    return false;
  }
  if (session.receive_timeout_ms <= 0) {
    err = "config: receive_timeout_ms must be positive";
    return false;
  }
  if (session.byte_timeout_ms <= 0) {
    err = "config: byte_timeout_ms must be positive";
    return false;
  }
  if (session.queue_capacity == 0 || session.queue_capacity > PacketQueue::MAX_CAPACITY) {
    err = "config: queue_capacity must be 1.." + std::to_string(PacketQueue::MAX_CAPACITY);
    return false;
  }
  if (serial.baud <= 0) {
    err = "config: serial.baud must be positive";
    return false;
  }
  return true;
}

bool parse_config(const std::string& json_text, SessionConfig& session, SerialConfig& serial,
                  std::string& err) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    err = std::string("config: ") + e.what();
    return false;
  }
  if (!j.is_object()) {
    err = "config: top level must be an object";
    return false;
  }

  std::string mode;
  if (!read_string(j, "mode", mode, err)) return false;
  if (!mode.empty()) {
    session.mode = operating_mode_from_string(mode);
    if (!is_api_mode(session.mode)) {
      err = "config: unknown mode \"" + mode + "\"";
      return false;
    }
  }

  if (!read_int(j, "receive_timeout_ms", session.receive_timeout_ms, err)) return false;
  if (!read_int(j, "byte_timeout_ms", session.byte_timeout_ms, err)) return false;

  int capacity = static_cast<int>(session.queue_capacity);
  if (!read_int(j, "queue_capacity", capacity, err)) return false;
  if (capacity <= 0) {
    err = "config: queue_capacity must be positive";
    return false;
  }
  session.queue_capacity = static_cast<size_t>(capacity);

  if (j.contains("serial")) {
    const json& s = j.at("serial");
    if (!s.is_object()) {
      err = "config: \"serial\" must be an object";
      return false;
    }
    if (!read_string(s, "path", serial.path, err)) return false;
    if (!read_int(s, "baud", serial.baud, err)) return false;
  }

  return validate_config(session, serial, err);
}

bool load_config(const std::string& path, SessionConfig& session, SerialConfig& serial,
                 std::string& err) {
  std::ifstream in(path);
  if (!in) {
    err = "config: cannot open " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), session, serial, err);
}

} // namespace xbeelink
