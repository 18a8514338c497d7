// -----------------------------------------------------------------------------
// remote_node.cpp: remote AT commands through the owning session.
// -----------------------------------------------------------------------------
#include "xbeelink/remote_node.hpp"
#include "xbeelink/log.hpp"
#include "xbeelink/status_codes.hpp"

namespace xbeelink {

// run(): one 0x17/0x97 exchange. A response status other than OK
// is AtCommandError; a remote TX failure (0x04) is reported the same way.
SendStatus RemoteNode::run(const std::string& command, const ByteVector& parameter, ByteVector* value) {
  const uint8_t options = session_.apply_changes_enabled() ? remote_at_options::APPLY_CHANGES
                                                           : remote_at_options::NONE;
  RemoteAtCommandResponsePacket resp;
  const SendStatus st = session_.send_remote_at_command(address_, command, parameter, options, resp);
  if (st != SendStatus::Ok) return st;

  if (resp.status != at_status::OK) {
    log::warn("remote AT " + command + " to " + address_.to_string() +
              " status=" + at_status_description(resp.status));
    return SendStatus::AtCommandError;
  }
  if (value) *value = resp.value;
  return SendStatus::Ok;
}

SendStatus RemoteNode::get_parameter(const std::string& command, ByteVector& value) {
  return run(command, {}, &value);
}

SendStatus RemoteNode::set_parameter(const std::string& command, const ByteVector& value) {
  return run(command, value, nullptr);
}

SendStatus RemoteNode::execute_command(const std::string& command) {
  return run(command, {}, nullptr);
}

} // namespace xbeelink
