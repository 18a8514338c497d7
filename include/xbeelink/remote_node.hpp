#pragma once
/**
 * @file remote_node.hpp
 * @brief Facade for a node reached over the air through a local Session.
 *
 * Remote AT commands (0x17) and data (0x10) addressed to one node. Frame IDs
 * come from the session's allocator, so local and remote requests never
 * collide while in flight.
 *
 * @code
 *   xbeelink::RemoteNode node(session, xbeelink::Address64(0x0013A20040A1B2C3ull));
 *   xbeelink::ByteVector ni;
 *   node.get_parameter("NI", ni);
 * @endcode
 */

#include "xbeelink/messages.hpp"
#include "xbeelink/session.hpp"

#include <string>

namespace xbeelink {

class RemoteNode {
public:
  RemoteNode(Session& session, Address64 addr64, Address16 addr16 = Address16::UNKNOWN)
  : session_(session), address_{addr64, addr16} {}

  const RemoteAddress& address() const { return address_; }
  Session& session() { return session_; }

  SendStatus get_parameter(const std::string& command, ByteVector& value);
  /// Applied immediately unless the session has apply-changes disabled.
  SendStatus set_parameter(const std::string& command, const ByteVector& value);
  SendStatus execute_command(const std::string& command);

  SendStatus send_data(const ByteVector& data) { return session_.send_data(address_, data); }
  SendStatus send_data_async(const ByteVector& data) { return session_.send_data_async(address_, data); }

  /// Next data message from this node in the session's inbound queue.
  std::optional<XBeeMessage> read_data(Session::Duration timeout = Session::Duration::zero()) {
    return session_.read_data_from(address_, timeout);
  }

private:
  SendStatus run(const std::string& command, const ByteVector& parameter, ByteVector* value);

  Session& session_;
  RemoteAddress address_;
};

} // namespace xbeelink
