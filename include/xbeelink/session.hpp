#pragma once
/**
 * @file session.hpp
 * @brief Local device session: owns the reader loop and correlates requests with responses.
 *
 * @details
 * A Session wraps one ConnectionInterface. open() opens the link (if needed)
 * and starts the DataReader; close() stops the reader, closes the link and
 * wakes every caller blocked in a synchronous send.
 *
 * When the transport fails the reader closes the link and the session reports
 * is_open() == false. Calling open() again reopens the link and restarts the
 * reader.
 *
 * SYNCHRONOUS SEND (send_packet)
 * ------------------------------
 * ```
 *   caller                         reader thread
 *     │ assign frame ID (if unset)
 *     │ register frame-ID listener ───────┐
 *     │ write frame                       │
 *     │ wait (cv, deadline) ◄── accept ───┤ response with same ID
 *     │                                   │ (AT: same command, not our echo)
 *     │ remove listener (scoped)          │
 * ```
 * Results:
 *   - Ok            response copied out
 *   - Timeout       nothing matched before the deadline
 *   - Interrupted   session closed or the reader stopped while waiting
 *   - InterfaceNotOpen / InvalidOperatingMode / WriteFailed before waiting
 *
 * Kinds without a frame ID are written fire-and-forget and return Ok with no
 * response.
 *
 * @code
 *   xbeelink::transport::SerialPort port("/dev/ttyUSB0", 9600);
 *   xbeelink::Session session(port, cfg);
 *   std::string err;
 *   if (!session.open(err)) { ... }
 *   xbeelink::ByteVector ni;
 *   if (session.get_parameter("NI", ni) == xbeelink::SendStatus::Ok) { ... }
 * @endcode
 */

#include "xbeelink/config.hpp"
#include "xbeelink/data_reader.hpp"
#include "xbeelink/frame_id.hpp"
#include "xbeelink/messages.hpp"
#include "xbeelink/packet.hpp"
#include "xbeelink/status.hpp"
#include "xbeelink/transport/connection.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace xbeelink {

class Session {
public:
  using Duration = std::chrono::milliseconds;

  explicit Session(transport::ConnectionInterface& connection, SessionConfig config = SessionConfig{});
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // -------- Lifecycle --------
  bool open(std::string& err);
  void close();
  bool is_open() const { return open_.load(); }

  OperatingMode mode() const { return reader_->mode(); }
  void set_mode(OperatingMode mode) { reader_->set_mode(mode); }

  Duration receive_timeout() const { return Duration(receive_timeout_ms_.load()); }
  void set_receive_timeout(Duration timeout) { receive_timeout_ms_ = static_cast<int>(timeout.count()); }

  /// When false, set_parameter() queues changes (0x09 / no apply bit) until apply_changes().
  void set_apply_changes_enabled(bool enabled) { apply_changes_ = enabled; }
  bool apply_changes_enabled() const { return apply_changes_.load(); }

  DataReader& reader() { return *reader_; }
  FrameIdAllocator& frame_ids() { return frame_ids_; }
  transport::ConnectionInterface& connection() { return conn_; }

  // -------- Raw frames --------
  SendStatus send_packet(Packet packet, Packet& response);
  SendStatus send_packet(Packet packet, Packet& response, Duration timeout);
  /// Write without waiting. Unset frame IDs go out as 0 (no response requested).
  SendStatus send_packet_async(const Packet& packet);

  // -------- Local AT commands --------
  /// `apply` false sends 0x09 (queued) instead of 0x08.
  SendStatus send_at_command(const std::string& command, const ByteVector& parameter,
                             AtCommandResponsePacket& response, bool apply = true);
  SendStatus get_parameter(const std::string& command, ByteVector& value);
  SendStatus set_parameter(const std::string& command, const ByteVector& value);
  /// Runs a parameterless command (AC, WR, FR, ...).
  SendStatus execute_command(const std::string& command);
  SendStatus apply_changes()  { return execute_command("AC"); }
  SendStatus write_changes()  { return execute_command("WR"); }

  /// Software reset (FR), then wait for a reset modem status.
  SendStatus reset();

  /// Try API and API_ESCAPED in turn with an AP query. UNKNOWN if neither answers.
  OperatingMode probe_operating_mode();

  // -------- Remote AT commands --------
  SendStatus send_remote_at_command(const RemoteAddress& node, const std::string& command,
                                    const ByteVector& parameter, uint8_t options,
                                    RemoteAtCommandResponsePacket& response);

  // -------- Data --------
  /// 0x10 to `node`; Ok only when the delivery status is SUCCESS or SELF_ADDRESSED.
  SendStatus send_data(const RemoteAddress& node, const ByteVector& data,
                       uint8_t* delivery_status = nullptr);
  SendStatus send_data_async(const RemoteAddress& node, const ByteVector& data);
  SendStatus send_broadcast_data(const ByteVector& data);

  std::optional<XBeeMessage> read_data(Duration timeout = Duration::zero());
  std::optional<XBeeMessage> read_data_from(const RemoteAddress& node, Duration timeout = Duration::zero());

private:
  SendStatus check_ready() const;
  SendStatus write_packet(const Packet& packet);
  void wake_waiters();

  transport::ConnectionInterface& conn_;
  std::unique_ptr<DataReader> reader_;
  FrameIdAllocator frame_ids_;

  std::atomic<bool> open_{false};
  std::atomic<int> receive_timeout_ms_;
  std::atomic<bool> apply_changes_{true};

  std::mutex write_mutex_;          // one frame on the wire at a time
  std::mutex wait_mutex_;           // guards responses handed over by listeners
  std::condition_variable wait_cv_;
};

} // namespace xbeelink
