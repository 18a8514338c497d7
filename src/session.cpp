// -----------------------------------------------------------------------------
// session.cpp: request/response correlation and the local-device operations
// built on top of it.
//
// API & flow diagram: see include/xbeelink/session.hpp
// Runnable examples: tests/test_session.cpp
// -----------------------------------------------------------------------------
#include "xbeelink/session.hpp"
#include "xbeelink/log.hpp"
#include "xbeelink/status_codes.hpp"

#include <cctype>

namespace xbeelink {

namespace {

bool iequals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// is_response_to()
// ----------------
// Called only for frames whose ID already equals the request's. Rejects a
// byte-identical echo of the request, and for AT requests anything that is
// not the matching AT response.
// ---------------------------------------------------------------------------
bool is_response_to(const Packet& request, const ByteVector& sent, const Packet& rx) {
  if (rx.generate_bytes(false) == sent) return false;

  if (const auto* at = request.as<AtCommandPacket>()) {
    const auto* r = rx.as<AtCommandResponsePacket>();
    return r && iequals(r->command, at->command);
  }
  if (const auto* atq = request.as<AtCommandQueuePacket>()) {
    const auto* r = rx.as<AtCommandResponsePacket>();
    return r && iequals(r->command, atq->command);
  }
  if (const auto* rat = request.as<RemoteAtCommandRequestPacket>()) {
    const auto* r = rx.as<RemoteAtCommandResponsePacket>();
    return r && iequals(r->command, rat->command);
  }
  return true;
}

// Removes a reader listener on every exit path of the calling scope.
class ListenerGuard {
public:
  ListenerGuard(DataReader& reader, DataReader::ListenerId id) : reader_(reader), id_(id) {}
  ~ListenerGuard() { reader_.remove_listener(id_); }

  ListenerGuard(const ListenerGuard&) = delete;
  ListenerGuard& operator=(const ListenerGuard&) = delete;

private:
  DataReader& reader_;
  DataReader::ListenerId id_;
};

bool valid_command(const std::string& command) {
  return command.size() == 2;
}

} // namespace

Session::Session(transport::ConnectionInterface& connection, SessionConfig config)
: conn_(connection),
  reader_(std::make_unique<DataReader>(connection, config.mode, config.queue_capacity,
                                       PacketParser(std::chrono::milliseconds(config.byte_timeout_ms)))),
  receive_timeout_ms_(config.receive_timeout_ms) {
  reader_->set_stop_callback([this] {
    if (!conn_.is_open() && open_.exchange(false))
      log::warn(std::string("session lost conn=") + conn_.name());
    wake_waiters();
  });
}

Session::~Session() {
  close();
}

// ---------- lifecycle ----------

// open(): also recovers a session whose link failed; the reader closed the
// connection and exited, so both are brought back here.
bool Session::open(std::string& err) {
  if (open_.load() && conn_.is_open() && reader_->is_running()) return true;
  if (!conn_.is_open() && !conn_.open(err)) {
    log::error(std::string("session open failed conn=") + conn_.name() + " reason=\"" + err + "\"");
    return false;
  }
  if (!reader_->is_running()) reader_->start();
  open_ = true;
  log::info(std::string("session opened conn=") + conn_.name() + " mode=" + to_string(mode()));
  return true;
}

void Session::close() {
  const bool was_open = open_.exchange(false);
  wake_waiters();
  reader_->stop();
  if (conn_.is_open()) conn_.close();
  if (was_open) log::info(std::string("session closed conn=") + conn_.name());
}

void Session::wake_waiters() {
  {
    std::lock_guard<std::mutex> lk(wait_mutex_);
  }
  wait_cv_.notify_all();
}

SendStatus Session::check_ready() const {
  if (!open_.load() || !conn_.is_open()) return SendStatus::InterfaceNotOpen;
  if (!is_api_mode(reader_->mode())) return SendStatus::InvalidOperatingMode;
  return SendStatus::Ok;
}

SendStatus Session::write_packet(const Packet& packet) {
  const ByteVector bytes = packet.generate_bytes(mode() == OperatingMode::API_ESCAPED);
  log::debug(std::string("tx type=") + packet.frame_type_name() + " bytes=" + to_hex(bytes));

  std::lock_guard<std::mutex> lk(write_mutex_);
  if (conn_.write(bytes.data(), bytes.size()) != transport::TxResult::Ok) {
    log::warn(std::string("write failed conn=") + conn_.name());
    return SendStatus::WriteFailed;
  }
  return SendStatus::Ok;
}

// ---------- raw frames ----------

SendStatus Session::send_packet(Packet packet, Packet& response) {
  return send_packet(std::move(packet), response, receive_timeout());
}

SendStatus Session::send_packet(Packet packet, Packet& response, Duration timeout) {
  const SendStatus ready = check_ready();
  if (ready != SendStatus::Ok) return ready;

  if (!packet.needs_frame_id()) return write_packet(packet);

  if (!packet.frame_id()) packet.set_frame_id(frame_ids_.next());
  const uint8_t fid = *packet.frame_id();
  const ByteVector sent = packet.generate_bytes(false);

  auto slot = std::make_shared<std::optional<Packet>>();
  const DataReader::ListenerId id = reader_->add_frame_id_listener(fid,
    [this, slot, packet, sent](const Packet& rx) {
      if (!is_response_to(packet, sent, rx)) return false;
      {
        std::lock_guard<std::mutex> lk(wait_mutex_);
        *slot = rx;
      }
      wait_cv_.notify_all();
      return true;
    });
  ListenerGuard guard(*reader_, id);

  const SendStatus written = write_packet(packet);
  if (written != SendStatus::Ok) return written;

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock<std::mutex> lk(wait_mutex_);
  wait_cv_.wait_until(lk, deadline, [&] {
    return slot->has_value() || !open_.load() || !reader_->is_running();
  });

  if (slot->has_value()) {
    response = **slot;
    return SendStatus::Ok;
  }
  if (!open_.load() || !reader_->is_running()) return SendStatus::Interrupted;

  log::warn("response timeout frame_id=" + std::to_string(fid) + " type=" + packet.frame_type_name());
  return SendStatus::Timeout;
}

SendStatus Session::send_packet_async(const Packet& packet) {
  const SendStatus ready = check_ready();
  if (ready != SendStatus::Ok) return ready;
  return write_packet(packet);
}

// ---------- local AT ----------

SendStatus Session::send_at_command(const std::string& command, const ByteVector& parameter,
                                    AtCommandResponsePacket& response, bool apply) {
  if (!valid_command(command)) return SendStatus::InvalidArgument;

  Packet request = apply ? Packet(AtCommandPacket{std::nullopt, command, parameter})
                         : Packet(AtCommandQueuePacket{std::nullopt, command, parameter});
  Packet rx;
  const SendStatus st = send_packet(std::move(request), rx);
  if (st != SendStatus::Ok) return st;

  const auto* r = rx.as<AtCommandResponsePacket>();
  if (!r) return SendStatus::InvalidArgument;
  response = *r;
  return SendStatus::Ok;
}

SendStatus Session::get_parameter(const std::string& command, ByteVector& value) {
  AtCommandResponsePacket resp;
  const SendStatus st = send_at_command(command, {}, resp);
  if (st != SendStatus::Ok) return st;
  if (resp.status != at_status::OK) {
    log::warn("AT " + command + " status=" + at_status_description(resp.status));
    return SendStatus::AtCommandError;
  }
  value = resp.value;
  return SendStatus::Ok;
}

SendStatus Session::set_parameter(const std::string& command, const ByteVector& value) {
  AtCommandResponsePacket resp;
  const SendStatus st = send_at_command(command, value, resp, apply_changes_.load());
  if (st != SendStatus::Ok) return st;
  if (resp.status != at_status::OK) {
    log::warn("AT " + command + " status=" + at_status_description(resp.status));
    return SendStatus::AtCommandError;
  }
  return SendStatus::Ok;
}

SendStatus Session::execute_command(const std::string& command) {
  AtCommandResponsePacket resp;
  const SendStatus st = send_at_command(command, {}, resp);
  if (st != SendStatus::Ok) return st;
  return resp.status == at_status::OK ? SendStatus::Ok : SendStatus::AtCommandError;
}

// reset(): FR is acknowledged before the module restarts; the restart itself
// is reported by a modem status frame.
SendStatus Session::reset() {
  auto reset_seen = std::make_shared<bool>(false);
  const DataReader::ListenerId id = reader_->add_modem_status_listener([this, reset_seen](uint8_t status) {
    if (status != modem_status::HARDWARE_RESET && status != modem_status::WATCHDOG_TIMER_RESET) return;
    {
      std::lock_guard<std::mutex> lk(wait_mutex_);
      *reset_seen = true;
    }
    wait_cv_.notify_all();
  });
  ListenerGuard guard(*reader_, id);

  const SendStatus st = execute_command("FR");
  if (st != SendStatus::Ok) return st;

  const auto deadline = std::chrono::steady_clock::now() + receive_timeout();
  std::unique_lock<std::mutex> lk(wait_mutex_);
  wait_cv_.wait_until(lk, deadline, [&] {
    return *reset_seen || !open_.load() || !reader_->is_running();
  });
  if (*reset_seen) return SendStatus::Ok;
  if (!open_.load() || !reader_->is_running()) return SendStatus::Interrupted;
  return SendStatus::Timeout;
}

OperatingMode Session::probe_operating_mode() {
  const OperatingMode original = mode();
  for (OperatingMode candidate : {OperatingMode::API, OperatingMode::API_ESCAPED}) {
    set_mode(candidate);
    ByteVector ap;
    if (get_parameter("AP", ap) != SendStatus::Ok) continue;

    const OperatingMode reported = ap.empty() ? candidate : static_cast<OperatingMode>(ap.back());
    const OperatingMode found = is_api_mode(reported) ? reported : candidate;
    set_mode(found);
    log::info(std::string("operating mode detected: ") + to_string(found));
    return found;
  }
  set_mode(original);
  return OperatingMode::UNKNOWN;
}

// ---------- remote AT ----------

SendStatus Session::send_remote_at_command(const RemoteAddress& node, const std::string& command,
                                           const ByteVector& parameter, uint8_t options,
                                           RemoteAtCommandResponsePacket& response) {
  if (!valid_command(command)) return SendStatus::InvalidArgument;

  RemoteAtCommandRequestPacket req;
  req.dest64    = node.addr64;
  req.dest16    = node.addr16;
  req.options   = options;
  req.command   = command;
  req.parameter = parameter;

  Packet rx;
  const SendStatus st = send_packet(Packet(req), rx);
  if (st != SendStatus::Ok) return st;

  const auto* r = rx.as<RemoteAtCommandResponsePacket>();
  if (!r) return SendStatus::InvalidArgument;
  response = *r;
  return SendStatus::Ok;
}

// ---------- data ----------

SendStatus Session::send_data(const RemoteAddress& node, const ByteVector& data, uint8_t* delivery_status) {
  TransmitRequestPacket req;
  req.dest64  = node.addr64;
  req.dest16  = node.addr16;
  req.rf_data = data;

  Packet rx;
  const SendStatus st = send_packet(Packet(req), rx);
  if (st != SendStatus::Ok) return st;

  uint8_t delivery = transmit_status::SUCCESS;
  if (const auto* ts = rx.as<TransmitStatusPacket>()) delivery = ts->delivery_status;
  else if (const auto* tx = rx.as<TxStatusPacket>()) delivery = tx->status;
  else return SendStatus::TransmitFailed;

  if (delivery_status) *delivery_status = delivery;
  if (delivery != transmit_status::SUCCESS && delivery != transmit_status::SELF_ADDRESSED) {
    log::warn("transmit to " + node.to_string() + " failed status=" + transmit_status_description(delivery));
    return SendStatus::TransmitFailed;
  }
  return SendStatus::Ok;
}

SendStatus Session::send_data_async(const RemoteAddress& node, const ByteVector& data) {
  TransmitRequestPacket req;
  req.dest64  = node.addr64;
  req.dest16  = node.addr16;
  req.rf_data = data;
  return send_packet_async(Packet(req));
}

SendStatus Session::send_broadcast_data(const ByteVector& data) {
  return send_data(RemoteAddress{Address64::BROADCAST, Address16::UNKNOWN}, data);
}

std::optional<XBeeMessage> Session::read_data(Duration timeout) {
  auto p = reader_->queue().first_data_packet(timeout);
  if (!p) return std::nullopt;
  return data_message_from(*p);
}

std::optional<XBeeMessage> Session::read_data_from(const RemoteAddress& node, Duration timeout) {
  auto p = reader_->queue().first_data_packet_from(node, timeout);
  if (!p) return std::nullopt;
  return data_message_from(*p);
}

} // namespace xbeelink
