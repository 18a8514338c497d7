// -----------------------------------------------------------------------------
// data_reader.cpp: reader loop and listener fan-out.
//
// API & dispatch order: see include/xbeelink/data_reader.hpp
// Runnable examples: tests/test_data_reader.cpp
// -----------------------------------------------------------------------------
#include "xbeelink/data_reader.hpp"
#include "xbeelink/escape.hpp"
#include "xbeelink/log.hpp"

#include <exception>

namespace xbeelink {

namespace {
constexpr std::chrono::milliseconds IDLE_WAIT{200};   // upper bound between state checks
}

DataReader::DataReader(transport::ConnectionInterface& connection, OperatingMode mode,
                       size_t queue_capacity, PacketParser parser)
: conn_(connection), parser_(parser), queue_(queue_capacity), mode_(mode) {}

DataReader::~DataReader() {
  stop();
}

// ---------- lifecycle ----------

bool DataReader::start() {
  State s = state_.load();
  if (s == State::Running || s == State::Stopping) return false;
  if (thread_.joinable()) thread_.join();        // previous run already exited

  queue_.clear();                                // stale frames from a previous session
  state_ = State::Running;
  thread_ = std::thread(&DataReader::run, this);
  return true;
}

void DataReader::stop() {
  State expected = State::Running;
  state_.compare_exchange_strong(expected, State::Stopping);
  conn_.signal().notify();                       // wake the loop if it is waiting
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
  if (state_.load() != State::Idle) state_ = State::Stopped;
}

void DataReader::set_stop_callback(std::function<void()> fn) {
  std::lock_guard<std::mutex> lk(listeners_mutex_);
  on_stopped_ = std::move(fn);
}

// ---------------------------------------------------------------------------
// run()
// -----
// Scan for delimiters, parse, dispatch. Per-frame faults never end the loop;
// only stop() or a transport Error does.
// ---------------------------------------------------------------------------
void DataReader::run() {
  log::info(std::string("reader started conn=") + conn_.name());
  bool transport_failed = false;

  while (state_.load() == State::Running) {
    const uint64_t seen = conn_.signal().sequence();
    uint8_t b = 0;
    const transport::RxResult r = conn_.read_byte(b);

    if (r == transport::RxResult::Error) { transport_failed = true; break; }
    if (r == transport::RxResult::None) {
      conn_.signal().wait_for(seen, IDLE_WAIT);
      continue;
    }

    const OperatingMode m = mode_.load();
    if (!is_api_mode(m)) continue;               // AT mode: drain
    if (b != escape::HEADER_BYTE) continue;      // resync on the next delimiter

    Packet packet;
    std::string err;
    const ParseStatus st = parser_.parse_packet(conn_, m, packet, err);
    if (st != ParseStatus::Ok) {
      log::warn(std::string("frame dropped status=") + to_string(st) + " reason=\"" + err + "\"");
      continue;
    }
    packet_received(packet);
  }

  if (transport_failed) {
    State expected = State::Running;
    if (state_.compare_exchange_strong(expected, State::Stopped)) {
      log::error(std::string("reader stopped: transport failed conn=") + conn_.name());
      if (conn_.is_open()) conn_.close();
    }
  }
  log::info(std::string("reader exited conn=") + conn_.name());

  std::function<void()> cb;
  {
    std::lock_guard<std::mutex> lk(listeners_mutex_);
    cb = on_stopped_;
  }
  if (cb) cb();
}

// ---------- dispatch ----------

template <typename Fn, typename Arg>
void DataReader::invoke_all(const std::vector<Entry<Fn>>& list, const Arg& arg, const char* what) {
  for (const auto& e : list) {
    try {
      e.fn(arg);
    } catch (const std::exception& ex) {
      log::error(std::string(what) + " listener threw: " + ex.what());
    }
  }
}

void DataReader::packet_received(const Packet& packet) {
  log::debug(std::string("packet received type=") + packet.frame_type_name() +
             " bytes=" + packet.to_hex_string());

  queue_.add(packet);
  notify_frame_id_listeners(packet);

  std::vector<Entry<PacketListener>> any;
  {
    std::lock_guard<std::mutex> lk(listeners_mutex_);
    any = packet_listeners_;
  }
  invoke_all(any, packet, "packet");

  notify_typed_listeners(packet);
}

// notify_frame_id_listeners(): one-shot: accepted listeners are removed,
// rejecting ones stay for the next frame with that ID.
void DataReader::notify_frame_id_listeners(const Packet& packet) {
  if (!packet.needs_frame_id() || !packet.frame_id()) return;
  const uint8_t fid = *packet.frame_id();

  std::vector<FrameIdEntry> matching;
  {
    std::lock_guard<std::mutex> lk(listeners_mutex_);
    for (const auto& e : frame_id_listeners_)
      if (e.frame_id == fid) matching.push_back(e);
  }

  for (const auto& e : matching) {
    bool accepted = false;
    try {
      accepted = e.fn(packet);
    } catch (const std::exception& ex) {
      log::error(std::string("frame id listener threw: ") + ex.what());
    }
    if (accepted) remove_listener(e.id);
  }
}

void DataReader::notify_typed_listeners(const Packet& packet) {
  std::unique_lock<std::mutex> lk(listeners_mutex_);

  if (auto msg = data_message_from(packet)) {
    auto list = data_listeners_;
    lk.unlock();
    log::info("data received from=" + msg->remote.to_string() + " len=" + std::to_string(msg->data.size()));
    // Digi data-profile explicit frames are also offered to data readers as 0x90.
    if (const auto* ex = packet.as<ExplicitRxIndicatorPacket>())
      queue_.add(ReceivePacket{ex->source64, ex->source16, ex->options, ex->rf_data});
    invoke_all(list, *msg, "data");
    lk.lock();
  }

  if (auto msg = explicit_message_from(packet)) {
    auto list = explicit_listeners_;
    lk.unlock();
    invoke_all(list, *msg, "explicit data");
    return;
  }
  if (auto msg = io_sample_message_from(packet)) {
    auto list = io_listeners_;
    lk.unlock();
    invoke_all(list, *msg, "io sample");
    return;
  }
  if (const auto* ms = packet.as<ModemStatusPacket>()) {
    auto list = modem_listeners_;
    lk.unlock();
    log::info("modem status=" + byte_to_hex(ms->status));
    invoke_all(list, ms->status, "modem status");
    return;
  }
  if (auto msg = ip_message_from(packet)) {
    auto list = ip_listeners_;
    lk.unlock();
    invoke_all(list, *msg, "ip data");
    return;
  }
  if (auto msg = relay_message_from(packet)) {
    auto list = relay_listeners_;
    lk.unlock();
    invoke_all(list, *msg, "relay data");
    return;
  }
}

// ---------- registration ----------

DataReader::ListenerId DataReader::add_packet_listener(PacketListener fn) {
  std::lock_guard<std::mutex> lk(listeners_mutex_);
  packet_listeners_.push_back({next_id_, std::move(fn)});
  return next_id_++;
}

DataReader::ListenerId DataReader::add_frame_id_listener(uint8_t frame_id, FrameIdListener fn) {
  std::lock_guard<std::mutex> lk(listeners_mutex_);
  frame_id_listeners_.push_back({next_id_, frame_id, std::move(fn)});
  return next_id_++;
}

DataReader::ListenerId DataReader::add_data_listener(DataListener fn) {
  std::lock_guard<std::mutex> lk(listeners_mutex_);
  data_listeners_.push_back({next_id_, std::move(fn)});
  return next_id_++;
}

DataReader::ListenerId DataReader::add_explicit_data_listener(ExplicitDataListener fn) {
  std::lock_guard<std::mutex> lk(listeners_mutex_);
  explicit_listeners_.push_back({next_id_, std::move(fn)});
  return next_id_++;
}

DataReader::ListenerId DataReader::add_io_sample_listener(IOSampleListener fn) {
  std::lock_guard<std::mutex> lk(listeners_mutex_);
  io_listeners_.push_back({next_id_, std::move(fn)});
  return next_id_++;
}

DataReader::ListenerId DataReader::add_modem_status_listener(ModemStatusListener fn) {
  std::lock_guard<std::mutex> lk(listeners_mutex_);
  modem_listeners_.push_back({next_id_, std::move(fn)});
  return next_id_++;
}

DataReader::ListenerId DataReader::add_ip_data_listener(IPDataListener fn) {
  std::lock_guard<std::mutex> lk(listeners_mutex_);
  ip_listeners_.push_back({next_id_, std::move(fn)});
  return next_id_++;
}

DataReader::ListenerId DataReader::add_relay_data_listener(RelayDataListener fn) {
  std::lock_guard<std::mutex> lk(listeners_mutex_);
  relay_listeners_.push_back({next_id_, std::move(fn)});
  return next_id_++;
}

namespace {
template <typename List>
bool erase_id(List& list, uint64_t id) {
  for (auto it = list.begin(); it != list.end(); ++it) {
    if (it->id == id) {
      list.erase(it);
      return true;
    }
  }
  return false;
}
} // namespace

bool DataReader::remove_listener(ListenerId id) {
  std::lock_guard<std::mutex> lk(listeners_mutex_);
  return erase_id(frame_id_listeners_, id) || erase_id(packet_listeners_, id) ||
         erase_id(data_listeners_, id) || erase_id(explicit_listeners_, id) ||
         erase_id(io_listeners_, id) || erase_id(modem_listeners_, id) ||
         erase_id(ip_listeners_, id) || erase_id(relay_listeners_, id);
}

size_t DataReader::frame_id_listener_count() const {
  std::lock_guard<std::mutex> lk(listeners_mutex_);
  return frame_id_listeners_.size();
}

} // namespace xbeelink
