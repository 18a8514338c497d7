// -----------------------------------------------------------------------------
// packet_queue.cpp: bounded inbound queue (drop-oldest).
// -----------------------------------------------------------------------------
#include "xbeelink/packet_queue.hpp"

namespace xbeelink {

namespace {

bool is_data(const Packet& p) {
  return p.is<ReceivePacket>() || p.is<Rx64Packet>() || p.is<Rx16Packet>();
}

bool from_remote(const Packet& p, const RemoteAddress& remote) {
  const auto src = source_of(p);
  return src && src->matches(remote);
}

} // namespace

PacketQueue::PacketQueue(size_t capacity)
: capacity_((capacity == 0 || capacity > MAX_CAPACITY) ? MAX_CAPACITY : capacity) {}

void PacketQueue::add(const Packet& packet) {
  {
    std::lock_guard<std::mutex> lk(m_);
    if (packets_.size() >= capacity_) {         // overflow: drop oldest
      packets_.pop_front();
      ++dropped_;
    }
    packets_.push_back(packet);
  }
  cv_.notify_all();
}

void PacketQueue::clear() {
  std::lock_guard<std::mutex> lk(m_);
  packets_.clear();
}

size_t PacketQueue::size() const {
  std::lock_guard<std::mutex> lk(m_);
  return packets_.size();
}

size_t PacketQueue::dropped() const {
  std::lock_guard<std::mutex> lk(m_);
  return dropped_;
}

// ---------------------------------------------------------------------------
// take_first()
// ------------
// Scan oldest to newest for a match; if none, wait for the next add() and
// rescan until the deadline.
// ---------------------------------------------------------------------------
std::optional<Packet> PacketQueue::take_first(const Predicate& match, Duration timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock<std::mutex> lk(m_);
  while (true) {
    for (auto it = packets_.begin(); it != packets_.end(); ++it) {
      if (match(*it)) {
        Packet found = *it;
        packets_.erase(it);
        return found;
      }
    }
    if (cv_.wait_until(lk, deadline) == std::cv_status::timeout) {
      // one last scan: a packet may have landed together with the timeout
      for (auto it = packets_.begin(); it != packets_.end(); ++it) {
        if (match(*it)) {
          Packet found = *it;
          packets_.erase(it);
          return found;
        }
      }
      return std::nullopt;
    }
  }
}

std::optional<Packet> PacketQueue::first_packet(Duration timeout) {
  return take_first([](const Packet&) { return true; }, timeout);
}

std::optional<Packet> PacketQueue::first_packet_from(const RemoteAddress& remote, Duration timeout) {
  return take_first([&](const Packet& p) { return from_remote(p, remote); }, timeout);
}

std::optional<Packet> PacketQueue::first_data_packet(Duration timeout) {
  return take_first(is_data, timeout);
}

std::optional<Packet> PacketQueue::first_data_packet_from(const RemoteAddress& remote, Duration timeout) {
  return take_first([&](const Packet& p) { return is_data(p) && from_remote(p, remote); }, timeout);
}

std::optional<Packet> PacketQueue::first_explicit_data_packet(Duration timeout) {
  return take_first([](const Packet& p) { return p.is<ExplicitRxIndicatorPacket>(); }, timeout);
}

std::optional<Packet> PacketQueue::first_explicit_data_packet_from(const RemoteAddress& remote,
                                                                  Duration timeout) {
  return take_first([&](const Packet& p) {
    return p.is<ExplicitRxIndicatorPacket>() && from_remote(p, remote);
  }, timeout);
}

std::optional<Packet> PacketQueue::first_ip_data_packet(Duration timeout) {
  return take_first([](const Packet& p) { return p.is<RxIPv4Packet>(); }, timeout);
}

std::optional<Packet> PacketQueue::first_ip_data_packet_from(const IPv4Address& source, Duration timeout) {
  return take_first([&](const Packet& p) {
    const auto* r = p.as<RxIPv4Packet>();
    return r && r->source_address == source;
  }, timeout);
}

} // namespace xbeelink
