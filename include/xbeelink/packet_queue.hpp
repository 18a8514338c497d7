#pragma once
/**
 * @file packet_queue.hpp
 * @brief Bounded inbound packet queue shared by the reader loop and callers.
 *
 * @details
 * Storage is a fixed-capacity etl::deque sized at compile time (MAX_CAPACITY).
 * The effective capacity can be lowered at construction.
 *
 * Overflow policy: add() on a full queue drops the OLDEST packet. The reader
 * loop never blocks on a slow consumer.
 *
 * The first_*() queries remove and return the oldest matching packet. With a
 * zero timeout they return immediately; otherwise they wait on a condition
 * variable until a match arrives or the timeout elapses.
 */

#include "xbeelink/messages.hpp"
#include "xbeelink/packet.hpp"
#include "etl/deque.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>

namespace xbeelink {

class PacketQueue {
public:
  static constexpr size_t MAX_CAPACITY = 50;

  explicit PacketQueue(size_t capacity = MAX_CAPACITY);

  /// Append; when full the oldest packet is discarded first.
  void add(const Packet& packet);
  void clear();

  size_t size() const;
  bool empty() const { return size() == 0; }
  size_t capacity() const { return capacity_; }
  /// Packets discarded by the overflow policy since construction.
  size_t dropped() const;

  using Duration = std::chrono::milliseconds;

  std::optional<Packet> first_packet(Duration timeout = Duration::zero());
  /// Any frame whose source identity matches `remote`.
  std::optional<Packet> first_packet_from(const RemoteAddress& remote, Duration timeout = Duration::zero());
  /// 0x90, 0x80, 0x81
  std::optional<Packet> first_data_packet(Duration timeout = Duration::zero());
  std::optional<Packet> first_data_packet_from(const RemoteAddress& remote, Duration timeout = Duration::zero());
  /// 0x91
  std::optional<Packet> first_explicit_data_packet(Duration timeout = Duration::zero());
  std::optional<Packet> first_explicit_data_packet_from(const RemoteAddress& remote, Duration timeout = Duration::zero());
  /// 0xB0
  std::optional<Packet> first_ip_data_packet(Duration timeout = Duration::zero());
  std::optional<Packet> first_ip_data_packet_from(const IPv4Address& source, Duration timeout = Duration::zero());

private:
  using Predicate = std::function<bool(const Packet&)>;
  std::optional<Packet> take_first(const Predicate& match, Duration timeout);

  mutable std::mutex m_;
  std::condition_variable cv_;
  etl::deque<Packet, MAX_CAPACITY> packets_;
  size_t capacity_;
  size_t dropped_ = 0;
};

} // namespace xbeelink
