#pragma once
/**
 * @file data_reader.hpp
 * @brief Background reader: turns the transport's byte stream into packets and fans them out.
 *
 * @details
 * One DataReader runs per open connection, on its own std::thread.
 *
 * LOOP
 * ----
 *   - wait on the connection's DataSignal while nothing is buffered
 *   - read one byte; anything other than 0x7E is discarded (resync)
 *   - on 0x7E run the PacketParser; a fault on that frame is logged and the
 *     loop goes back to scanning
 *   - exit when stop() is called or the transport reports Error
 *
 * In AT (or UNKNOWN) mode bytes are drained and dropped; no frames exist.
 *
 * DISPATCH (per good packet, in this order, on the reader thread)
 * --------
 *   1. push into the PacketQueue (drop-oldest when full)
 *   2. frame-ID listeners whose ID equals the packet's frame ID. The listener
 *      returns true to accept; an accepted listener is removed (one-shot),
 *      a rejected one stays registered for a later frame.
 *   3. every "any packet" listener
 *   4. typed listeners chosen by frame kind:
 *        data          0x90, 0x80, 0x81, Digi-profile 0x91 (also queued as 0x90)
 *        explicit data 0x91
 *        IO sample     0x92, 0x82, 0x83
 *        modem status  0x8A
 *        IP data       0xB0
 *        relay data    0xAD
 *
 * Listener tables are copied under the lock and invoked outside it, so a
 * listener may add or remove listeners. A listener that throws is logged and
 * the remaining listeners still run.
 *
 * STATES
 * ------
 *   Idle -> Running (start) -> Stopping (stop) -> Stopped
 *   Running -> Stopped directly when the transport fails; the reader then
 *   closes the connection itself.
 */

#include "xbeelink/messages.hpp"
#include "xbeelink/operating_mode.hpp"
#include "xbeelink/packet_queue.hpp"
#include "xbeelink/parser.hpp"
#include "xbeelink/transport/connection.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace xbeelink {

class DataReader {
public:
  enum class State : uint8_t { Idle = 0, Running, Stopping, Stopped };

  using ListenerId = uint64_t;

  using PacketListener       = std::function<void(const Packet&)>;
  /// Returns true when the packet is the one it was waiting for.
  using FrameIdListener      = std::function<bool(const Packet&)>;
  using DataListener         = std::function<void(const XBeeMessage&)>;
  using ExplicitDataListener = std::function<void(const ExplicitXBeeMessage&)>;
  using IOSampleListener     = std::function<void(const IOSampleMessage&)>;
  using ModemStatusListener  = std::function<void(uint8_t status)>;
  using IPDataListener       = std::function<void(const IPMessage&)>;
  using RelayDataListener    = std::function<void(const UserDataRelayMessage&)>;

  DataReader(transport::ConnectionInterface& connection, OperatingMode mode,
             size_t queue_capacity = PacketQueue::MAX_CAPACITY,
             PacketParser parser = PacketParser{});
  ~DataReader();

  DataReader(const DataReader&) = delete;
  DataReader& operator=(const DataReader&) = delete;

  /// Clears the queue and launches the loop. false if already running.
  bool start();
  /// Request stop, wake the loop and join. Safe to call repeatedly.
  void stop();

  State state() const { return state_.load(); }
  bool is_running() const { return state_.load() == State::Running; }

  void set_mode(OperatingMode mode) { mode_.store(mode); }
  OperatingMode mode() const { return mode_.load(); }

  PacketQueue& queue() { return queue_; }

  // -------- Listener registration --------
  ListenerId add_packet_listener(PacketListener fn);
  ListenerId add_frame_id_listener(uint8_t frame_id, FrameIdListener fn);
  ListenerId add_data_listener(DataListener fn);
  ListenerId add_explicit_data_listener(ExplicitDataListener fn);
  ListenerId add_io_sample_listener(IOSampleListener fn);
  ListenerId add_modem_status_listener(ModemStatusListener fn);
  ListenerId add_ip_data_listener(IPDataListener fn);
  ListenerId add_relay_data_listener(RelayDataListener fn);

  /// Removes a listener of any kind. false if the ID is not registered.
  bool remove_listener(ListenerId id);

  size_t frame_id_listener_count() const;

  /// Called on the reader thread when the loop exits for any reason.
  void set_stop_callback(std::function<void()> fn);

  /// Dispatch as if `packet` had just been parsed. Used by the loop and by tests.
  void packet_received(const Packet& packet);

private:
  template <typename Fn>
  struct Entry {
    ListenerId id;
    Fn fn;
  };

  struct FrameIdEntry {
    ListenerId id;
    uint8_t frame_id;
    FrameIdListener fn;
  };

  void run();
  void notify_frame_id_listeners(const Packet& packet);
  void notify_typed_listeners(const Packet& packet);

  template <typename Fn, typename Arg>
  void invoke_all(const std::vector<Entry<Fn>>& list, const Arg& arg, const char* what);

  transport::ConnectionInterface& conn_;
  PacketParser parser_;
  PacketQueue queue_;
  std::atomic<OperatingMode> mode_;
  std::atomic<State> state_{State::Idle};
  std::thread thread_;

  mutable std::mutex listeners_mutex_;
  ListenerId next_id_ = 1;
  std::vector<Entry<PacketListener>>       packet_listeners_;
  std::vector<FrameIdEntry>                frame_id_listeners_;
  std::vector<Entry<DataListener>>         data_listeners_;
  std::vector<Entry<ExplicitDataListener>> explicit_listeners_;
  std::vector<Entry<IOSampleListener>>     io_listeners_;
  std::vector<Entry<ModemStatusListener>>  modem_listeners_;
  std::vector<Entry<IPDataListener>>       ip_listeners_;
  std::vector<Entry<RelayDataListener>>    relay_listeners_;
  std::function<void()>                    on_stopped_;
};

} // namespace xbeelink
