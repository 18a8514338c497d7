#pragma once
/**
 * @file serial_port.hpp
 * @brief Linux tty transport (termios raw 8N1) with a background receive thread.
 *
 * @details
 * open() puts the device in raw mode (no echo, no line discipline, no flow
 * control, VMIN=VTIME=0) at the configured baud and starts a receive thread
 * that poll()s the descriptor, moves bytes into an internal buffer and notifies
 * signal(). read_byte() only touches that buffer, so it never blocks.
 *
 * When read() reports end of file or a hard error the port marks itself
 * closed and notifies, which ends the reader loop.
 *
 * Baud rates: 1200..230400 map to termios constants; anything else is refused
 * by open() with a reason in `err`.
 *
 * @code
 *   xbeelink::transport::SerialPort port("/dev/ttyUSB0", 9600);
 *   std::string err;
 *   if (!port.open(err)) { ... }
 * @endcode
 */

#if !defined(__linux__)
#  error "serial_port.hpp is Linux-only."
#endif

#include "xbeelink/transport/connection.hpp"
#include <atomic>
#include <deque>
#include <thread>

namespace xbeelink::transport {

class SerialPort : public ConnectionInterface {
public:
  SerialPort(std::string path, int baud);
  ~SerialPort() override;

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  bool        open(std::string& err) override;
  void        close() override;
  bool        is_open() const override { return open_.load(); }
  std::size_t available() const override;
  RxResult    read_byte(uint8_t& out) override;
  TxResult    write(const uint8_t* data, std::size_t len) override;
  const char* name() const override { return path_.c_str(); }

  const std::string& path() const { return path_; }
  int baud() const { return baud_; }

private:
  void rx_loop();

  std::string path_;
  int baud_;
  int fd_ = -1;
  int wake_pipe_[2] = {-1, -1};   // close() writes here to break poll()
  std::atomic<bool> open_{false};
  std::thread rx_thread_;

  mutable std::mutex rx_mutex_;
  std::deque<uint8_t> rx_;
  std::mutex tx_mutex_;
};

} // namespace xbeelink::transport
