#pragma once
/**
 * @file memory_connection.hpp
 * @brief In-process transport: bytes are injected by the caller, writes are recorded.
 *
 * Used by the tests to stand in for a module, and by tools that want to replay
 * captured traffic through the engine. Options:
 *  - set_echo(true) loops every written frame straight back into the receive
 *    buffer, like a serial adapter with local echo.
 *  - set_write_hook(fn) runs fn(frame) after each write, on the writer's
 *    thread; a test uses it to inject the module's response.
 *  - drop_link() simulates the far end disappearing: reads fail with Error.
 */

#include "xbeelink/transport/connection.hpp"
#include <deque>
#include <functional>
#include <vector>

namespace xbeelink::transport {

class MemoryConnection : public ConnectionInterface {
public:
  using WriteHook = std::function<void(const std::vector<uint8_t>&)>;

  bool        open(std::string& err) override;
  void        close() override;
  bool        is_open() const override;
  std::size_t available() const override;
  RxResult    read_byte(uint8_t& out) override;
  TxResult    write(const uint8_t* data, std::size_t len) override;
  const char* name() const override { return "memory"; }

  /// Append bytes to the receive side and wake readers.
  void inject(const std::vector<uint8_t>& bytes);

  void set_echo(bool on);
  void set_write_hook(WriteHook hook);
  void drop_link();

  /// Copies of every frame passed to write(), oldest first.
  std::vector<std::vector<uint8_t>> written() const;
  void clear_written();

private:
  mutable std::mutex m_;
  std::deque<uint8_t> rx_;
  std::vector<std::vector<uint8_t>> written_;
  WriteHook hook_;
  bool open_ = false;
  bool echo_ = false;
  bool link_dropped_ = false;
};

} // namespace xbeelink::transport
