#pragma once
/**
 * @file connection.hpp
 * @brief Byte transport contract consumed by the parser, reader and session.
 *
 * Contract:
 *  - open(err) acquires the link; close() releases it and wakes any waiter.
 *  - available() is the number of bytes buffered and ready for read_byte().
 *  - read_byte(b) never blocks: Ok with a byte, None when nothing is buffered,
 *    Error when the link is closed or failed.
 *  - write(data, len) sends a whole frame; Ok only if every byte went out.
 *  - signal() is notified whenever bytes arrive or the link state changes.
 *    The reader loop sleeps on it instead of polling.
 *
 * Implementations: transport::SerialPort (Linux tty), transport::MemoryConnection
 * (in-process, used by tests and loopback tools).
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace xbeelink::transport {

enum class TxResult : uint8_t { Ok = 0, Busy = 1, Error = 2 };
enum class RxResult : uint8_t { None = 0, Ok = 1, Error = 2 };

/**
 * @brief "Something changed" signal with a sequence counter.
 *
 * Waiters capture sequence() before checking for data and then wait for it to
 * move, so a notify that lands between the check and the wait is never lost.
 */
class DataSignal {
public:
  void notify() {
    {
      std::lock_guard<std::mutex> lk(m_);
      ++seq_;
    }
    cv_.notify_all();
  }

  uint64_t sequence() const {
    std::lock_guard<std::mutex> lk(m_);
    return seq_;
  }

  /// @return true if the sequence moved past `seen` before the timeout.
  bool wait_for(uint64_t seen, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_);
    return cv_.wait_for(lk, timeout, [&] { return seq_ != seen; });
  }

private:
  mutable std::mutex m_;
  std::condition_variable cv_;
  uint64_t seq_ = 0;
};

/// Anything the parser can pull single raw bytes from with a deadline.
class ByteSource {
public:
  virtual ~ByteSource() = default;
  /// Ok with a byte, None when `timeout` passed without one, Error when the source is gone.
  virtual RxResult read_byte_wait(uint8_t& out, std::chrono::milliseconds timeout) = 0;
};

class ConnectionInterface : public ByteSource {
public:
  ~ConnectionInterface() override = default;

  virtual bool        open(std::string& err) = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual std::size_t available() const = 0;
  virtual RxResult    read_byte(uint8_t& out) = 0;
  virtual TxResult    write(const uint8_t* data, std::size_t len) = 0;
  virtual const char* name() const = 0;

  DataSignal& signal() { return signal_; }

  // read_byte_wait(): read_byte() plus a bounded sleep on the data signal.
  RxResult read_byte_wait(uint8_t& out, std::chrono::milliseconds timeout) override {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
      const uint64_t seen = signal_.sequence();
      const RxResult r = read_byte(out);
      if (r != RxResult::None) return r;

      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) return RxResult::None;
      signal_.wait_for(seen, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
                                 std::chrono::milliseconds(1));
    }
  }

protected:
  DataSignal signal_;
};

} // namespace xbeelink::transport
