// -----------------------------------------------------------------------------
// memory_connection.cpp: in-process transport for tests and loopback tools.
// -----------------------------------------------------------------------------
#include "xbeelink/transport/memory_connection.hpp"

namespace xbeelink::transport {

bool MemoryConnection::open(std::string&) {
  {
    std::lock_guard<std::mutex> lk(m_);
    open_ = true;
    link_dropped_ = false;
  }
  signal_.notify();
  return true;
}

void MemoryConnection::close() {
  {
    std::lock_guard<std::mutex> lk(m_);
    open_ = false;
  }
  signal_.notify();                               // wake reader and waiters
}

bool MemoryConnection::is_open() const {
  std::lock_guard<std::mutex> lk(m_);
  return open_;
}

std::size_t MemoryConnection::available() const {
  std::lock_guard<std::mutex> lk(m_);
  return rx_.size();
}

RxResult MemoryConnection::read_byte(uint8_t& out) {
  std::lock_guard<std::mutex> lk(m_);
  if (!open_ || link_dropped_) return RxResult::Error;
  if (rx_.empty()) return RxResult::None;
  out = rx_.front();
  rx_.pop_front();
  return RxResult::Ok;
}

// write(): records the frame, echoes it if asked, then runs the hook
// outside the lock so the hook may call inject().
TxResult MemoryConnection::write(const uint8_t* data, std::size_t len) {
  std::vector<uint8_t> frame(data, data + len);
  WriteHook hook;
  bool echo = false;
  {
    std::lock_guard<std::mutex> lk(m_);
    if (!open_ || link_dropped_) return TxResult::Error;
    written_.push_back(frame);
    hook = hook_;
    echo = echo_;
  }
  if (echo) inject(frame);
  if (hook) hook(frame);
  return TxResult::Ok;
}

void MemoryConnection::inject(const std::vector<uint8_t>& bytes) {
  {
    std::lock_guard<std::mutex> lk(m_);
    rx_.insert(rx_.end(), bytes.begin(), bytes.end());
  }
  signal_.notify();
}

void MemoryConnection::set_echo(bool on) {
  std::lock_guard<std::mutex> lk(m_);
  echo_ = on;
}

void MemoryConnection::set_write_hook(WriteHook hook) {
  std::lock_guard<std::mutex> lk(m_);
  hook_ = std::move(hook);
}

void MemoryConnection::drop_link() {
  {
    std::lock_guard<std::mutex> lk(m_);
    link_dropped_ = true;
  }
  signal_.notify();
}

std::vector<std::vector<uint8_t>> MemoryConnection::written() const {
  std::lock_guard<std::mutex> lk(m_);
  return written_;
}

void MemoryConnection::clear_written() {
  std::lock_guard<std::mutex> lk(m_);
  written_.clear();
}

} // namespace xbeelink::transport
