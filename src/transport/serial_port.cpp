// ============================================================================
// serial_port.cpp: implementation for transport/serial_port.hpp
// ============================================================================
#include "xbeelink/transport/serial_port.hpp"
#include "xbeelink/log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace xbeelink::transport {

namespace {

// ---------------------------------------------------------------------------
// baud_constant()
// ---------------
// Map an integer baud to its termios constant. false for unsupported rates.
// ---------------------------------------------------------------------------
bool baud_constant(int baud, speed_t& out) {
  switch (baud) {
    case 1200:   out = B1200;   return true;
    case 2400:   out = B2400;   return true;
    case 4800:   out = B4800;   return true;
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
#ifdef B230400
    case 230400: out = B230400; return true;
#endif
    default:     return false;
  }
}

// ---------------------------------------------------------------------------
// set_raw()
// ---------
// Raw 8N1: no echo, no line buffering, no flow control. VMIN=0, VTIME=0 so
// reads never block; poll() in rx_loop() does the waiting.
// ---------------------------------------------------------------------------
bool set_raw(int fd, speed_t baud) {
  termios tio{};
  if (tcgetattr(fd, &tio) != 0) return false;   // fetch current settings

  cfmakeraw(&tio);                              // wipe into raw 8N1 mode
  cfsetispeed(&tio, baud);
  cfsetospeed(&tio, baud);

  tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
  tio.c_cflag &= ~CRTSCTS;                      // disable hardware flow control
  tio.c_iflag &= ~(IXON | IXOFF | IXANY);       // XON/XOFF are frame bytes here
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;

  if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
  tcflush(fd, TCIOFLUSH);                       // drop boot chatter
  return true;
}

} // namespace

SerialPort::SerialPort(std::string path, int baud)
: path_(std::move(path)), baud_(baud) {}

SerialPort::~SerialPort() {
  close();
}

bool SerialPort::open(std::string& err) {
  if (open_) return true;

  speed_t sp;
  if (!baud_constant(baud_, sp)) {
    err = "unsupported baud rate " + std::to_string(baud_);
    return false;
  }

  fd_ = ::open(path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    err = "open " + path_ + ": " + std::strerror(errno);
    return false;
  }
  if (!set_raw(fd_, sp)) {
    err = "termios setup failed on " + path_ + ": " + std::strerror(errno);
    ::close(fd_);
    fd_ = -1;
    return false;
  }
  if (::pipe(wake_pipe_) != 0) {
    err = std::string("pipe: ") + std::strerror(errno);
    ::close(fd_);
    fd_ = -1;
    return false;
  }

  {
    std::lock_guard<std::mutex> lk(rx_mutex_);
    rx_.clear();
  }
  open_ = true;
  rx_thread_ = std::thread(&SerialPort::rx_loop, this);
  log::info("serial open path=" + path_ + " baud=" + std::to_string(baud_));
  signal_.notify();
  return true;
}

void SerialPort::close() {
  const bool was_open = open_.exchange(false);
  if (wake_pipe_[1] >= 0) {
    const uint8_t b = 0;
    // the RX thread also re-checks open_ every 200 ms, so a failed wake only delays close
    if (::write(wake_pipe_[1], &b, 1) != 1)
      log::debug("serial wake pipe write failed path=" + path_ + " err=" + std::strerror(errno));
  }
  if (rx_thread_.joinable()) rx_thread_.join();

  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  for (int& p : wake_pipe_) {
    if (p >= 0) { ::close(p); p = -1; }
  }
  if (was_open) log::info("serial closed path=" + path_);
  signal_.notify();
}

std::size_t SerialPort::available() const {
  std::lock_guard<std::mutex> lk(rx_mutex_);
  return rx_.size();
}

RxResult SerialPort::read_byte(uint8_t& out) {
  std::lock_guard<std::mutex> lk(rx_mutex_);
  if (!rx_.empty()) {
    out = rx_.front();
    rx_.pop_front();
    return RxResult::Ok;
  }
  return open_ ? RxResult::None : RxResult::Error;
}

// write(): loops over partial writes; the module's UART buffer is small and
// a frame split across write(2) calls is still one frame on the wire.
TxResult SerialPort::write(const uint8_t* data, std::size_t len) {
  if (!open_) return TxResult::Error;
  std::lock_guard<std::mutex> lk(tx_mutex_);
  std::size_t sent = 0;
  while (sent < len) {
    const ssize_t n = ::write(fd_, data + sent, len - sent);
    if (n > 0) { sent += static_cast<std::size_t>(n); continue; }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{fd_, POLLOUT, 0};
      if (::poll(&pfd, 1, 100) < 0 && errno != EINTR) return TxResult::Error;
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    log::error("serial write failed path=" + path_ + " reason=" + std::strerror(errno));
    return TxResult::Error;
  }
  tcdrain(fd_);
  return TxResult::Ok;
}

// ---------------------------------------------------------------------------
// rx_loop()
// ---------
// Background receive. Exits when close() clears open_ (woken via the pipe) or
// when the device goes away; in the latter case the port marks itself closed.
// ---------------------------------------------------------------------------
void SerialPort::rx_loop() {
  uint8_t buf[256];
  pollfd pfds[2] = {{fd_, POLLIN, 0}, {wake_pipe_[0], POLLIN, 0}};

  while (open_) {
    const int pr = ::poll(pfds, 2, 200);
    if (pr < 0) {
      if (errno == EINTR) continue;
      log::error(std::string("serial poll failed reason=") + std::strerror(errno));
      break;
    }
    if (pr == 0) continue;                        // idle, re-check open_
    if (pfds[1].revents & POLLIN) break;          // close() requested

    if (pfds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
      log::error("serial link lost path=" + path_);
      break;
    }
    if (pfds[0].revents & POLLIN) {
      const ssize_t n = ::read(fd_, buf, sizeof(buf));
      if (n > 0) {
        {
          std::lock_guard<std::mutex> lk(rx_mutex_);
          rx_.insert(rx_.end(), buf, buf + n);
        }
        signal_.notify();
      } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        log::error("serial read failed path=" + path_);
        break;
      }
    }
  }
  open_ = false;
  signal_.notify();
}

} // namespace xbeelink::transport
