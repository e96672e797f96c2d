// ============================================================================
// serial_transport.cpp — implementation for transport_linux_serial.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file serial_transport.cpp
 */

#include "ninotnc/transport/transport_linux_serial.hpp"

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY)
#include <unistd.h>        // ::write, ::close
#include <termios.h>       // termios struct + raw mode helpers
#include <cerrno>
#include <cstring>         // strerror

namespace ninotnc::transport {

// ---------------------------------------------------------------------------
// baud_to_speed()
// ---------------
// Map an integer baud to its termios constant. Returns false for rates the
// table does not carry; unlike a data link we never fall back to a default,
// a TNC at the wrong rate silently ignores the frame.
// ---------------------------------------------------------------------------
static bool baud_to_speed(int baud, speed_t& out) {
    switch (baud) {
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
// ----------
// Configure a file descriptor for raw serial I/O at the given speed.
// - cfmakeraw: 8 data bits, no parity, no echo, no line buffering.
// - One stop bit (CSTOPB cleared), no hardware flow control.
// - Flushes both input/output buffers after applying settings.
//
// Returns: true on success, false if tcgetattr/tcsetattr fails (errno set).
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t speed) {
    termios tio{};
    if (::tcgetattr(fd, &tio) != 0) return false;   // also fails when fd is not a tty

    ::cfmakeraw(&tio);
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);

    tio.c_cflag &= ~(CSIZE | PARENB | CSTOPB);      // 8N1, spelled out
    tio.c_cflag |= CS8;
    tio.c_cflag |= (CLOCAL | CREAD);                // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                        // disable hardware flow control

    if (::tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    ::tcflush(fd, TCIOFLUSH);
    return true;
}


// ---------------------------------------------------------------------------
// SerialTransport::open()
// -----------------------
// Phases:
//   1) validate baud against the table,
//   2) open the device node,
//   3) apply raw 8N1 mode; undo the open if that fails.
// ---------------------------------------------------------------------------
std::unique_ptr<SerialTransport> SerialTransport::open(const std::string& dev, int baud, std::string& err) {
    speed_t sp{};
    if (!baud_to_speed(baud, sp)) {
        err = "bad_baud baud=" + std::to_string(baud);
        return nullptr;
    }

    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (fd < 0) {
        err = "open_failed dev=" + dev + " detail=\"" + std::strerror(errno) + "\"";
        return nullptr;
    }

    if (!set_raw(fd, sp)) {
        err = "open_failed dev=" + dev + " detail=\"" + std::strerror(errno) + "\"";
        ::close(fd);
        return nullptr;
    }

    return std::unique_ptr<SerialTransport>(new SerialTransport(fd, dev, baud));
}


bool SerialTransport::write(const uint8_t* data, std::size_t len, std::size_t& written) {
    written = 0;
    if (fd_ < 0) { last_error_ = "closed"; return false; }

    ssize_t w = ::write(fd_, data, len);
    if (w < 0) {
        last_error_ = std::strerror(errno);
        return false;
    }
    written = static_cast<std::size_t>(w);
    return true;
}


// Close the fd if still open. Later calls are no-ops.
bool SerialTransport::close() {
    if (fd_ < 0) return true;
    int rc = ::close(fd_);
    fd_ = -1;
    if (rc != 0) { last_error_ = std::strerror(errno); return false; }
    return true;
}


std::string SerialTransport::describe() const {
    return "dev=" + dev_path_ + " baud=" + std::to_string(baud_);
}

} // namespace ninotnc::transport
