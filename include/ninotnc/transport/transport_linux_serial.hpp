#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty transport (termios raw 8N1, blocking writes).
 *
 * Depends on: unistd.h, fcntl.h, termios.h (in serial_transport.cpp).
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "ninotnc/transport/transport_base.hpp"

#include <memory>
#include <string>

namespace ninotnc::transport {

/**
 * @brief Serial variant of ITransport.
 *
 * open() acquires the TTY and puts it in raw mode:
 *   - O_RDWR | O_NOCTTY (never becomes our controlling terminal).
 *   - cfmakeraw: 8 data bits, no parity, no echo, no line processing.
 *   - One stop bit, no RTS/CTS, CLOCAL | CREAD.
 *   - Baud from a fixed table (9600..230400). Anything else is refused.
 *
 * The descriptor stays blocking so a single write(2) returns only after the
 * driver took what it could.
 */
class SerialTransport : public ITransport {
public:
  ~SerialTransport() override { close(); }

  /**
   * @brief Open @p dev at @p baud.
   * @param err  Set to a stable reason ("open_failed", "bad_baud") plus errno detail on failure.
   * @return Open transport, or nullptr.
   */
  static std::unique_ptr<SerialTransport> open(const std::string& dev, int baud, std::string& err);

  bool        write(const uint8_t* data, std::size_t len, std::size_t& written) override;
  bool        close() override;
  const char* name() const override { return "serial"; }
  std::string describe() const override;
  std::string last_error() const override { return last_error_; }

  int baud() const { return baud_; }
  const std::string& device() const { return dev_path_; }

private:
  SerialTransport(int fd, std::string dev_path, int baud)
  : fd_(fd), dev_path_(std::move(dev_path)), baud_(baud) {}

  int fd_{-1};
  std::string dev_path_;
  int baud_{0};
  std::string last_error_;
};

} // namespace ninotnc::transport
