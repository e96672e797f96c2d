#pragma once
/**
 * @file transport_tcp.hpp
 * @brief KISS-over-TCP transport (POSIX sockets, write-only).
 *
 * Typical peers: a TNC network bridge or a soundmodem/Dire Wolf style KISS port.
 */

#include "ninotnc/transport/transport_base.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace ninotnc::transport {

/**
 * @brief TCP variant of ITransport.
 *
 * open() resolves host:port with getaddrinfo (numeric addresses and DNS names,
 * IPv4 or IPv6) and connects to the first address that accepts. write() is a
 * single send(2) with MSG_NOSIGNAL, so a peer that hung up is reported as an
 * error instead of killing the process with SIGPIPE.
 */
class TcpTransport : public ITransport {
public:
  ~TcpTransport() override { close(); }

  /**
   * @brief Connect to @p host : @p port.
   * @param err  Set to "resolve_failed" or "connect_failed" plus detail on failure.
   * @return Connected transport, or nullptr.
   */
  static std::unique_ptr<TcpTransport> open(const std::string& host, uint16_t port, std::string& err);

  bool        write(const uint8_t* data, std::size_t len, std::size_t& written) override;
  bool        close() override;
  const char* name() const override { return "tcp"; }
  std::string describe() const override;
  std::string last_error() const override { return last_error_; }

private:
  TcpTransport(int fd, std::string host, uint16_t port)
  : fd_(fd), host_(std::move(host)), port_(port) {}

  int fd_{-1};
  std::string host_;
  uint16_t port_{0};
  std::string last_error_;
};

} // namespace ninotnc::transport
