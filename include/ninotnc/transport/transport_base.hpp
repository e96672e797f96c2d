#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal write-only transport interface used to push one frame at a TNC.
 *
 * Header-only on purpose. Concrete variants live next to this file:
 *   - transport_tcp.hpp           (KISS-over-TCP, e.g. a TNC bridge on port 5001)
 *   - transport_linux_serial.hpp  (USB CDC / tty, termios raw 8N1)
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace ninotnc::transport {

/**
 * @brief Transport trait the set-mode orchestrator relies on.
 *
 * Contract:
 *  - An instance only exists once its channel is open (variants expose a static
 *    open() that returns nullptr on failure).
 *  - write(data,len,written) pushes bytes; returns false on a hard error.
 *    @p written always holds what the OS accepted, so a short write is visible.
 *  - close() releases the handle. Safe to call more than once; later calls are no-ops.
 *  - name() is a short tag for logs ("tcp", "serial").
 *  - describe() is the endpoint in key=value form for logs.
 *  - last_error() is the errno text of the most recent failure, or empty.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        write(const uint8_t* data, std::size_t len, std::size_t& written) = 0;
  virtual bool        close() = 0;
  virtual const char* name() const = 0;
  virtual std::string describe() const = 0;
  virtual std::string last_error() const = 0;
};

/**
 * @brief Scoped owner that closes a transport exactly once.
 *
 * The guard closes in its destructor unless release() already did. Every exit
 * path of the caller (early return on write failure included) thus releases the
 * channel once.
 */
class TransportGuard {
public:
  explicit TransportGuard(std::unique_ptr<ITransport> t) : t_(std::move(t)) {}
  ~TransportGuard() { release(); }

  TransportGuard(const TransportGuard&) = delete;
  TransportGuard& operator=(const TransportGuard&) = delete;

  ITransport* get() const { return t_.get(); }
  ITransport* operator->() const { return t_.get(); }
  explicit operator bool() const { return t_ != nullptr; }

  /// Close now. Returns the close() result, or true if nothing was held.
  /// On failure the transport's last_error() is kept in close_error().
  bool release() {
    if (!t_) return true;
    bool ok = t_->close();
    if (!ok) close_error_ = t_->last_error();
    t_.reset();
    return ok;
  }

  const std::string& close_error() const { return close_error_; }

private:
  std::unique_ptr<ITransport> t_;
  std::string close_error_;
};

} // namespace ninotnc::transport
