// ============================================================================
// tcp_transport.cpp — implementation for transport_tcp.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file tcp_transport.cpp
 */

#include "ninotnc/transport/transport_tcp.hpp"

#include <sys/types.h>
#include <sys/socket.h>    // socket, connect, send
#include <netdb.h>         // getaddrinfo, gai_strerror
#include <unistd.h>        // ::close
#include <cerrno>
#include <cstring>         // strerror

namespace ninotnc::transport {

// ---------------------------------------------------------------------------
// TcpTransport::open()
// --------------------
// Resolve host:port and walk the address list until one connect() succeeds.
// The errno of the last failed attempt is reported, which is the one a user
// can act on (ECONNREFUSED, EHOSTUNREACH, ...).
// ---------------------------------------------------------------------------
std::unique_ptr<TcpTransport> TcpTransport::open(const std::string& host, uint16_t port, std::string& err) {
    const std::string addr = host + ":" + std::to_string(port);

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;     // IPv4 or IPv6
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    int gai = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (gai != 0) {
        err = "connect_failed addr=" + addr + " detail=\"" + ::gai_strerror(gai) + "\"";
        return nullptr;
    }

    int fd = -1;
    int last_errno = 0;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) { last_errno = errno; continue; }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;  // connected

        last_errno = errno;
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        err = "connect_failed addr=" + addr + " detail=\"" + std::strerror(last_errno) + "\"";
        return nullptr;
    }

    return std::unique_ptr<TcpTransport>(new TcpTransport(fd, host, port));
}


bool TcpTransport::write(const uint8_t* data, std::size_t len, std::size_t& written) {
    written = 0;
    if (fd_ < 0) { last_error_ = "closed"; return false; }

    ssize_t w = ::send(fd_, data, len, MSG_NOSIGNAL);
    if (w < 0) {
        last_error_ = std::strerror(errno);
        return false;
    }
    written = static_cast<std::size_t>(w);
    return true;
}


bool TcpTransport::close() {
    if (fd_ < 0) return true;
    int rc = ::close(fd_);
    fd_ = -1;
    if (rc != 0) { last_error_ = std::strerror(errno); return false; }
    return true;
}


std::string TcpTransport::describe() const {
    return "addr=" + host_ + ":" + std::to_string(port_);
}

} // namespace ninotnc::transport
