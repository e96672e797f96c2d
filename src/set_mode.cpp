// -----------------------------------------------------------------------------
// Implementation for set_mode.hpp
//
// - See set_mode.hpp for the flow, device conventions and an example.
// - See tests/test_set_mode.cpp for runnable cases with a fake transport.
//
// Style: no exceptions. Every failure becomes an Outcome with a stable reason.
// -----------------------------------------------------------------------------

#include "ninotnc/set_mode.hpp"
#include "ninotnc/kiss.hpp"
#include "ninotnc/transport/transport_linux_serial.hpp"
#include "ninotnc/transport/transport_tcp.hpp"

#include <cctype>
#include <ostream>
#include <thread>

namespace ninotnc {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "none";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Connection:    return "connection";
        case ErrorKind::Transmission:  return "transmission";
    }
    return "unknown";
}

const char* to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::Tcp:    return "tcp";
        case TransportKind::Serial: return "serial";
    }
    return "unknown";
}

// Cast to unsigned char first so std::tolower is well-defined.
static std::string lower(std::string s) {
    for (auto& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

bool parse_transport_kind(const std::string& text, TransportKind& out) {
    const std::string name = lower(text);
    if (name == "tcp")    { out = TransportKind::Tcp;    return true; }
    if (name == "serial") { out = TransportKind::Serial; return true; }
    return false;
}

uint8_t mode_wire_byte(int mode, bool persist) {
    return static_cast<uint8_t>(persist ? mode : mode + VOLATILE_MODE_OFFSET);
}

std::vector<uint8_t> make_set_mode_frame(int mode, bool persist) {
    return kiss::build_frame(CMD_SET_MODE, {mode_wire_byte(mode, persist)});
}

bool check_mode_range(int mode, bool persist, std::string& err) {
    const int mode_max = persist ? 255 : 255 - VOLATILE_MODE_OFFSET;
    if (mode < 1 || mode > mode_max) {
        err = "bad_mode mode=" + std::to_string(mode) + " range=1.." + std::to_string(mode_max);
        return false;
    }
    return true;
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return 0;
        case ErrorKind::Connection:    return 1;
        case ErrorKind::Configuration: return 2;
        case ErrorKind::Transmission:  return 3;
    }
    return 1;
}

bool check_request(const SetModeRequest& req, std::string& err) {
    if (req.mode == 0) { err = "missing_mode"; return false; }

    switch (req.kind) {
        case TransportKind::Serial:
            if (req.serial_device.empty()) { err = "missing_serial_port"; return false; }
            return true;
        case TransportKind::Tcp:
            if (req.host.empty()) { err = "missing_host"; return false; }
            if (req.port < 1 || req.port > 65535) {
                err = "bad_port port=" + std::to_string(req.port);
                return false;
            }
            return true;
    }
    err = "unknown_connection";
    return false;
}

std::unique_ptr<transport::ITransport> open_transport(const SetModeRequest& req, std::string& err) {
    switch (req.kind) {
        case TransportKind::Tcp:
            return transport::TcpTransport::open(req.host, static_cast<uint16_t>(req.port), err);
        case TransportKind::Serial:
            return transport::SerialTransport::open(req.serial_device, SERIAL_CONFIG_BAUD, err);
    }
    err = "unknown_connection";
    return nullptr;
}

Outcome send_set_mode(const SetModeRequest& req, const TransportOpener& opener, std::ostream& log) {
    Outcome out;

    // 1) configuration, before any I/O
    std::string err;
    if (!check_request(req, err)) {
        out.kind   = ErrorKind::Configuration;
        out.reason = err;
        return out;
    }

    // 2) frame
    out.mode_byte = mode_wire_byte(req.mode, req.persist);
    out.frame     = make_set_mode_frame(req.mode, req.persist);

    // 3) transport
    transport::TransportGuard link(opener(req, err));
    if (!link) {
        out.kind   = ErrorKind::Connection;
        out.reason = err.empty() ? std::string("open_failed") : err;
        return out;
    }
    log << "status=open transport=" << link->name() << " " << link->describe() << "\n";

    // 4) one write, no retry
    std::size_t written = 0;
    if (!link->write(out.frame.data(), out.frame.size(), written)) {
        out.kind   = ErrorKind::Transmission;
        out.reason = "write_failed detail=\"" + link->last_error() + "\"";
        return out;   // guard closes
    }
    if (written != out.frame.size()) {
        out.kind   = ErrorKind::Transmission;
        out.reason = "short_write wrote=" + std::to_string(written) +
                     " len=" + std::to_string(out.frame.size());
        return out;
    }

    // 5) report
    log << "status=ok sent=" << static_cast<int>(out.mode_byte)
        << " mode=" << req.mode
        << " store=" << (req.persist ? "persist" : "volatile")
        << " offset=" << (req.persist ? 0 : VOLATILE_MODE_OFFSET) << "\n";
    log.flush();

    // 6) let the TNC act before the link drops. Failure paths above return
    //    without settling: a missing or partial frame is not a command to act on.
    std::this_thread::sleep_for(SETTLE_DELAY);

    // frame is already out; a failing close only merits a warning
    if (!link.release()) {
        log << "status=warn reason=close_failed detail=\"" << link.close_error() << "\"\n";
    }
    return out;
}

} // namespace ninotnc
