#pragma once
/**
 * @page nt-set-mode NinoTNC Set-Mode Orchestrator
 * @file set_mode.hpp
 * @brief Turns a resolved request into exactly one KISS "set mode" frame on the wire.
 *
 * @details
 * PURPOSE
 * -------
 * This is the glue between the CLI and the two lower layers:
 *   - kiss.hpp builds the frame,
 *   - transport/ moves the bytes.
 * main.cpp never touches frames or sockets directly; it fills a SetModeRequest
 * and hands it to send_set_mode().
 *
 * PROCESS FLOW
 * ------------
 * 1. check_request(): reject zero mode, missing serial path, missing host, bad port.
 * 2. mode_wire_byte(): mode as-is when persisting, mode + 16 for a volatile change.
 * 3. make_set_mode_frame(): C0 06 <escaped byte> C0.
 * 4. opener(request): TCP to host:port, or serial at 57600 baud.
 * 5. One write. Short or failed writes are transmission errors, never retried.
 * 6. Log what was sent, sleep SETTLE_DELAY so the TNC can act, close.
 *
 * The transport sits in a TransportGuard from the moment it is opened, so it is
 * closed once whichever way the sequence ends.
 *
 * DEVICE CONVENTIONS
 * ------------------
 * - Command 0x06 is the NinoTNC mode command.
 * - Values 0..15 select and store the mode in flash; adding 16 selects the same
 *   mode until the next power cycle.
 * - Mode commands are only honored on the USB serial port at 57600 baud,
 *   independent of the on-air data rate.
 * - The TNC must have all mode DIP switches ON (1111) and firmware v41 or later.
 *
 * EXAMPLE
 * -------
 * @code
 *   ninotnc::SetModeRequest req;
 *   req.mode = 3;
 *   req.kind = ninotnc::TransportKind::Serial;
 *   req.serial_device = "/dev/ttyACM0";
 *
 *   ninotnc::Outcome out = ninotnc::send_set_mode(req, ninotnc::open_transport, std::cout);
 *   if (!out.ok()) {
 *       std::cerr << "status=error kind=" << ninotnc::to_string(out.kind)
 *                 << " reason=" << out.reason << "\n";
 *   }
 * @endcode
 *
 * @note Errors are surfaced with stable strings like "missing_mode" or
 *       "short_write" so scripts can act on them.
 */

#include "ninotnc/transport/transport_base.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace ninotnc {

/// KISS command byte the NinoTNC interprets as "set mode".
static constexpr uint8_t CMD_SET_MODE = 0x06;

/// Offset added to a mode to apply it only until the next power cycle.
static constexpr int VOLATILE_MODE_OFFSET = 16;

/// Baud rate the TNC accepts configuration commands at.
static constexpr int SERIAL_CONFIG_BAUD = 57600;

/// Time the TNC needs to act on the command before the link is torn down.
static constexpr std::chrono::milliseconds SETTLE_DELAY{500};

/// Closed set of link kinds.
enum class TransportKind : uint8_t { Tcp, Serial };

/// What went wrong, if anything. Maps 1:1 to CLI exit codes.
enum class ErrorKind : uint8_t { None = 0, Configuration, Connection, Transmission };

/**
 * @struct SetModeRequest
 * @brief Fully resolved inputs for one set-mode run. Defaults match the CLI.
 */
struct SetModeRequest {
    int           mode{0};                       ///< 0 means "not supplied" and is rejected
    bool          persist{false};                ///< true: store in flash (no +16 offset)
    TransportKind kind{TransportKind::Serial};
    std::string   host{"127.0.0.1"};             ///< tcp only
    int           port{5001};                    ///< tcp only
    std::string   serial_device{"/dev/ttyACM0"}; ///< serial only
};

/**
 * @struct Outcome
 * @brief Result of send_set_mode().
 *
 * @c reason is a stable token ("connect_failed", "short_write", ...) optionally
 * followed by key=value detail. @c frame and @c mode_byte are filled as soon as
 * they are computed, so failed runs still show what would have been sent.
 */
struct Outcome {
    ErrorKind            kind{ErrorKind::None};
    std::string          reason;
    std::vector<uint8_t> frame;
    uint8_t              mode_byte{0};

    bool ok() const { return kind == ErrorKind::None; }
};

/// Opens the transport for a request; returns nullptr and fills @p err on failure.
using TransportOpener =
    std::function<std::unique_ptr<transport::ITransport>(const SetModeRequest&, std::string& err)>;

/// "configuration" | "connection" | "transmission" | "none"
const char* to_string(ErrorKind kind);

/// "tcp" | "serial"
const char* to_string(TransportKind kind);

/**
 * @brief Parse a connection name, case-insensitive.
 * @return false for anything other than "tcp" or "serial".
 */
bool parse_transport_kind(const std::string& text, TransportKind& out);

/**
 * @brief On-wire mode byte: @p mode when persisting, @p mode + 16 otherwise.
 *
 * Range is the caller's concern: @p mode must leave the result within 0..255.
 */
uint8_t mode_wire_byte(int mode, bool persist);

/// KISS frame for the set-mode command carrying mode_wire_byte(mode, persist).
std::vector<uint8_t> make_set_mode_frame(int mode, bool persist);

/**
 * @brief Keep the wire byte inside one octet.
 *
 * Accepts 1..255 when persisting and 1..239 otherwise (so mode + 16 <= 255).
 * Fails with @p err = "bad_mode mode=N range=1..MAX".
 */
bool check_mode_range(int mode, bool persist, std::string& err);

/// Process exit status for an outcome: 0 ok, 1 connection, 2 configuration, 3 transmission.
int exit_code_for(ErrorKind kind);

/**
 * @brief Configuration checks done before any I/O.
 *
 * Fails with @p err set to one of:
 *   - "missing_mode"          mode is zero
 *   - "missing_serial_port"   serial link without a device path
 *   - "missing_host"          tcp link without a host
 *   - "bad_port"              tcp port outside 1..65535
 */
bool check_request(const SetModeRequest& req, std::string& err);

/**
 * @brief Default opener: TcpTransport for Tcp, SerialTransport at
 *        SERIAL_CONFIG_BAUD for Serial.
 */
std::unique_ptr<transport::ITransport> open_transport(const SetModeRequest& req, std::string& err);

/**
 * @brief Run the full sequence once. See the page comment for the steps.
 *
 * @param req     Resolved request.
 * @param opener  Transport factory (open_transport in production, fakes in tests).
 * @param log     Receives "status=open ..." and "status=ok ..." lines.
 */
Outcome send_set_mode(const SetModeRequest& req, const TransportOpener& opener, std::ostream& log);

} // namespace ninotnc
