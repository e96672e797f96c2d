#pragma once

/**
 * @page nt-kiss KISS Framing
 * @file kiss.hpp
 * @brief Tiny KISS frame encoder for sending command frames to a TNC over a byte stream.
 *
 * @details
 * OVERVIEW
 * --------
 * KISS wraps a command byte and an arbitrary payload between FEND sentinels and
 * escapes any sentinel collisions inside the payload. It is the same byte-stuffing
 * that SLIP uses, plus one command byte right after the opening FEND that tells
 * the TNC what to do with the payload.
 *
 * HOW KISS FRAMES LOOK
 * --------------------
 * Special byte values:
 *   FEND   (0xC0) marks frame boundaries.
 *   FESC   (0xDB) introduces an escaped code.
 *   TFEND  (0xDC) stands in for FEND inside payloads.
 *   TFESC  (0xDD) stands in for FESC inside payloads.
 *
 * Encoding rules:
 *   - A frame begins with FEND, then the command byte.
 *   - Inside the payload, any literal FEND is replaced by FESC, TFEND.
 *   - Any literal FESC is replaced by FESC, TFESC.
 *   - All other bytes are copied through unchanged.
 *   - The frame closes with FEND.
 *
 * The command byte itself is not escaped. Command codes are small (port nibble 0,
 * command nibble 0..6) so they never collide with FEND or FESC.
 *
 * EXAMPLES
 * --------
 * @code
 *   // NinoTNC "set mode 3, volatile": payload is 3 + 16
 *   std::vector<uint8_t> frame = ninotnc::kiss::build_frame(ninotnc::kiss::CMD_SET_HARDWARE, {0x13});
 *   // frame == C0 06 13 C0
 * @endcode
 *
 * @code
 *   std::vector<uint8_t> frame = ninotnc::kiss::build_frame(0x06, {0xC0});
 *   // frame == C0 06 DB DC C0
 * @endcode
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Encoding only. This tool never reads frames back from the TNC.
 * - KISS provides framing only. No checksum, no acknowledgement.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ninotnc {
namespace kiss {

/**
 * @name KISS sentinel and escape codes
 * @{
 */

/// Frame boundary marker byte (0xC0).
static constexpr uint8_t FEND = 0xC0;

/// Escape introducer byte (0xDB).
static constexpr uint8_t FESC = 0xDB;

/// Escaped representation of a literal FEND within payload (wire: FESC, TFEND).
static constexpr uint8_t TFEND = 0xDC;

/// Escaped representation of a literal FESC within payload (wire: FESC, TFESC).
static constexpr uint8_t TFESC = 0xDD;
/** @} */

/**
 * @name KISS command codes (port 0)
 * @{
 */
static constexpr uint8_t CMD_DATA         = 0x00;
static constexpr uint8_t CMD_SET_HARDWARE = 0x06;  // NinoTNC uses this as "set mode"
/** @} */

/**
 * @brief Byte-stuff a payload and append the result to @p out.
 *
 * Every FEND becomes FESC, TFEND; every FESC becomes FESC, TFESC; all other bytes
 * pass through unchanged and in order. @p out is not cleared, so the caller can
 * append into a frame under construction.
 *
 * @param in  Pointer to the first payload byte (may be null when @p n is 0).
 * @param n   Number of payload bytes.
 * @param out Destination vector; escaped bytes are appended.
 */
inline void escape(const uint8_t* in, std::size_t n, std::vector<uint8_t>& out) {
    for (std::size_t i = 0; i < n; ++i) {
        uint8_t b = in[i];

        if (b == FEND) {                // cannot place raw FEND in payload
            out.push_back(FESC);
            out.push_back(TFEND);
        } else if (b == FESC) {         // cannot place raw FESC in payload
            out.push_back(FESC);
            out.push_back(TFESC);
        } else {
            out.push_back(b);
        }
    }
}

/// Convenience form of escape() returning a fresh vector.
inline std::vector<uint8_t> escape(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out;
    out.reserve(payload.size() * 2);
    escape(payload.data(), payload.size(), out);
    return out;
}

/**
 * @brief Encode one KISS frame: FEND, command, escaped payload, FEND.
 *
 * @param command  KISS command byte, written verbatim.
 * @param in       Pointer to the first payload byte (may be null when @p n is 0).
 * @param n        Number of payload bytes.
 * @param out      Destination vector. Cleared first.
 *
 * @note Reserves worst case capacity (2*n + 3) so escaping never reallocates.
 */
inline void encode(uint8_t command, const uint8_t* in, std::size_t n, std::vector<uint8_t>& out) {
    out.clear();
    out.reserve(n * 2 + 3);   // every byte escaped, plus FEND, command, FEND

    out.push_back(FEND);      // start-of-frame sentinel
    out.push_back(command);
    escape(in, n, out);
    out.push_back(FEND);      // end-of-frame sentinel
}

/// Build a complete frame for @p command carrying @p payload.
inline std::vector<uint8_t> build_frame(uint8_t command, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out;
    encode(command, payload.data(), payload.size(), out);
    return out;
}

/**
 * @brief Render bytes as space separated upper-case hex ("C0 06 13 C0").
 *
 * Used for --print output and diagnostics.
 */
inline std::string to_hex(const std::vector<uint8_t>& bytes) {
    static const char* DIGITS = "0123456789ABCDEF";
    std::string s;
    s.reserve(bytes.size() * 3);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i) s.push_back(' ');
        s.push_back(DIGITS[bytes[i] >> 4]);
        s.push_back(DIGITS[bytes[i] & 0x0F]);
    }
    return s;
}

} // namespace kiss
} // namespace ninotnc
