#pragma once
/**
 * @file mode_table.hpp
 * @brief The NinoTNC's documented modem modes, for help text and log lines.
 *
 * The firmware owns the real meaning of a mode number; this table only mirrors
 * the published DIP-switch chart (firmware v41+). Unlisted numbers are still
 * sent, the CLI just warns about them.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace ninotnc {

/// One row of the mode chart.
struct ModeInfo {
    int         mode;
    const char* dip;          ///< switch pattern, MSB first ("0011")
    int         baud;         ///< symbol rate
    int         bps;          ///< bit rate
    const char* modulation;   ///< "4FSK", "BPSK", ...
    const char* protocol;     ///< "IL2Pc", "AX.25", ...
    const char* usage;        ///< "FM", "SSB", "SSB/FM"
    const char* bandwidth;    ///< "25k", "500Hz", ...
    bool        legacy;
    const char* superseded_by; ///< legacy modes only, else ""
};

/// All rows, modern modes first, both groups in chart order.
const std::vector<ModeInfo>& modes();

/// Row for @p mode, or nullptr if the chart does not list it.
const ModeInfo* find_mode(int mode);

/// "9600 4FSK IL2Pc FM 12.5k" (bps, modulation, protocol, usage, bandwidth), or "unlisted".
std::string describe_mode(int mode);

/// Both chart tables as printed in --help.
std::string format_mode_table();

} // namespace ninotnc
