// ============================================================================
// mode_table.cpp — implementation for mode_table.hpp
// ============================================================================

#include "ninotnc/mode_table.hpp"

#include <iomanip>
#include <sstream>

namespace ninotnc {

const std::vector<ModeInfo>& modes() {
    static const std::vector<ModeInfo> table = {
        // mode dip     baud   bps    mod     proto    usage     bw       legacy superseded_by
        {  1, "0001", 19200, 19200, "4FSK", "IL2Pc", "FM",     "25k",   false, "" },
        {  3, "0011",  9600,  9600, "4FSK", "IL2Pc", "FM",     "12.5k", false, "" },
        {  2, "0010",  9600,  9600, "GFSK", "IL2Pc", "FM",     "25k",   false, "" },
        {  5, "0101",  3600,  3600, "QPSK", "IL2Pc", "FM",     "12.5k", false, "" },
        { 11, "1011",  1200,  2400, "QPSK", "IL2Pc", "SSB/FM", "2.4kHz",false, "" },
        { 10, "1010",  1200,  1200, "BPSK", "IL2Pc", "SSB/FM", "2.4kHz",false, "" },
        {  9, "1001",   300,   600, "QPSK", "IL2Pc", "SSB",    "500Hz", false, "" },
        {  8, "1000",   300,   300, "BPSK", "IL2Pc", "SSB",    "500Hz", false, "" },
        { 14, "1110",   300,   300, "AFSK", "IL2Pc", "SSB",    "500Hz", false, "" },

        {  0, "0000",  9600,  9600, "GFSK", "AX.25", "FM",     "25k",   true,  "9600 GFSK IL2P" },
        {  4, "0100",  4800,  4800, "GFSK", "IL2Pc", "FM",     "12.5k", true,  "9600 4FSK IL2Pc" },
        {  7, "0111",  1200,  1200, "AFSK", "IL2P",  "FM",     "12.5k", true,  "4800 GFSK IL2Pc" },
        {  6, "0110",  1200,  1200, "AFSK", "AX.25", "FM",     "12.5k", true,  "1200 AFSK IL2P" },
        { 12, "1100",   300,   300, "AFSK", "AX.25", "SSB",    "500Hz", true,  "300 AFSK IL2P" },
        { 13, "1101",   300,   300, "AFSK", "IL2P",  "SSB",    "500Hz", true,  "300 AFSK IL2Pc" },
    };
    return table;
}

const ModeInfo* find_mode(int mode) {
    for (const auto& m : modes()) {
        if (m.mode == mode) return &m;
    }
    return nullptr;
}

std::string describe_mode(int mode) {
    const ModeInfo* m = find_mode(mode);
    if (!m) return "unlisted";

    std::ostringstream os;
    os << m->bps << " " << m->modulation << " " << m->protocol
       << " " << m->usage << " " << m->bandwidth;
    if (m->legacy) os << " (legacy)";
    return os.str();
}

std::string format_mode_table() {
    std::ostringstream os;
    os << std::left;

    os << "Modern Modes:\n";
    os << "  " << std::setw(8) << "Mode" << std::setw(7) << "DIP" << std::setw(7) << "Baud"
       << std::setw(6) << "bps" << std::setw(7) << "Mod" << std::setw(9) << "Proto"
       << std::setw(10) << "Usage" << "BW\n";
    for (const auto& m : modes()) {
        if (m.legacy) continue;
        os << "  " << std::setw(8) << m.mode << std::setw(7) << m.dip << std::setw(7) << m.baud
           << std::setw(6) << m.bps << std::setw(7) << m.modulation << std::setw(9) << m.protocol
           << std::setw(10) << m.usage << m.bandwidth << "\n";
    }

    os << "\nLegacy Modes:\n";
    os << "  " << std::setw(8) << "Mode" << std::setw(7) << "DIP" << std::setw(7) << "Baud"
       << std::setw(6) << "bps" << std::setw(7) << "Mod" << std::setw(9) << "Proto"
       << std::setw(21) << "Superseded by" << std::setw(7) << "Usage" << "BW\n";
    for (const auto& m : modes()) {
        if (!m.legacy) continue;
        os << "  " << std::setw(8) << m.mode << std::setw(7) << m.dip << std::setw(7) << m.baud
           << std::setw(6) << m.bps << std::setw(7) << m.modulation << std::setw(9) << m.protocol
           << std::setw(21) << m.superseded_by << std::setw(7) << m.usage << m.bandwidth << "\n";
    }
    return os.str();
}

} // namespace ninotnc
