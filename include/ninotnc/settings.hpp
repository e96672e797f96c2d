#pragma once
/**
 * @file settings.hpp
 * @brief Connection defaults, optionally overridden by a JSON config file.
 *
 * Precedence, lowest first:
 *   1) built-in defaults (below),
 *   2) config file (default: $XDG_CONFIG_HOME/ninotnc-setmode/config.json),
 *   3) explicit CLI flags (applied by main.cpp).
 *
 * File format (all keys optional, unknown keys ignored):
 * @code
 *   {
 *     "connection":  "tcp",
 *     "host":        "192.168.1.20",
 *     "port":        5001,
 *     "serial_port": "/dev/serial/by-id/usb-..."
 *   }
 * @endcode
 *
 * Mode and --write are deliberately not read from the file: a stored mode would
 * silently reconfigure a radio on every run.
 */

#include <filesystem>
#include <string>

namespace ninotnc {

struct Settings {
    std::string connection{"serial"};
    std::string host{"127.0.0.1"};
    int         port{5001};
    std::string serial_port{"/dev/ttyACM0"};
};

/// $XDG_CONFIG_HOME/ninotnc-setmode/config.json, else $HOME/.config/...; empty if neither is set.
std::filesystem::path default_config_path();

/**
 * @brief Layer the file at @p path over @p io.
 *
 * A missing file leaves @p io untouched and succeeds. An unreadable file,
 * malformed JSON, a non-object document or a key of the wrong type fails with
 * @p err = "bad_config path=... detail=..." and leaves @p io untouched.
 */
bool load_settings(const std::filesystem::path& path, Settings& io, std::string& err);

} // namespace ninotnc
