// ============================================================================
// settings.cpp — implementation for settings.hpp
// ============================================================================

#include "ninotnc/settings.hpp"

#include <cstdint>
#include <cstdlib>            // getenv for XDG/HOME lookups
#include <fstream>
#include <system_error>       // std::error_code for non-throwing filesystem ops

#include "nlohmann/json.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ninotnc {

fs::path default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return fs::path(xdg) / "ninotnc-setmode" / "config.json";

    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home) / ".config" / "ninotnc-setmode" / "config.json";

    return {};
}

// Copy a string key into @p dst if present; false if present with another type.
static bool take_string(const json& j, const char* key, std::string& dst, std::string& bad_key) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) { bad_key = key; return false; }
    dst = it->get<std::string>();
    return true;
}

bool load_settings(const fs::path& path, Settings& io, std::string& err) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) return true;   // nothing to layer

    const std::string where = "bad_config path=" + path.string();

    std::ifstream in(path);
    if (!in) { err = where + " detail=\"unreadable\""; return false; }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        err = where + " detail=\"" + e.what() + "\"";
        return false;
    }
    if (!j.is_object()) { err = where + " detail=\"not an object\""; return false; }

    // Stage into a copy so a bad key leaves the caller's settings untouched.
    Settings s = io;
    std::string bad_key;
    bool ok = take_string(j, "connection",  s.connection,  bad_key)
           && take_string(j, "host",        s.host,        bad_key)
           && take_string(j, "serial_port", s.serial_port, bad_key);

    if (ok) {
        auto it = j.find("port");
        if (it != j.end()) {
            if (!it->is_number_integer()) { bad_key = "port"; ok = false; }
        }
    }

    if (!ok) {
        err = where + " detail=\"wrong type for " + bad_key + "\"";
        return false;
    }

    // Range-check before narrowing; get<int>() would wrap 2^32 + 5001 to 5001.
    auto it = j.find("port");
    if (it != j.end()) {
        const bool in_range = it->is_number_unsigned()
            ? it->get<uint64_t>() >= 1 && it->get<uint64_t>() <= 65535
            : it->get<int64_t>()  >= 1 && it->get<int64_t>()  <= 65535;
        if (!in_range) {
            err = where + " detail=\"wrong value for port\"";
            return false;
        }
        s.port = static_cast<int>(it->get<int64_t>());
    }

    io = s;
    return true;
}

} // namespace ninotnc
