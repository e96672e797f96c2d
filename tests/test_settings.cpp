#include <doctest/doctest.h>
#include "ninotnc/settings.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace ninotnc;
namespace fs = std::filesystem;

namespace {

// Scratch config file removed at scope exit.
struct TempConfig {
    fs::path path;
    explicit TempConfig(const std::string& body) {
        path = fs::temp_directory_path() / ("ninotnc-settings-" + std::to_string(::getpid()) + ".json");
        std::ofstream out(path, std::ios::trunc);
        out << body;
    }
    ~TempConfig() {
        std::error_code ec;
        fs::remove(path, ec);
    }
};

} // namespace

TEST_CASE("defaults match the CLI documentation") {
    Settings s;
    CHECK(s.connection == "serial");
    CHECK(s.host == "127.0.0.1");
    CHECK(s.port == 5001);
    CHECK(s.serial_port == "/dev/ttyACM0");
}

TEST_CASE("missing file leaves defaults and succeeds") {
    Settings s;
    std::string err;
    CHECK(load_settings("/nonexistent/ninotnc/config.json", s, err));
    CHECK(err.empty());
    CHECK(s.port == 5001);

    CHECK(load_settings(fs::path{}, s, err));
}

TEST_CASE("file values layer over defaults, unknown keys ignored") {
    TempConfig cfg(R"({"connection":"tcp","host":"10.1.2.3","port":8001,"mode":7})");
    Settings s;
    std::string err;

    REQUIRE(load_settings(cfg.path, s, err));
    CHECK(s.connection == "tcp");
    CHECK(s.host == "10.1.2.3");
    CHECK(s.port == 8001);
    CHECK(s.serial_port == "/dev/ttyACM0");   // untouched
}

TEST_CASE("malformed JSON is a bad_config error") {
    TempConfig cfg("{ \"host\": ");
    Settings s;
    std::string err;

    CHECK_FALSE(load_settings(cfg.path, s, err));
    CHECK(err.rfind("bad_config path=", 0) == 0);
    CHECK(s.host == "127.0.0.1");
}

TEST_CASE("wrong value type is rejected without partial updates") {
    TempConfig cfg(R"({"host":"10.0.0.9","port":"5001"})");
    Settings s;
    std::string err;

    CHECK_FALSE(load_settings(cfg.path, s, err));
    CHECK(err.find("wrong type for port") != std::string::npos);
    CHECK(s.host == "127.0.0.1");
}

TEST_CASE("non-object document is rejected") {
    TempConfig cfg("[1,2,3]");
    Settings s;
    std::string err;
    CHECK_FALSE(load_settings(cfg.path, s, err));
    CHECK(err.find("not an object") != std::string::npos);
}

TEST_CASE("default_config_path honors XDG_CONFIG_HOME") {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = old ? old : "";

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    CHECK(default_config_path() == fs::path("/tmp/xdg-test/ninotnc-setmode/config.json"));

    if (old) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else     ::unsetenv("XDG_CONFIG_HOME");
}

TEST_CASE("port outside 1..65535 is rejected instead of wrapping") {
    Settings s;
    std::string err;

    {
        TempConfig cfg(R"({"port":4294972297})");   // 2^32 + 5001
        CHECK_FALSE(load_settings(cfg.path, s, err));
        CHECK(err.find("wrong value for port") != std::string::npos);
    }
    {
        TempConfig cfg(R"({"port":65536})");
        CHECK_FALSE(load_settings(cfg.path, s, err));
    }
    {
        TempConfig cfg(R"({"port":-1})");
        CHECK_FALSE(load_settings(cfg.path, s, err));
    }
    {
        TempConfig cfg(R"({"port":0})");
        CHECK_FALSE(load_settings(cfg.path, s, err));
    }
    CHECK(s.port == 5001);

    TempConfig cfg(R"({"port":65535})");
    REQUIRE(load_settings(cfg.path, s, err));
    CHECK(s.port == 65535);
}
