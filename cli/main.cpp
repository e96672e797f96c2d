/**
 * @file main.cpp
 * @brief ninotnc-setmode CLI — one-shot runner around ninotnc::send_set_mode().
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); no arguments prints help (with the mode chart) and exits 0.
 *  - Layer connection defaults: built-ins < config.json < explicit flags.
 *  - Validate mode range and connection kind before any I/O.
 *  - Build a SetModeRequest and hand it to the orchestrator.
 *  - Map the outcome to an exit code.
 *
 * Exit codes:
 *   0 ok, 1 connection error, 2 configuration error, 3 transmission error.
 */

#include <iostream>
#include <string>

#include "CLI/CLI11.hpp"

#include "ninotnc/kiss.hpp"
#include "ninotnc/mode_table.hpp"
#include "ninotnc/set_mode.hpp"
#include "ninotnc/settings.hpp"

using namespace ninotnc;

static int fail(ErrorKind kind, const std::string& reason) {
  std::cerr << "status=error kind=" << to_string(kind) << " reason=" << reason << "\n";
  return exit_code_for(kind);
}

static std::string help_footer() {
  std::string s;
  s += "\n";
  s += format_mode_table();
  s += "\nBefore running this utility ensure the mode DIP switches are all set to ON (1111)"
       " and the firmware is at least v41.\n";
  s += "\nExample, set mode to 3 without permanently storing to memory:\n\n";
  s += "  ninotnc-setmode --mode 3\n";
  s += "\nMore info at https://wiki.oarc.uk/packet:ninotnc\n";
  return s;
}

int main(int argc, char** argv) {
  Settings settings;              // built-in defaults
  std::string opt_connection;
  std::string opt_host;
  int         opt_port = 0;
  std::string opt_serial;
  std::string opt_config;
  int  mode = 0;                  // 0 => not supplied
  bool persist = false;
  bool print = false;

  CLI::App app{"Set the operating mode of a NinoTNC over serial or KISS-over-TCP"};
  app.footer(help_footer());

  CLI::Option* o_conn   = app.add_option("--connection", opt_connection,
                                         "Connection type: tcp or serial (default \"serial\")");
  CLI::Option* o_host   = app.add_option("--host", opt_host,
                                         "TCP host, if connection is tcp (default \"127.0.0.1\")");
  CLI::Option* o_port   = app.add_option("--port", opt_port,
                                         "TCP port, if connection is tcp (default 5001)");
  CLI::Option* o_serial = app.add_option("--serial-port", opt_serial,
                                         "Serial port, if connection is serial (default \"/dev/ttyACM0\")");
  app.add_option("-m,--mode", mode, "Mode value to set (required)");
  app.add_flag("-w,--write", persist,
               "Permanently store the mode (does not add 16 to the provided mode)");
  app.add_option("--config", opt_config,
                 "JSON file with connection defaults (default $XDG_CONFIG_HOME/ninotnc-setmode/config.json)");
  app.add_flag("--print", print, "Print the KISS frame in hex before sending");

  if (argc == 1) {
    std::cerr << app.help();
    return 0;
  }

  CLI11_PARSE(app, argc, argv);

  // -------- settings: defaults < file < flags --------
  std::string err;
  const auto cfg_path = opt_config.empty() ? default_config_path()
                                           : std::filesystem::path(opt_config);
  if (!load_settings(cfg_path, settings, err)) return fail(ErrorKind::Configuration, err);

  if (o_conn->count())   settings.connection  = opt_connection;
  if (o_host->count())   settings.host        = opt_host;
  if (o_port->count())   settings.port        = opt_port;
  if (o_serial->count()) settings.serial_port = opt_serial;

  // -------- validate --------
  if (mode == 0) return fail(ErrorKind::Configuration, "missing_mode");

  if (!check_mode_range(mode, persist, err)) return fail(ErrorKind::Configuration, err);

  SetModeRequest req;
  if (!parse_transport_kind(settings.connection, req.kind)) {
    return fail(ErrorKind::Configuration, "unknown_connection connection=" + settings.connection);
  }
  req.mode          = mode;
  req.persist       = persist;
  req.host          = settings.host;
  req.port          = settings.port;
  req.serial_device = settings.serial_port;

  if (!check_request(req, err)) return fail(ErrorKind::Configuration, err);

  if (!find_mode(mode)) {
    std::cerr << "status=warn reason=unlisted_mode mode=" << mode << "\n";
  }
  if (print) {
    std::cout << "frame=" << kiss::to_hex(make_set_mode_frame(mode, persist))
              << " mode=" << mode << " desc=\"" << describe_mode(mode) << "\"\n";
  }

  // -------- send --------
  Outcome out = send_set_mode(req, open_transport, std::cout);
  if (!out.ok()) return fail(out.kind, out.reason);
  return 0;
}
