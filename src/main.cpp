/**
 * @file main.cpp
 * @brief lmreadout CLI, continuous level-meter acquisition from a Linux host.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) on top of defaults and an optional JSON config.
 *  - Resolve the serial port (explicit --port, or discovery by adapter name).
 *  - Open the port, run the board setup handshake, wire sampler -> scheduler -> sinks.
 *  - Run until Ctrl+C (or --cycles), then close the port if asked to.
 *
 * Exit codes:
 *  0 normal stop, 1 connection error, 2 configuration error, 3 board setup failure.
 */

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"

#include "lmreadout/board_setup.hpp"
#include "lmreadout/cancel.hpp"
#include "lmreadout/clock.hpp"
#include "lmreadout/codec.hpp"
#include "lmreadout/config.hpp"
#include "lmreadout/log.hpp"
#include "lmreadout/sampler.hpp"
#include "lmreadout/scheduler.hpp"
#include "lmreadout/sinks.hpp"
#include "lmreadout/transport/transport_linux_serial.hpp"
#include "port_registry.hpp"

using namespace lmreadout;

static constexpr int EXIT_CONNECTION = 1;
static constexpr int EXIT_CONFIG     = 2;
static constexpr int EXIT_SETUP      = 3;

static int fail(int code, const std::string& fields) {
    std::cerr << "status=error " << fields << "\n";
    return code;
}

int main(int argc, char** argv) {
    CLI::App app{"Continuous capacitance acquisition from the level-meter readout board.\n"
                 "Press Ctrl+C to stop."};

    // ---- source of settings ----
    std::string config_path;
    std::string board_name;
    app.add_option("--config", config_path, "JSON configuration file")->check(CLI::ExistingFile);
    app.add_option("--board", board_name, "Board: readout|uti")->check(CLI::IsMember({"readout", "uti"}));

    // ---- port ----
    std::string port, find_name, parity;
    int baud = 0, stop_bits = 0, timeout_ms = 0;
    bool list = false;
    app.add_option("--port", port, "Serial device (e.g. /dev/serial/by-id/...)");
    app.add_option("--find-port", find_name, "Find the port whose adapter name contains this (default: moxa)");
    app.add_flag("--list-ports", list, "List serial adapters and exit");
    app.add_option("--baud", baud, "Baud rate (default 115200, uti 9600)");
    app.add_option("--parity", parity, "none|even|odd")->check(CLI::IsMember({"none", "even", "odd"}));
    app.add_option("--stop-bits", stop_bits, "1 or 2")->check(CLI::Range(1, 2));
    app.add_option("--timeout", timeout_ms, "Response timeout per attempt (ms)")->check(CLI::Range(1, 60000));

    // ---- acquisition ----
    int n = 0, attempts = 0;
    uint32_t period_ms = 0;
    uint64_t cycles = 0;
    std::string selection, speed;
    bool close_port = false;
    auto* opt_n       = app.add_option("-n,--nmeasurements", n, "Samples averaged per cycle and channel (default 10)")->check(CLI::Range(1, 1000));
    auto* opt_att     = app.add_option("--attempts", attempts, "Attempts per sample (default 3)")->check(CLI::Range(1, 10));
    auto* opt_period  = app.add_option("--period", period_ms, "Target cycle duration (ms, default 3000)");
    auto* opt_cycles  = app.add_option("--cycles", cycles, "Stop after this many cycles (0 = until Ctrl+C)");
    auto* opt_sel     = app.add_option("--channels", selection, "a | s | l | list of ids, e.g. \"1 2 6\"");
    auto* opt_speed   = app.add_option("--speed", speed, "Board conversion speed f|s")->check(CLI::IsMember({"f", "s"}));
    app.add_flag("-c,--close", close_port, "Close port after measurement");

    // ---- output ----
    bool no_print = false, no_save = false, verbose = false;
    std::string out_dir;
    uint32_t rotate = 0;
    app.add_flag("--no-print", no_print, "Do not print readings to the terminal");
    app.add_flag("--no-save", no_save, "Do not write CSV files");
    app.add_option("--output-dir", out_dir, "CSV directory (default ./outputs/)");
    auto* opt_rotate = app.add_option("--rotate", rotate, "Start a new CSV file every N cycles (default 2000)")->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Debug diagnostics on stderr");

    // ---- board console ----
    bool about = false, help_board = false;
    app.add_flag("--about", about, "Print the board's about text and exit");
    app.add_flag("--help-board", help_board, "Print the board's built-in help and exit");

    CLI11_PARSE(app, argc, argv);

    if (verbose) log::set_level(log::Level::Debug);

    if (list) {
        for (const auto& p : list_ports())
            std::cout << p.dev_path << " - " << (p.description.empty() ? "n/a" : p.description) << "\n";
        return 0;
    }

    // -------- configuration: defaults -> file -> CLI --------
    BoardKind board = BoardKind::Readout;
    if (!board_name.empty()) parse_board(board_name, board);
    AppConfig cfg = default_config(board);

    std::string err;
    if (!config_path.empty() && !load_config_file(config_path, cfg, err))
        return fail(EXIT_CONFIG, "reason=" + err + " file=" + config_path);

    if (!board_name.empty()) select_board(cfg, board);   // CLI board wins over the file's
    if (!port.empty())       cfg.line.path = port;
    if (!find_name.empty())  cfg.find_port = find_name;
    if (baud)                cfg.line.baud = baud;
    if (!parity.empty())     parse_parity(parity, cfg.line.parity);
    if (stop_bits)           cfg.line.stop_bits = static_cast<uint8_t>(stop_bits);
    if (timeout_ms)          cfg.line.timeout_ms = timeout_ms;
    cfg.sampler.response_timeout_ms = cfg.line.timeout_ms;
    if (opt_n->count())      cfg.scheduler.samples_per_channel = static_cast<uint16_t>(n);
    if (opt_att->count())    cfg.sampler.max_attempts = static_cast<uint8_t>(attempts);
    if (opt_period->count()) cfg.scheduler.cycle_period_ms = period_ms;
    if (opt_cycles->count()) cfg.scheduler.max_cycles = cycles;
    if (opt_sel->count())    cfg.selection = selection;
    if (opt_speed->count())  cfg.board_settings.speed = speed[0];
    if (close_port)          cfg.scheduler.close_on_exit = true;
    if (no_print)            cfg.print = false;
    if (no_save)             cfg.save = false;
    if (!out_dir.empty())    cfg.output_dir = out_dir;
    if (opt_rotate->count()) cfg.rotate_every = rotate;

    if (!validate(cfg, err)) return fail(EXIT_CONFIG, "reason=" + err);

    ChannelList channels;
    if (!resolve_channels(cfg, channels, err)) return fail(EXIT_CONFIG, "reason=" + err);

    // -------- port resolution --------
    if (cfg.line.path.empty()) {
        std::vector<PortInfo> seen;
        FindResult fr = find_port(cfg.find_port, cfg.line.path, &seen);
        if (fr != FindResult::Ok) {
            for (const auto& p : seen) std::cerr << "candidate dev=" << p.dev_path << " name=" << p.description << "\n";
            return fail(EXIT_CONNECTION, std::string("reason=") + to_string(fr) + " name=" + cfg.find_port);
        }
    }

    // -------- open --------
    transport::LinuxSerial serial;
    switch (serial.open(cfg.line)) {
        case transport::OpenResult::Ok: break;
        case transport::OpenResult::ConnectionError:
            return fail(EXIT_CONNECTION, "reason=" + serial.last_error() + " dev=" + cfg.line.path);
        case transport::OpenResult::ConfigurationError:
            return fail(EXIT_CONFIG, "reason=" + serial.last_error() + " dev=" + cfg.line.path +
                                     " baud=" + std::to_string(cfg.line.baud));
    }
    log::info("event=port_open dev=" + cfg.line.path + " baud=" + std::to_string(cfg.line.baud) +
              " board=" + to_string(cfg.board));

    // -------- board console queries --------
    if (about || help_board) {
        if (cfg.board != BoardKind::Readout) return fail(EXIT_CONFIG, "reason=no_console board=uti");
        for (const auto& l : query(serial, about ? "about" : "help", cfg.board_settings.quiet_ms))
            std::cout << l << "\n";
        return 0;
    }

    // -------- wire the core --------
    std::unique_ptr<ICodec> codec;
    if (cfg.board == BoardKind::Uti) codec = std::make_unique<SmartecUtiCodec>();
    else                             codec = std::make_unique<ReadoutBoardCodec>();

    SystemClock clock;
    CancelToken cancel;
    if (!install_signal_handlers(cancel)) log::warn("event=signal_setup_failed");

    ChannelSampler sampler(serial, *codec, clock, cfg.sampler, &cancel);

    std::cout << "Checking config level meter readout...\n";
    SetupResult sr = (cfg.board == BoardKind::Readout)
                         ? configure_readout_board(serial, cfg.board_settings)
                         : check_uti_board(sampler, channels.front());
    if (sr != SetupResult::Ok && sr != SetupResult::AlreadyConfigured)
        return fail(EXIT_SETUP, std::string("reason=") + to_string(sr) + " dev=" + cfg.line.path);
    std::cout << "OK\n";

    ConsoleSink console(std::cout);
    SystemClock csv_clock;
    CsvSink csv(cfg.output_dir, cfg.rotate_every, csv_clock);
    FanoutSink sink;
    if (cfg.print) sink.add(console);
    if (cfg.save)  sink.add(csv);

    std::cout << "\n####################\n\nStarting measurement.\n\n";

    Scheduler scheduler(sampler, serial, channels, sink, clock, cancel, cfg.scheduler);
    scheduler.run();

    std::cout << "\nDone.\n";
    if (cfg.scheduler.close_on_exit) std::cout << "Closing port " << cfg.line.path << ".\n";
    return 0;
}
