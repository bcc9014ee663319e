#pragma once
/**
 * @file config.hpp
 * @brief Run configuration: defaults, JSON file, and channel resolution.
 *
 * @details
 * Precedence, lowest first: built-in defaults -> JSON file (--config) -> CLI flags.
 * main.cpp applies the CLI layer on top of what this module produces, then calls
 * resolve_channels() once to turn the selection + channel table into the final,
 * validated ChannelList the scheduler runs on.
 *
 * EXAMPLE FILE
 * ------------
 * @code
 * {
 *   "board": "readout",
 *   "port": "/dev/serial/by-id/usb-MOXA_UPort_1130-if00-port0",
 *   "baud": 115200, "parity": "none", "stop_bits": 1, "timeout_ms": 2000,
 *   "samples_per_channel": 10, "max_attempts": 3,
 *   "cycle_period_ms": 3000, "close_on_exit": false, "speed": "f",
 *   "selection": "a", "raw_min": 0, "raw_max": 10000,
 *   "channels": [
 *     { "id": 1, "label": "SLM 1", "coefficients": [0.0, 1.0] },
 *     { "id": 4, "label": "LLM (upper)", "coefficients": [-1.2, 1.003] }
 *   ]
 * }
 * @endcode
 *
 * Errors are returned as short reason tokens ("bad_value:baud", "parse_error",
 * "calibration:4:not_monotonic") so the CLI can print them on a status= line.
 */

#include "lmreadout/types.hpp"
#include "lmreadout/calibration.hpp"
#include "lmreadout/sampler.hpp"
#include "lmreadout/scheduler.hpp"
#include "lmreadout/board_setup.hpp"
#include "lmreadout/transport/transport_base.hpp"

#include "nlohmann/json.hpp"

#include <string>

namespace lmreadout {

enum class BoardKind : uint8_t { Readout=0, Uti=1 };

struct AppConfig {
    BoardKind             board{BoardKind::Readout};
    transport::LineConfig line;                    ///< path empty -> discover by find_port
    std::string           find_port{"moxa"};       ///< name fragment for port discovery
    SamplerConfig         sampler;
    SchedulerConfig       scheduler;
    BoardSettings         board_settings;
    std::string           selection{"a"};
    ChannelList           table;                   ///< per-channel overrides from the file
    double                uti_reference_pf{100.0}; ///< C_ref on the UTI evaluation board
    double                raw_min{calibration::RAW_MIN_DEFAULT};  ///< calibration checked on [raw_min, raw_max]
    double                raw_max{calibration::RAW_MAX_DEFAULT};

    bool        print{true};
    bool        save{true};
    std::string output_dir{"./outputs/"};
    uint32_t    rotate_every{2000};
};

/// Built-in defaults for @p board (UTI: 9600 baud, "ftdi" discovery, raw range [0, 1]).
AppConfig default_config(BoardKind board);

/// Switch @p cfg to @p board, resetting baud, discovery name, selection and raw
/// range to that board's defaults. Everything else is kept.
void select_board(AppConfig& cfg, BoardKind board);

bool parse_board(const std::string& s, BoardKind& out);
bool parse_parity(const std::string& s, transport::Parity& out);
const char* to_string(BoardKind b);

/// Merge @p j into @p cfg. Unknown keys are ignored; wrong types are errors.
bool apply_json(const nlohmann::json& j, AppConfig& cfg, std::string& err);

/// Read and merge a JSON file. err = "config_unreadable" / "parse_error" / apply_json reasons.
bool load_config_file(const std::string& path, AppConfig& cfg, std::string& err);

/// Range checks on the numeric settings.
bool validate(const AppConfig& cfg, std::string& err);

/**
 * @brief Build the channel list the run will use.
 *
 * Readout board: parse the selection, take each id's entry from cfg.table when
 * present, default label and identity calibration otherwise.
 * UTI board: always the single channel 1, calibrated as ratio * uti_reference_pf
 * unless the table overrides it.
 * Every channel's calibration must pass calibration::validate() on
 * [cfg.raw_min, cfg.raw_max].
 */
bool resolve_channels(const AppConfig& cfg, ChannelList& out, std::string& err);

} // namespace lmreadout
