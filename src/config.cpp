#include "lmreadout/config.hpp"
#include "lmreadout/calibration.hpp"
#include "lmreadout/channel_select.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <vector>

using json = nlohmann::json;

namespace lmreadout {

// ---------------------------------------------------------------------------
// Typed field readers. Absent key -> leave `out` alone and succeed; present with
// the wrong type or out of range -> "bad_value:<key>".
// ---------------------------------------------------------------------------
static bool bad(std::string& err, const char* key) { err = std::string("bad_value:") + key; return false; }

template <typename T>
static bool read_int(const json& j, const char* key, int64_t lo, int64_t hi, T& out, std::string& err) {
    if (!j.contains(key)) return true;
    const json& v = j[key];
    if (!v.is_number_integer()) return bad(err, key);
    int64_t x = v.get<int64_t>();
    if (x < lo || x > hi) return bad(err, key);
    out = static_cast<T>(x);
    return true;
}

static bool read_bool(const json& j, const char* key, bool& out, std::string& err) {
    if (!j.contains(key)) return true;
    if (!j[key].is_boolean()) return bad(err, key);
    out = j[key].get<bool>();
    return true;
}

static bool read_num(const json& j, const char* key, double& out, std::string& err) {
    if (!j.contains(key)) return true;
    if (!j[key].is_number()) return bad(err, key);
    out = j[key].get<double>();
    return true;
}

static bool read_str(const json& j, const char* key, std::string& out, std::string& err) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) return bad(err, key);
    out = j[key].get<std::string>();
    return true;
}


const char* to_string(BoardKind b) {
    return b == BoardKind::Uti ? "uti" : "readout";
}

bool parse_board(const std::string& s, BoardKind& out) {
    if (s == "readout" || s == "moxa" || s == "ftdi_dual") { out = BoardKind::Readout; return true; }
    if (s == "uti" || s == "smartec" || s == "ftdi_ft230x") { out = BoardKind::Uti;    return true; }
    return false;
}

bool parse_parity(const std::string& s, transport::Parity& out) {
    if (s == "none" || s == "N") { out = transport::Parity::None; return true; }
    if (s == "even" || s == "E") { out = transport::Parity::Even; return true; }
    if (s == "odd"  || s == "O") { out = transport::Parity::Odd;  return true; }
    return false;
}


AppConfig default_config(BoardKind board) {
    AppConfig cfg;
    cfg.board = board;
    if (board == BoardKind::Uti) {
        cfg.line.baud = 9600;
        cfg.find_port = "ftdi";
        cfg.selection = "1";
        cfg.raw_min   = 0.0;     // Cx/Cref ratio
        cfg.raw_max   = 1.0;
    }
    return cfg;
}

void select_board(AppConfig& cfg, BoardKind board) {
    if (cfg.board == board) return;
    const AppConfig d = default_config(board);
    cfg.board     = board;
    cfg.line.baud = d.line.baud;
    cfg.find_port = d.find_port;
    cfg.selection = d.selection;
    cfg.raw_min   = d.raw_min;
    cfg.raw_max   = d.raw_max;
}


static bool apply_channels(const json& arr, AppConfig& cfg, std::string& err) {
    if (!arr.is_array()) return bad(err, "channels");
    cfg.table.clear();

    for (const auto& e : arr) {
        if (!e.is_object() || !e.contains("id") || !e["id"].is_number_integer()) return bad(err, "channels.id");
        int64_t id = e["id"].get<int64_t>();
        if (id < LMR_CHANNEL_ID_MIN || id > LMR_CHANNEL_ID_MAX) return bad(err, "channels.id");
        for (const auto& have : cfg.table) {
            if (have.id == id) { err = "duplicate_channel:" + std::to_string(id); return false; }
        }
        if (cfg.table.full()) return bad(err, "channels");

        Channel ch;
        ch.id     = static_cast<uint8_t>(id);
        ch.label  = default_label(ch.id);
        ch.coeffs = calibration::identity();

        if (e.contains("label")) {
            if (!e["label"].is_string()) return bad(err, "channels.label");
            const std::string l = e["label"].get<std::string>();
            ch.label.assign(l.c_str(), std::min(l.size(), ch.label.max_size()));
        }
        if (e.contains("coefficients")) {
            const json& c = e["coefficients"];
            if (!c.is_array() || c.empty() || c.size() > LMR_MAX_COEFFS) return bad(err, "channels.coefficients");
            ch.coeffs.clear();
            for (const auto& k : c) {
                if (!k.is_number()) return bad(err, "channels.coefficients");
                ch.coeffs.push_back(k.get<double>());
            }
        }
        cfg.table.push_back(ch);
    }
    return true;
}


bool apply_json(const json& j, AppConfig& cfg, std::string& err) {
    if (!j.is_object()) { err = "config_not_object"; return false; }

    std::string s;
    if (j.contains("board")) {
        if (!read_str(j, "board", s, err)) return false;
        BoardKind b;
        if (!parse_board(s, b)) return bad(err, "board");
        select_board(cfg, b);        // the rest of the file overrides these
    }
    if (!read_str(j, "port", cfg.line.path, err)) return false;
    if (!read_str(j, "find_port", cfg.find_port, err)) return false;
    if (!read_int(j, "baud", 1, 4000000, cfg.line.baud, err)) return false;
    if (j.contains("parity")) {
        if (!read_str(j, "parity", s, err)) return false;
        if (!parse_parity(s, cfg.line.parity)) return bad(err, "parity");
    }
    if (!read_int(j, "stop_bits", 1, 2, cfg.line.stop_bits, err)) return false;
    if (!read_int(j, "timeout_ms", 1, 60000, cfg.line.timeout_ms, err)) return false;
    cfg.sampler.response_timeout_ms = cfg.line.timeout_ms;

    if (!read_int(j, "samples_per_channel", 1, 1000, cfg.scheduler.samples_per_channel, err)) return false;
    if (!read_int(j, "max_attempts", 1, 10, cfg.sampler.max_attempts, err)) return false;
    if (!read_int(j, "cycle_period_ms", 0, 3600000, cfg.scheduler.cycle_period_ms, err)) return false;
    if (!read_bool(j, "close_on_exit", cfg.scheduler.close_on_exit, err)) return false;
    if (!read_int(j, "max_cycles", 0, INT64_MAX, cfg.scheduler.max_cycles, err)) return false;

    if (j.contains("speed")) {
        if (!read_str(j, "speed", s, err)) return false;
        if (s == "f" || s == "fast")      cfg.board_settings.speed = 'f';
        else if (s == "s" || s == "slow") cfg.board_settings.speed = 's';
        else return bad(err, "speed");
    }
    if (!read_str(j, "selection", cfg.selection, err)) return false;

    if (!read_num(j, "uti_reference_pf", cfg.uti_reference_pf, err)) return false;

    if (!read_num(j, "raw_min", cfg.raw_min, err)) return false;
    if (!read_num(j, "raw_max", cfg.raw_max, err)) return false;

    if (!read_bool(j, "print", cfg.print, err)) return false;
    if (!read_bool(j, "save", cfg.save, err)) return false;
    if (!read_str(j, "output_dir", cfg.output_dir, err)) return false;
    if (!read_int(j, "rotate_every", 1, UINT32_MAX, cfg.rotate_every, err)) return false;

    if (j.contains("channels") && !apply_channels(j["channels"], cfg, err)) return false;
    return true;
}


bool load_config_file(const std::string& path, AppConfig& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) { err = "config_unreadable"; return false; }

    json j = json::parse(in, nullptr, /*allow_exceptions*/false, /*ignore_comments*/true);
    if (j.is_discarded()) { err = "parse_error"; return false; }
    return apply_json(j, cfg, err);
}


bool validate(const AppConfig& cfg, std::string& err) {
    if (cfg.scheduler.samples_per_channel < 1)                            return bad(err, "samples_per_channel");
    if (cfg.sampler.max_attempts < 1 || cfg.sampler.max_attempts > 10)   return bad(err, "max_attempts");
    if (cfg.sampler.response_timeout_ms < 1)                              return bad(err, "timeout_ms");
    if (cfg.line.stop_bits != 1 && cfg.line.stop_bits != 2)               return bad(err, "stop_bits");
    if (cfg.rotate_every < 1)                                             return bad(err, "rotate_every");
    if (!std::isfinite(cfg.uti_reference_pf) || cfg.uti_reference_pf <= 0.0) return bad(err, "uti_reference_pf");
    if (cfg.board_settings.speed != 'f' && cfg.board_settings.speed != 's')  return bad(err, "speed");
    if (!std::isfinite(cfg.raw_min) || !std::isfinite(cfg.raw_max) || cfg.raw_min >= cfg.raw_max)
        return bad(err, "raw_range");
    return true;
}


static const Channel* find_in_table(const ChannelList& table, uint8_t id) {
    for (const auto& ch : table) if (ch.id == id) return &ch;
    return nullptr;
}

bool resolve_channels(const AppConfig& cfg, ChannelList& out, std::string& err) {
    out.clear();

    if (cfg.board == BoardKind::Uti) {
        Channel ch;
        ch.id     = 1;
        ch.label  = "UTI level meter";
        ch.coeffs = calibration::linear(0.0, cfg.uti_reference_pf);
        if (const Channel* t = find_in_table(cfg.table, 1)) ch = *t;
        out.push_back(ch);
    } else {
        std::vector<uint8_t> ids;
        SelectResult sr = parse_selection(cfg.selection, ids);
        if (sr != SelectResult::Ok) { err = std::string("selection:") + to_string(sr); return false; }

        for (uint8_t id : ids) {
            if (const Channel* t = find_in_table(cfg.table, id)) {
                out.push_back(*t);
            } else {
                auto d = default_channels({id});
                out.push_back(d.front());
            }
        }
    }

    for (const auto& ch : out) {
        auto chk = calibration::validate(ch.coeffs, cfg.raw_min, cfg.raw_max);
        if (chk != calibration::Check::Ok) {
            err = "calibration:" + std::to_string(unsigned(ch.id)) + ":" + calibration::to_string(chk);
            return false;
        }
    }
    return true;
}

} // namespace lmreadout
