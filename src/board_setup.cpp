#include "lmreadout/board_setup.hpp"
#include "lmreadout/codec.hpp"
#include "lmreadout/log.hpp"

#include <cstdint>

namespace lmreadout {

static constexpr size_t REPLY_MAX_BYTES = 4096;   // "help" is the longest reply, well under this

const char* to_string(SetupResult r) {
    switch (r) {
        case SetupResult::Ok:                    return "ok";
        case SetupResult::AlreadyConfigured:     return "already_configured";
        case SetupResult::WriteFailed:           return "write_failed";
        case SetupResult::NoResponse:            return "no_response";
        case SetupResult::ModeMismatch:          return "mode_mismatch";
        case SetupResult::TestMeasurementFailed: return "test_measurement_failed";
    }
    return "unknown";
}

static void flush_line(std::string& cur, std::vector<std::string>& out) {
    if (!cur.empty()) out.push_back(cur);
    cur.clear();
}

std::vector<std::string> read_lines(transport::ITransport& port, int quiet_ms) {
    std::vector<std::string> lines;
    std::string cur;
    uint8_t buf[128];
    size_t total = 0;

    while (total < REPLY_MAX_BYTES) {
        std::size_t n = 0;
        auto rr = port.read(buf, sizeof(buf), n, quiet_ms);
        if (rr != transport::RxResult::Ok) break;       // quiet (None) or broken (Error)
        total += n;
        for (std::size_t i = 0; i < n; ++i) {
            char c = static_cast<char>(buf[i]);
            if (c == '\n')                  flush_line(cur, lines);
            else if (c != ' ' && c != '\r') cur.push_back(c);
        }
    }
    flush_line(cur, lines);                             // trailing line without LF
    return lines;
}

std::vector<std::string> query(transport::ITransport& port, const std::string& cmd, int quiet_ms) {
    const auto b = ReadoutBoardCodec::make_command(cmd);
    if (port.write(b.data(), b.size()) != transport::TxResult::Ok) return {};
    return read_lines(port, quiet_ms);
}

std::vector<std::string> expected_mode(const BoardSettings& s) {
    return {
        std::string("S") + s.speed,
        std::string("V") + (s.verbose ? '1' : '0'),
        std::string("E") + (s.echo    ? '1' : '0'),
        std::string("D") + (s.debug   ? '1' : '0'),
    };
}


/*
 * configure_readout_board()
 * -------------------------
 * Phases:
 *   1) getmode; matching mode -> reuse the session as-is,
 *   2) send echo / verbose / debug / speed, drain their replies,
 *   3) getmode again and compare.
 */
SetupResult configure_readout_board(transport::ITransport& port, const BoardSettings& s) {
    const auto want = expected_mode(s);

    port.discard_input();
    if (query(port, "getmode", s.quiet_ms) == want) {
        log::info("event=board_mode status=reused");
        return SetupResult::AlreadyConfigured;
    }

    const std::string cmds[] = {
        std::string("echo ")    + (s.echo    ? "1" : "0"),
        std::string("verbose ") + (s.verbose ? "1" : "0"),
        std::string("debug ")   + (s.debug   ? "1" : "0"),
        std::string(1, s.speed),
    };
    for (const auto& c : cmds) {
        const auto b = ReadoutBoardCodec::make_command(c);
        if (port.write(b.data(), b.size()) != transport::TxResult::Ok) {
            log::error("event=board_setup reason=write_failed cmd=\"" + c + "\" detail=" + port.last_error());
            return SetupResult::WriteFailed;
        }
    }
    for (const auto& line : read_lines(port, s.quiet_ms)) {
        log::debug("event=board_reply line=\"" + line + "\"");
    }

    const auto got = query(port, "getmode", s.quiet_ms);
    if (got.empty()) return SetupResult::NoResponse;
    if (got != want) {
        std::string joined;
        for (const auto& g : got) joined += (joined.empty() ? "" : ",") + g;
        log::error("event=board_setup reason=mode_mismatch got=\"" + joined + "\"");
        return SetupResult::ModeMismatch;
    }
    log::info("event=board_mode status=configured speed=" + std::string(1, s.speed));
    return SetupResult::Ok;
}


SetupResult check_uti_board(ChannelSampler& sampler, const Channel& ch) {
    auto s = sampler.sample(ch);
    if (!s) return SetupResult::TestMeasurementFailed;
    log::info("event=uti_test_measurement raw=" + std::to_string(s->value));
    return SetupResult::Ok;
}

} // namespace lmreadout
