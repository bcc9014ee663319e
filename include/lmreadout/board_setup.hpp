#pragma once
/**
 * @file board_setup.hpp
 * @brief Pre-acquisition handshake: put the board into the mode the codec expects.
 *
 * @details
 * The readout board's firmware has a few console switches that change what a
 * response looks like. The codec assumes all of them off:
 *
 *   echo 0      no command echo (an echoed "r 1 1" would decode as Malformed)
 *   verbose 0   bare values, no units or labels
 *   debug 0     no debug chatter between lines
 *   f | s       fast (~100 samples/s) or slow (~10 samples/s) conversion
 *
 * `getmode` reports the current state as four lines, e.g. "S f", "V 0", "E 0",
 * "D 0". configure_readout_board() first asks getmode; if the board already
 * matches, the session is reused untouched. Otherwise it sends the four switches
 * and asks again.
 *
 * The UTI evaluation board has no console; check_uti_board() just takes one test
 * measurement and requires it to decode.
 */

#include "lmreadout/types.hpp"
#include "lmreadout/sampler.hpp"
#include "lmreadout/transport/transport_base.hpp"

#include <string>
#include <vector>

namespace lmreadout {

struct BoardSettings {
    bool echo{false};
    bool verbose{false};
    bool debug{false};
    char speed{'f'};                 ///< 'f' fast or 's' slow
    int  quiet_ms{300};              ///< a reply is over after this long without bytes
};

enum class SetupResult : uint8_t {
    Ok=0,                  ///< switches sent, getmode confirms
    AlreadyConfigured,     ///< getmode matched before anything was sent
    WriteFailed,
    NoResponse,            ///< getmode answered with nothing
    ModeMismatch,          ///< getmode answered, but not with the requested mode
    TestMeasurementFailed  ///< UTI board: test sample did not decode
};

const char* to_string(SetupResult r);

/// Collect reply lines until the port stays quiet for @p quiet_ms. Spaces, CR and
/// LF are stripped from each line and empty lines dropped.
std::vector<std::string> read_lines(transport::ITransport& port, int quiet_ms);

/// Send one console command ("getmode", "help", "about", ...) and collect its reply.
/// Returns an empty vector if the write fails or nothing comes back.
std::vector<std::string> query(transport::ITransport& port, const std::string& cmd, int quiet_ms);

/// The four getmode lines @p s should produce: {"Sf","V0","E0","D0"} by default.
std::vector<std::string> expected_mode(const BoardSettings& s);

SetupResult configure_readout_board(transport::ITransport& port, const BoardSettings& s);

SetupResult check_uti_board(ChannelSampler& sampler, const Channel& ch);

} // namespace lmreadout
