#include "lmreadout/codec.hpp"
#include "lmreadout/types.hpp"

#include <cmath>          // std::isfinite
#include <cstdlib>        // std::strtod
#include <string>

namespace lmreadout {

const char* to_string(DecodeStatus s) {
    switch (s) {
        case DecodeStatus::Ok:         return "ok";
        case DecodeStatus::Incomplete: return "incomplete";
        case DecodeStatus::Malformed:  return "malformed";
    }
    return "unknown";
}

// Characters the board may legally send in a value line.
static bool legal_byte(uint8_t c) {
    if (c >= '0' && c <= '9') return true;
    switch (c) {
        case '+': case '-': case '.': case 'e': case 'E':
        case ' ': case '\t': case '\r': case '\n':
            return true;
        default:
            return false;
    }
}

static bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r'; }

// ---------------------------------------------------------------------------
// Request: "r <channel> 1\n"
// Mode "r" returns individual readings; asking for one keeps the request/response
// strictly one line each, so averaging stays on the host.
// ---------------------------------------------------------------------------
std::vector<uint8_t> ReadoutBoardCodec::encode_read_request(uint8_t channel) const {
    return make_command("r " + std::to_string(unsigned(channel)) + " 1");
}

std::vector<uint8_t> ReadoutBoardCodec::make_command(const std::string& text) {
    std::vector<uint8_t> b(text.begin(), text.end());
    b.push_back('\n');
    return b;
}

bool ReadoutBoardCodec::has_channel(uint8_t channel) const {
    return channel >= LMR_CHANNEL_ID_MIN && channel <= LMR_CHANNEL_ID_MAX;
}

// ---------------------------------------------------------------------------
// Response: one decimal number, optional surrounding blanks, '\n' terminated.
//
// Phases:
//   1) empty buffer                      -> Incomplete (read timed out with no data)
//   2) any byte before the first '\n' outside the legal set -> Malformed
//   3) no '\n' yet                       -> Incomplete
//   4) first line must hold exactly one finite number, nothing else
// Bytes after the first '\n' are not looked at.
// ---------------------------------------------------------------------------
DecodeResult ReadoutBoardCodec::decode_response(const std::vector<uint8_t>& bytes) const {
    DecodeResult res;
    if (bytes.empty()) return res;                          // Incomplete

    size_t nl = bytes.size();
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (bytes[i] == '\n') { nl = i; break; }
        if (!legal_byte(bytes[i])) { res.status = DecodeStatus::Malformed; return res; }
    }
    if (nl == bytes.size()) return res;                     // legal prefix, no terminator

    std::string line(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(nl));
    size_t a = 0, b = line.size();
    while (a < b && is_space(line[a]))     ++a;
    while (b > a && is_space(line[b - 1])) --b;
    std::string token = line.substr(a, b - a);

    res.status = DecodeStatus::Malformed;
    if (token.empty()) return res;                          // blank line
    for (char c : token) if (is_space(c)) return res;       // two fields on one line

    char* end = nullptr;
    double v = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size()) return res;    // "1.2.3", "--4", "e5"
    if (!std::isfinite(v)) return res;

    res.status = DecodeStatus::Ok;
    res.value  = v;
    return res;
}

} // namespace lmreadout
