#include "lmreadout/codec.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lmreadout {

// UTI period counts are at most 24 bits on the evaluation board; 8 hex digits
// leaves headroom and still fits a uint32_t.
static constexpr size_t UTI_MAX_DIGITS = 8;
static constexpr size_t UTI_MIN_FIELDS = 3;   // Toff, Tref, Tx
static constexpr size_t UTI_MAX_FIELDS = 5;   // modes with two extra sensor phases

static int hex_value(uint8_t c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool is_blank(uint8_t c) { return c == ' ' || c == '\t' || c == '\r'; }

std::vector<uint8_t> SmartecUtiCodec::encode_read_request(uint8_t /*channel*/) const {
    return {'m'};                               // single input; the trigger carries no channel
}

// ---------------------------------------------------------------------------
// Response: "<Toff> <Tref> <Tx> [...]\r\n", hex fields separated by blanks.
// raw = (Tx - Toff) / (Tref - Toff)
// ---------------------------------------------------------------------------
DecodeResult SmartecUtiCodec::decode_response(const std::vector<uint8_t>& bytes) const {
    DecodeResult res;
    if (bytes.empty()) return res;

    std::vector<uint32_t> fields;
    uint32_t cur = 0;
    size_t   digits = 0;
    bool     terminated = false;

    for (uint8_t c : bytes) {
        if (c == '\n') { terminated = true; break; }
        int h = hex_value(c);
        if (h >= 0) {
            if (++digits > UTI_MAX_DIGITS) { res.status = DecodeStatus::Malformed; return res; }
            cur = (cur << 4) | static_cast<uint32_t>(h);
        } else if (is_blank(c)) {
            if (digits) { fields.push_back(cur); cur = 0; digits = 0; }
        } else {
            res.status = DecodeStatus::Malformed;
            return res;
        }
    }
    if (!terminated) return res;                // Incomplete
    if (digits) fields.push_back(cur);

    res.status = DecodeStatus::Malformed;
    if (fields.size() < UTI_MIN_FIELDS || fields.size() > UTI_MAX_FIELDS) return res;

    const double t_off = fields[0];
    const double t_ref = fields[1];
    const double t_x   = fields[2];
    if (t_ref == t_off) return res;

    res.status = DecodeStatus::Ok;
    res.value  = (t_x - t_off) / (t_ref - t_off);
    return res;
}

} // namespace lmreadout
