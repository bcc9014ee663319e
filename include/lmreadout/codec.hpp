/**
 * @page lmr-codec Level-Meter Protocol Codecs
 * @file codec.hpp
 * @brief Request encoding and response validation for the two supported boards.
 *
 * @details
 * PURPOSE
 * -------
 * The codec is the contract between the sampler and the board firmware. It knows
 * which bytes select and trigger a reading on a channel, and how to turn the
 * bytes that come back into one raw number, or into a reason why it could not.
 * Nothing above this layer sees wire bytes; nothing below it knows about channels.
 *
 * SUPPORTED BOARDS
 * ----------------
 * - ReadoutBoardCodec: the custom six-channel readout board (Xenoscope). ASCII
 *   line protocol, commands terminated by '\n':
 *     request   "r <channel> 1\n"     one single (non-averaged) reading
 *     response  "  12.3456\r\n"       one decimal value per line
 *   Setup commands (echo/verbose/debug/speed/getmode/help/about) go through
 *   make_command() and are handled by board_setup.cpp.
 *
 * - SmartecUtiCodec: the Smartec UTI evaluation board (single level meter).
 *     request   "m"                   trigger one measurement
 *     response  "<Toff> <Tref> <Tx>\r\n"  hexadecimal period counts
 *   The raw value is (Tx - Toff) / (Tref - Toff); calibration scales it by the
 *   reference capacitance.
 *
 * DECODE OUTCOMES
 * ---------------
 *   Ok          value holds the raw number.
 *   Incomplete  nothing yet, or a legal prefix without its terminator. Read more.
 *   Malformed   bytes that can never become a valid response. Retry the request.
 *
 * decode_response() never throws and never reads past the buffer it is given.
 *
 * @see sampler.hpp for the read/retry loop built on top of this.
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace lmreadout {

enum class DecodeStatus : uint8_t { Ok=0, Incomplete=1, Malformed=2 };

struct DecodeResult {
    DecodeStatus status{DecodeStatus::Incomplete};
    double       value{0.0};

    bool ok() const { return status == DecodeStatus::Ok; }
};

/// Stable token for logs: "ok", "incomplete", "malformed".
const char* to_string(DecodeStatus s);

/**
 * @class ICodec
 * @brief Board-specific framing behind a channel-level request/response API.
 */
class ICodec {
public:
    virtual ~ICodec() = default;

    /// Exact command frame that selects @p channel and triggers one reading.
    virtual std::vector<uint8_t> encode_read_request(uint8_t channel) const = 0;

    /// Validate a (possibly partial) response and extract its raw value.
    virtual DecodeResult decode_response(const std::vector<uint8_t>& bytes) const = 0;

    /// Whether this board has an input with that number.
    virtual bool has_channel(uint8_t channel) const = 0;

    virtual const char* name() const = 0;
};


class ReadoutBoardCodec : public ICodec {
public:
    std::vector<uint8_t> encode_read_request(uint8_t channel) const override;
    DecodeResult decode_response(const std::vector<uint8_t>& bytes) const override;
    bool has_channel(uint8_t channel) const override;
    const char* name() const override { return "readout"; }

    /// "getmode" -> "getmode\n". Used for the setup handshake.
    static std::vector<uint8_t> make_command(const std::string& text);
};


class SmartecUtiCodec : public ICodec {
public:
    std::vector<uint8_t> encode_read_request(uint8_t channel) const override;
    DecodeResult decode_response(const std::vector<uint8_t>& bytes) const override;
    bool has_channel(uint8_t channel) const override { return channel == 1; }
    const char* name() const override { return "uti"; }
};

} // namespace lmreadout
