// ============================================================================
// sampler.cpp - implementation for sampler.hpp
// ============================================================================

#include "lmreadout/sampler.hpp"
#include "lmreadout/log.hpp"

#include <string>
#include <vector>

namespace lmreadout {

static constexpr size_t READ_CHUNK = 64;   // bytes per read(); a value line is ~12

const char* to_string(AttemptFailure f) {
    switch (f) {
        case AttemptFailure::None:       return "none";
        case AttemptFailure::WriteError: return "write_error";
        case AttemptFailure::ReadError:  return "read_error";
        case AttemptFailure::Timeout:    return "timeout";
        case AttemptFailure::Malformed:  return "malformed";
        case AttemptFailure::Cancelled:  return "cancelled";
    }
    return "unknown";
}

ChannelSampler::ChannelSampler(transport::ITransport& port,
                               const ICodec& codec,
                               const IClock& clock,
                               const SamplerConfig& cfg,
                               const CancelToken* cancel)
: port_(port), codec_(codec), clock_(clock), cfg_(cfg), cancel_(cancel) {
    if (cfg_.max_attempts < 1) cfg_.max_attempts = 1;
}


std::optional<RawSample> ChannelSampler::sample(const Channel& ch) {
    ++stats_.samples;

    for (uint8_t n = 0; n < cfg_.max_attempts; ++n) {
        if (n > 0) {
            if (cancel_ && cancel_->stop_requested()) {
                last_failure_ = AttemptFailure::Cancelled;
                break;
            }
            ++stats_.retries;
        }

        double value = 0.0;
        last_failure_ = attempt(ch.id, value);
        if (last_failure_ == AttemptFailure::None) {
            RawSample s;
            s.channel = ch.id;
            s.value   = value;
            s.unix_ms = clock_.unix_ms();
            return s;
        }

        log::debug("event=attempt_failed channel=" + std::to_string(unsigned(ch.id)) +
                   " attempt=" + std::to_string(unsigned(n + 1)) +
                   " reason=" + to_string(last_failure_) +
                   (last_failure_ == AttemptFailure::WriteError || last_failure_ == AttemptFailure::ReadError
                        ? " detail=" + port_.last_error() : std::string()));
    }

    ++stats_.exhausted;
    log::debug("event=sample_exhausted channel=" + std::to_string(unsigned(ch.id)) +
               " reason=" + to_string(last_failure_));
    return std::nullopt;
}


// ---------------------------------------------------------------------------
// attempt()
// ---------
// One request/response exchange. The response may arrive in several chunks,
// so bytes accumulate until the codec gives a verdict or time runs out.
// A read() that returns nothing has already waited the whole remaining time.
// ---------------------------------------------------------------------------
AttemptFailure ChannelSampler::attempt(uint8_t channel, double& value) {
    ++stats_.attempts;

    port_.discard_input();
    const auto req = codec_.encode_read_request(channel);
    if (port_.write(req.data(), req.size()) != transport::TxResult::Ok) {
        ++stats_.io_errors;
        return AttemptFailure::WriteError;
    }

    std::vector<uint8_t> resp;
    uint8_t buf[READ_CHUNK];
    const int64_t deadline = clock_.steady_ms() + cfg_.response_timeout_ms;

    while (true) {
        int64_t remaining = deadline - clock_.steady_ms();
        if (remaining <= 0) break;

        std::size_t n = 0;
        auto rr = port_.read(buf, sizeof(buf), n, static_cast<int>(remaining));
        if (rr == transport::RxResult::Error) {
            ++stats_.io_errors;
            return AttemptFailure::ReadError;
        }
        if (rr == transport::RxResult::None) break;

        resp.insert(resp.end(), buf, buf + n);
        DecodeResult d = codec_.decode_response(resp);
        if (d.status == DecodeStatus::Ok) { value = d.value; return AttemptFailure::None; }
        if (d.status == DecodeStatus::Malformed || resp.size() > cfg_.max_response_bytes) {
            ++stats_.malformed;
            return AttemptFailure::Malformed;
        }
    }

    // Out of time: whatever we hold is at best a prefix (Incomplete), or nothing.
    ++stats_.timeouts;
    return AttemptFailure::Timeout;
}

} // namespace lmreadout
