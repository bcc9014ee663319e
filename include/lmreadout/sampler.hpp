/**
 * @page lmr-sampler Channel Sampler
 * @file sampler.hpp
 * @brief One validated raw value from one channel, with bounded retry.
 *
 * @details
 * PURPOSE
 * -------
 * The sampler hides flaky serial traffic from the scheduler. It sends one read
 * request, collects the response until the codec stops saying "Incomplete" or the
 * response timeout runs out, and decodes it. Anything short of a clean decode is
 * retried with the port left open, up to `max_attempts` times.
 *
 * ONE ATTEMPT
 * -----------
 *   discard_input()                 stale bytes from a late earlier reply
 *   write(encode_read_request(ch))  TxResult::Error          -> retry
 *   loop read() until deadline      RxResult::Error          -> retry
 *                                   timeout, still Incomplete -> retry
 *   decode_response()               Malformed                -> retry
 *                                   Ok                       -> done
 *
 * FAILURE
 * -------
 * When every attempt fails the sample is "exhausted": sample() returns an empty
 * optional and bumps stats().exhausted. This is never fatal. The scheduler just
 * averages fewer values. A stop request is honoured between attempts.
 */
#pragma once
#include "lmreadout/types.hpp"
#include "lmreadout/codec.hpp"
#include "lmreadout/clock.hpp"
#include "lmreadout/cancel.hpp"
#include "lmreadout/transport/transport_base.hpp"

#include <cstdint>
#include <optional>

namespace lmreadout {

struct SamplerConfig {
    uint8_t max_attempts{3};            ///< 1..10, per sample
    int     response_timeout_ms{2000};  ///< per attempt
    size_t  max_response_bytes{128};    ///< longer without a valid line -> Malformed
};

/// Why the most recent attempt failed; None after a success.
enum class AttemptFailure : uint8_t { None=0, WriteError, ReadError, Timeout, Malformed, Cancelled };

const char* to_string(AttemptFailure f);

class ChannelSampler {
public:
    struct Stats {
        uint64_t samples{0};     ///< sample() calls
        uint64_t attempts{0};    ///< requests put on the wire
        uint64_t retries{0};     ///< attempts beyond the first
        uint64_t exhausted{0};   ///< samples that failed every attempt
        uint64_t io_errors{0};
        uint64_t timeouts{0};
        uint64_t malformed{0};
    };

    ChannelSampler(transport::ITransport& port,
                   const ICodec& codec,
                   const IClock& clock,
                   const SamplerConfig& cfg = {},
                   const CancelToken* cancel = nullptr);

    /// One raw value for @p ch, or nullopt once all attempts are spent.
    std::optional<RawSample> sample(const Channel& ch);

    const Stats& stats() const { return stats_; }
    AttemptFailure last_failure() const { return last_failure_; }
    const SamplerConfig& config() const { return cfg_; }

private:
    AttemptFailure attempt(uint8_t channel, double& value);

    transport::ITransport& port_;
    const ICodec&          codec_;
    const IClock&          clock_;
    SamplerConfig          cfg_;
    const CancelToken*     cancel_;
    Stats                  stats_;
    AttemptFailure         last_failure_{AttemptFailure::None};
};

} // namespace lmreadout
