/**
 * @file types.hpp
 * @brief Level-meter data model: channels, samples, readings and cycles.
 *
 * @details
 * These are the few plain types every layer of lmreadout passes around:
 *
 *  - `Channel`    : one physical level-meter tap on the readout board. Fixed for the
 *                   process lifetime; built once from configuration.
 *  - `RawSample`  : one decoded device response. Lives inside a single sampler call.
 *  - `Reading`    : the calibrated mean for one channel for one cycle. This is the
 *                   record the sinks persist: `(channel, unix time, capacitance pF)`.
 *  - `Cycle`      : one pass over all configured channels, in configured order.
 *
 * ## Capacities
 * The Xenoscope readout board has six inputs, so every per-channel collection is an
 * `etl::vector` bounded by `LMR_MAX_CHANNELS`. Nothing here allocates.
 *
 * ## Invariants
 * - A `Cycle` never holds two readings with the same channel id.
 * - `Reading::samples_used` is in `1..N`; a channel with zero successful samples
 *   produces no `Reading` at all.
 * - `Reading::timestamp` is the cycle time, not the time of an individual sample.
 */
#pragma once
#include "etl/string.h"
#include "etl/vector.h"
#include <stdint.h>
#include <stddef.h>

namespace lmreadout {

static constexpr size_t  LMR_MAX_CHANNELS   = 6;   ///< Inputs on the readout board
static constexpr size_t  LMR_MAX_COEFFS     = 4;   ///< Up to a cubic calibration polynomial
static constexpr size_t  LMR_LABEL_MAX      = 24;  ///< "Reference 100 pF" fits comfortably
static constexpr uint8_t LMR_CHANNEL_ID_MIN = 1;
static constexpr uint8_t LMR_CHANNEL_ID_MAX = 6;

using LabelStr = etl::string<LMR_LABEL_MAX>;
using Coeffs   = etl::vector<double, LMR_MAX_COEFFS>;

/// @brief One configured level-meter channel.
struct Channel {
    uint8_t  id{0};       ///< Board input number, 1..6
    LabelStr label;       ///< Human label, e.g. "SLM 1", "LLM (upper)"
    Coeffs   coeffs;      ///< Calibration polynomial, lowest order first
};

using ChannelList = etl::vector<Channel, LMR_MAX_CHANNELS>;

/// @brief One decoded response for one channel.
struct RawSample {
    uint8_t channel{0};
    double  value{0.0};
    int64_t unix_ms{0};   ///< When the response was decoded
};

/// @brief Reduced, calibrated result for one channel in one cycle.
struct Reading {
    uint8_t  channel{0};
    int64_t  timestamp{0};      ///< Cycle time, UNIX seconds
    double   capacitance_pf{0.0};
    uint16_t samples_used{0};   ///< Successful samples averaged (<= N)
};

/// @brief One full pass over the configured channels.
struct Cycle {
    uint64_t index{0};          ///< 0-based cycle counter since run start
    int64_t  start_unix_s{0};   ///< Same value stamped on every Reading
    uint32_t target_ms{0};      ///< Configured cycle period
    bool     complete{true};    ///< False if cancellation cut the cycle short
    etl::vector<Reading, LMR_MAX_CHANNELS> readings;

    /// @brief Lookup by channel id; nullptr if the channel had a gap.
    const Reading* find(uint8_t channel) const {
        for (const auto& r : readings) {
            if (r.channel == channel) return &r;
        }
        return nullptr;
    }
};

} // namespace lmreadout
