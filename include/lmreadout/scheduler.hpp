/**
 * @file scheduler.hpp
 * @brief Acquisition Cycle Scheduler: the loop that turns channels into readings.
 *
 * @details
 * ## Field Brief
 * The scheduler is the whole run in one object. It walks the configured channels
 * in fixed order, asks the sampler for N raw values per channel, calibrates and
 * averages the ones that came back, hands the finished Cycle to the sink, then
 * idles until the next period starts. It does this until someone presses Ctrl+C.
 *
 * It does not know about ports, bytes, files or terminals. Those belong to the
 * sampler below it and the sink beside it.
 *
 * ---
 *
 * @par State machine
 * @code
 *   Idle -> Sampling(ch=0) -> Reducing -> Sampling(ch=1) -> ... -> Reducing
 *        -> Emitting -> Sleeping -> Sampling(ch=0) -> ...
 *   any state -- stop requested --> Stopped
 * @endcode
 *
 * @par Reduction rules
 * - Successful samples are calibrated one by one, then averaged (arithmetic mean).
 * - Zero successes: no Reading for that channel this cycle, and a warning
 *   (`event=channel_gap`). The remaining channels are still sampled.
 * - Some failures: the Reading carries the lower sample count and an info line
 *   (`event=samples_dropped`) is written.
 *
 * @par Timing
 * - Every Reading in a cycle carries the cycle's UNIX second, read from the wall
 *   clock when the cycle starts. It never goes backwards between cycles.
 * - After emitting, the scheduler sleeps `period - elapsed`, floored at zero.
 *   Elapsed time is measured from this cycle's own start on the steady clock, so
 *   a slow cycle does not push every later one back.
 *
 * @par Cancellation
 * - The stop flag is checked before every sample and between sleep slices.
 * - A channel interrupted before its N samples are in is dropped; channels already
 *   reduced are emitted as a partial Cycle (`complete == false`).
 * - On Stopped the transport is closed when `close_on_exit` is set, and left open
 *   otherwise so a later run can reuse it. If anything unwinds out of run(), the
 *   transport is closed regardless.
 */
#pragma once
#include "lmreadout/types.hpp"
#include "lmreadout/sampler.hpp"
#include "lmreadout/sinks.hpp"
#include "lmreadout/clock.hpp"
#include "lmreadout/cancel.hpp"
#include "lmreadout/transport/transport_base.hpp"

#include <cstdint>

namespace lmreadout {

struct SchedulerConfig {
    uint16_t samples_per_channel{10};   ///< N, >= 1
    uint32_t cycle_period_ms{3000};     ///< target cycle duration
    bool     close_on_exit{false};      ///< close the transport when Stopped
    uint64_t max_cycles{0};             ///< 0 = until cancelled
    uint32_t sleep_slice_ms{100};       ///< max latency for noticing a stop while idle
};

enum class SchedulerState : uint8_t { Idle=0, Sampling, Reducing, Emitting, Sleeping, Stopped };

const char* to_string(SchedulerState s);

class Scheduler {
public:
    struct Stats {
        uint64_t cycles{0};           ///< cycles handed to the sink (partial included)
        uint64_t readings{0};
        uint64_t gaps{0};             ///< channel-cycles with zero successful samples
        uint64_t partial_cycles{0};
        uint64_t sink_failures{0};
    };

    Scheduler(ChannelSampler& sampler,
              transport::ITransport& port,
              const ChannelList& channels,
              ISink& sink,
              IClock& clock,
              const CancelToken& cancel,
              const SchedulerConfig& cfg = {});

    /**
     * @brief Sample every channel once, reduce, and emit the result to the sink.
     * @return The emitted Cycle (also for partial cycles). The scheduler keeps no copy.
     */
    Cycle run_cycle();

    /**
     * @brief Loop run_cycle() + idle until cancelled or max_cycles is reached.
     * @return Number of cycles emitted during this call.
     */
    uint64_t run();

    SchedulerState state() const { return state_; }
    size_t channel_index() const { return channel_index_; }
    const Stats& stats() const { return stats_; }
    const SchedulerConfig& config() const { return cfg_; }

private:
    bool stop() const { return cancel_.stop_requested(); }
    int64_t cycle_timestamp();
    void idle_until(int64_t cycle_start_steady);

    ChannelSampler&        sampler_;
    transport::ITransport& port_;
    const ChannelList&     channels_;
    ISink&                 sink_;
    IClock&                clock_;
    const CancelToken&     cancel_;
    SchedulerConfig        cfg_;

    SchedulerState state_{SchedulerState::Idle};
    size_t         channel_index_{0};
    int64_t        last_stamp_{0};
    Stats          stats_;
};

} // namespace lmreadout
