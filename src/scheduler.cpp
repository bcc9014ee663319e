// -----------------------------------------------------------------------------
// scheduler.cpp - Implementation of the acquisition cycle scheduler
//
// API & reduction/timing rules:
//   see include/lmreadout/scheduler.hpp
//
// Scenario tests:
//   see tests/test_scheduler.cpp
// -----------------------------------------------------------------------------
#include "lmreadout/scheduler.hpp"
#include "lmreadout/calibration.hpp"
#include "lmreadout/log.hpp"

#include <algorithm>
#include <string>

namespace lmreadout {

namespace {

// Closes the port if run() is left by anything but its normal return path.
struct PortGuard {
    transport::ITransport& port;
    bool armed{true};
    ~PortGuard() { if (armed) port.close(); }
};

std::string ch_str(uint8_t id) { return std::to_string(unsigned(id)); }

} // namespace


const char* to_string(SchedulerState s) {
    switch (s) {
        case SchedulerState::Idle:     return "idle";
        case SchedulerState::Sampling: return "sampling";
        case SchedulerState::Reducing: return "reducing";
        case SchedulerState::Emitting: return "emitting";
        case SchedulerState::Sleeping: return "sleeping";
        case SchedulerState::Stopped:  return "stopped";
    }
    return "unknown";
}


Scheduler::Scheduler(ChannelSampler& sampler,
                     transport::ITransport& port,
                     const ChannelList& channels,
                     ISink& sink,
                     IClock& clock,
                     const CancelToken& cancel,
                     const SchedulerConfig& cfg)
: sampler_(sampler), port_(port), channels_(channels), sink_(sink),
  clock_(clock), cancel_(cancel), cfg_(cfg) {
    if (cfg_.samples_per_channel < 1) cfg_.samples_per_channel = 1;
    if (cfg_.sleep_slice_ms < 1)      cfg_.sleep_slice_ms = 1;
}


// Wall-clock seconds, clamped so stamps never run backwards across cycles.
int64_t Scheduler::cycle_timestamp() {
    int64_t now_s = clock_.unix_ms() / 1000;
    if (now_s < last_stamp_) now_s = last_stamp_;
    last_stamp_ = now_s;
    return now_s;
}


Cycle Scheduler::run_cycle() {
    Cycle c;
    c.index        = stats_.cycles;
    c.start_unix_s = cycle_timestamp();
    c.target_ms    = cfg_.cycle_period_ms;

    const uint16_t n = cfg_.samples_per_channel;

    for (size_t i = 0; i < channels_.size(); ++i) {
        const Channel& ch = channels_[i];
        channel_index_ = i;
        state_ = SchedulerState::Sampling;

        double   sum  = 0.0;
        uint16_t used = 0;
        uint16_t k    = 0;
        for (; k < n && !stop(); ++k) {
            auto s = sampler_.sample(ch);
            if (!s) continue;                              // exhausted: just average fewer
            sum += calibration::apply(ch, s->value);
            ++used;
        }
        if (k < n) {                                       // stop landed mid-channel
            c.complete = false;
            break;
        }

        state_ = SchedulerState::Reducing;
        if (used == 0) {
            ++stats_.gaps;
            log::warn("event=channel_gap channel=" + ch_str(ch.id) +
                      " label=\"" + std::string(ch.label.c_str()) + "\"" +
                      " cycle=" + std::to_string(c.index) +
                      " reason=" + to_string(sampler_.last_failure()));
            continue;
        }
        if (used < n) {
            log::info("event=samples_dropped channel=" + ch_str(ch.id) +
                      " used=" + std::to_string(used) + " of=" + std::to_string(n) +
                      " cycle=" + std::to_string(c.index));
        }

        Reading r;
        r.channel        = ch.id;
        r.timestamp      = c.start_unix_s;
        r.capacitance_pf = sum / used;
        r.samples_used   = used;
        c.readings.push_back(r);
    }

    if (!c.complete) ++stats_.partial_cycles;

    state_ = SchedulerState::Emitting;
    if (!sink_.on_cycle(c)) {
        ++stats_.sink_failures;
        log::error("event=sink_failed cycle=" + std::to_string(c.index));
    }
    stats_.readings += c.readings.size();
    ++stats_.cycles;
    return c;
}


// ---------------------------------------------------------------------------
// idle_until()
// ------------
// Sleep for what is left of this cycle's period, in slices so a stop request
// is noticed quickly. The remaining time is recomputed from the clock after
// every slice, never accumulated.
// ---------------------------------------------------------------------------
void Scheduler::idle_until(int64_t cycle_start_steady) {
    state_ = SchedulerState::Sleeping;
    const int64_t period = cfg_.cycle_period_ms;

    while (!stop()) {
        int64_t remaining = period - (clock_.steady_ms() - cycle_start_steady);
        if (remaining <= 0) break;
        clock_.sleep_ms(std::min<int64_t>(remaining, cfg_.sleep_slice_ms));
    }
}


uint64_t Scheduler::run() {
    PortGuard guard{port_};
    uint64_t emitted = 0;
    state_ = SchedulerState::Idle;

    log::info("event=run_start channels=" + std::to_string(channels_.size()) +
              " n=" + std::to_string(cfg_.samples_per_channel) +
              " period_ms=" + std::to_string(cfg_.cycle_period_ms));

    while (!stop()) {
        if (cfg_.max_cycles && emitted >= cfg_.max_cycles) break;

        const int64_t start = clock_.steady_ms();
        run_cycle();
        ++emitted;

        if (stop()) break;
        if (cfg_.max_cycles && emitted >= cfg_.max_cycles) break;
        idle_until(start);
    }

    state_ = SchedulerState::Stopped;
    guard.armed = false;
    if (cfg_.close_on_exit) {
        port_.close();
        log::info(std::string("event=port_closed transport=") + port_.name());
    }

    const auto& ss = sampler_.stats();
    log::info("event=run_stop cycles=" + std::to_string(emitted) +
              " readings=" + std::to_string(stats_.readings) +
              " gaps=" + std::to_string(stats_.gaps) +
              " samples=" + std::to_string(ss.samples) +
              " exhausted=" + std::to_string(ss.exhausted) +
              " retries=" + std::to_string(ss.retries));
    return emitted;
}

} // namespace lmreadout
