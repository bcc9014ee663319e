#include <doctest/doctest.h>
#include "lmreadout/scheduler.hpp"
#include "lmreadout/calibration.hpp"
#include "lmreadout/channel_select.hpp"
#include "lmreadout/log.hpp"
#include "fakes.hpp"

#include <functional>
#include <stdexcept>
#include <sstream>

using namespace lmreadout;
using namespace lmreadout::test;

namespace {

struct RecordingSink : ISink {
    std::vector<Cycle> cycles;
    std::vector<int64_t> emitted_at;       // steady time of each on_cycle()
    const IClock* clock{nullptr};
    std::function<void()> after;
    bool ok{true};

    bool on_cycle(const Cycle& c) override {
        cycles.push_back(c);
        if (clock) emitted_at.push_back(clock->steady_ms());
        if (after) after();
        return ok;
    }
};

// Board where channel k always answers "k*10" and silent channels never answer.
FakePort::Responder board(std::vector<int> silent = {}) {
    return [silent](const std::string& req) {
        int ch = request_channel(req);
        for (int s : silent) if (s == ch) return std::vector<std::string>{};
        return std::vector<std::string>{std::to_string(ch * 10) + "\n"};
    };
}

// Keeps test output clean and lets a case inspect what was logged.
struct LogCapture {
    std::ostringstream os;
    LogCapture()  { log::set_stream(&os); }
    ~LogCapture() { log::set_stream(nullptr); }
};

} // namespace

TEST_CASE("Full cycle over channels 1..5 with a silent channel 3") {
    LogCapture logs;
    ManualClock clock;
    FakePort port(&clock);
    port.respond = board({3});
    ReadoutBoardCodec codec;
    CancelToken cancel;
    ChannelSampler sampler(port, codec, clock, SamplerConfig{}, &cancel);

    ChannelList channels = default_channels({1, 2, 3, 4, 5});
    channels[3].coeffs = calibration::linear(1.0, 2.0);      // channel 4
    RecordingSink sink;

    SchedulerConfig cfg;
    cfg.samples_per_channel = 10;
    Scheduler sched(sampler, port, channels, sink, clock, cancel, cfg);

    Cycle c = sched.run_cycle();
    REQUIRE(sink.cycles.size() == 1);
    CHECK(c.complete);
    CHECK(c.index == 0);
    REQUIRE(c.readings.size() == 4);
    CHECK(c.readings[0].channel == 1);
    CHECK(c.readings[1].channel == 2);
    CHECK(c.readings[2].channel == 4);
    CHECK(c.readings[3].channel == 5);
    CHECK(c.find(3) == nullptr);

    REQUIRE(c.find(1) != nullptr);
    CHECK(c.find(1)->capacitance_pf == doctest::Approx(10.0));
    CHECK(c.find(1)->samples_used == 10);
    CHECK(c.find(4)->capacitance_pf == doctest::Approx(81.0));   // 1 + 2 * 40

    for (const auto& r : c.readings) CHECK(r.timestamp == c.start_unix_s);

    CHECK(sched.stats().gaps == 1);
    CHECK(sampler.stats().exhausted == 10);
    CHECK(port.requests.size() == 4 * 10 + 10 * 3);
    CHECK(logs.os.str().find("event=channel_gap channel=3") != std::string::npos);
}

TEST_CASE("Partial sample loss averages what arrived") {
    LogCapture logs;
    ManualClock clock;
    FakePort port(&clock);
    int n = 0;
    // every third request for channel 1 goes unanswered
    port.respond = [&](const std::string&) {
        return (++n % 3 == 0) ? std::vector<std::string>{} : std::vector<std::string>{"5\n"};
    };
    ReadoutBoardCodec codec;
    CancelToken cancel;
    SamplerConfig scfg;
    scfg.max_attempts = 1;
    ChannelSampler sampler(port, codec, clock, scfg, &cancel);
    ChannelList channels = default_channels({1});
    RecordingSink sink;
    SchedulerConfig cfg;
    cfg.samples_per_channel = 6;
    Scheduler sched(sampler, port, channels, sink, clock, cancel, cfg);

    Cycle c = sched.run_cycle();
    REQUIRE(c.readings.size() == 1);
    CHECK(c.readings[0].samples_used == 4);
    CHECK(c.readings[0].capacitance_pf == doctest::Approx(5.0));
    CHECK(logs.os.str().find("event=samples_dropped channel=1 used=4 of=6") != std::string::npos);
}

TEST_CASE("Cycles are paced from their own start, without drift") {
    LogCapture logs;
    ManualClock clock;
    FakePort port(&clock);
    port.respond = board();
    port.latency_ms = 10;                                    // 10 samples -> 100 ms per cycle
    ReadoutBoardCodec codec;
    CancelToken cancel;
    ChannelSampler sampler(port, codec, clock, SamplerConfig{}, &cancel);
    ChannelList channels = default_channels({1});
    RecordingSink sink;
    sink.clock = &clock;

    SchedulerConfig cfg;
    cfg.samples_per_channel = 10;
    cfg.cycle_period_ms = 3000;
    cfg.max_cycles = 3;
    Scheduler sched(sampler, port, channels, sink, clock, cancel, cfg);

    CHECK(sched.run() == 3);
    REQUIRE(sink.emitted_at.size() == 3);
    CHECK(sink.emitted_at[0] == 100);
    CHECK(sink.emitted_at[1] == 3100);
    CHECK(sink.emitted_at[2] == 6100);
    CHECK(clock.slept() == 2 * 2900);
    for (auto s : clock.sleeps) CHECK(s <= cfg.sleep_slice_ms);
    CHECK(sched.state() == SchedulerState::Stopped);
}

TEST_CASE("An overrunning cycle starts the next one immediately") {
    LogCapture logs;
    ManualClock clock;
    FakePort port(&clock);
    port.respond = board();
    port.latency_ms = 500;                                   // 4 samples -> 2000 ms
    ReadoutBoardCodec codec;
    CancelToken cancel;
    ChannelSampler sampler(port, codec, clock, SamplerConfig{}, &cancel);
    ChannelList channels = default_channels({1});
    RecordingSink sink;

    SchedulerConfig cfg;
    cfg.samples_per_channel = 4;
    cfg.cycle_period_ms = 1000;
    cfg.max_cycles = 2;
    Scheduler sched(sampler, port, channels, sink, clock, cancel, cfg);

    CHECK(sched.run() == 2);
    CHECK(clock.sleeps.empty());
}

TEST_CASE("Cycle timestamps never run backwards") {
    LogCapture logs;
    ManualClock clock;
    FakePort port(&clock);
    port.respond = board();
    ReadoutBoardCodec codec;
    CancelToken cancel;
    ChannelSampler sampler(port, codec, clock, SamplerConfig{}, &cancel);
    ChannelList channels = default_channels({1, 2});
    RecordingSink sink;
    sink.after = [&] { clock.set_unix_ms(clock.unix_ms() - 60000); };   // wall clock stepped back

    SchedulerConfig cfg;
    cfg.samples_per_channel = 2;
    cfg.cycle_period_ms = 1000;
    cfg.max_cycles = 4;
    Scheduler sched(sampler, port, channels, sink, clock, cancel, cfg);
    sched.run();

    REQUIRE(sink.cycles.size() == 4);
    for (size_t i = 1; i < sink.cycles.size(); ++i) {
        CHECK(sink.cycles[i].start_unix_s >= sink.cycles[i - 1].start_unix_s);
        CHECK(sink.cycles[i].index == i);
    }
}

TEST_CASE("Stop during a cycle emits a partial cycle and closes the port once") {
    LogCapture logs;
    ManualClock clock;
    FakePort port(&clock);
    port.respond = board();
    ReadoutBoardCodec codec;
    CancelToken cancel;
    // Trip the stop after the first request for channel 2.
    port.on_write = [&](const std::string& req) { if (request_channel(req) == 2) cancel.request_stop(); };
    ChannelSampler sampler(port, codec, clock, SamplerConfig{}, &cancel);
    ChannelList channels = default_channels({1, 2, 3});
    RecordingSink sink;

    SchedulerConfig cfg;
    cfg.samples_per_channel = 3;
    cfg.close_on_exit = true;
    Scheduler sched(sampler, port, channels, sink, clock, cancel, cfg);

    CHECK(sched.run() == 1);
    REQUIRE(sink.cycles.size() == 1);
    const Cycle& c = sink.cycles[0];
    CHECK_FALSE(c.complete);
    REQUIRE(c.readings.size() == 1);
    CHECK(c.readings[0].channel == 1);
    CHECK(c.find(2) == nullptr);
    CHECK(sched.stats().partial_cycles == 1);
    CHECK(port.closes == 1);
    CHECK_FALSE(port.is_open());
    CHECK(sched.state() == SchedulerState::Stopped);
}

TEST_CASE("Stop after channel 2 finishes leaves channels 3..5 unsampled") {
    LogCapture logs;
    ManualClock clock;
    FakePort port(&clock);
    port.respond = board();
    ReadoutBoardCodec codec;
    CancelToken cancel;
    int ch2_requests = 0;
    port.on_write = [&](const std::string& req) {
        if (request_channel(req) == 2 && ++ch2_requests == 10) cancel.request_stop();
    };
    ChannelSampler sampler(port, codec, clock, SamplerConfig{}, &cancel);
    ChannelList channels = default_channels({1, 2, 3, 4, 5});
    RecordingSink sink;

    SchedulerConfig cfg;
    cfg.samples_per_channel = 10;
    cfg.close_on_exit = true;
    Scheduler sched(sampler, port, channels, sink, clock, cancel, cfg);

    CHECK(sched.run() == 1);
    REQUIRE(sink.cycles.size() == 1);
    const Cycle& c = sink.cycles[0];
    CHECK_FALSE(c.complete);
    REQUIRE(c.readings.size() == 2);
    CHECK(c.find(2) != nullptr);
    CHECK(c.find(2)->samples_used == 10);
    for (const auto& req : port.requests) CHECK(request_channel(req) <= 2);
    CHECK(port.closes == 1);
}

TEST_CASE("A failure escaping the run still releases the port") {
    LogCapture logs;
    ManualClock clock;
    FakePort port(&clock);
    port.respond = board();
    ReadoutBoardCodec codec;
    CancelToken cancel;
    ChannelSampler sampler(port, codec, clock, SamplerConfig{}, &cancel);
    ChannelList channels = default_channels({1});
    RecordingSink sink;
    sink.after = [] { throw std::runtime_error("sink exploded"); };

    SchedulerConfig cfg;
    cfg.samples_per_channel = 2;
    cfg.close_on_exit = false;
    Scheduler sched(sampler, port, channels, sink, clock, cancel, cfg);

    CHECK_THROWS_AS(sched.run(), std::runtime_error);
    CHECK(port.closes == 1);
    CHECK_FALSE(port.is_open());
}

TEST_CASE("Without close_on_exit the port is left open") {
    LogCapture logs;
    ManualClock clock;
    FakePort port(&clock);
    port.respond = board();
    ReadoutBoardCodec codec;
    CancelToken cancel;
    ChannelSampler sampler(port, codec, clock, SamplerConfig{}, &cancel);
    ChannelList channels = default_channels({1});
    RecordingSink sink;
    sink.after = [&] { cancel.request_stop(); };

    SchedulerConfig cfg;
    cfg.samples_per_channel = 2;
    Scheduler sched(sampler, port, channels, sink, clock, cancel, cfg);

    CHECK(sched.run() == 1);
    CHECK(port.closes == 0);
    CHECK(port.is_open());
}

TEST_CASE("Stop while idling is noticed within one sleep slice") {
    struct StoppingClock : ManualClock {
        CancelToken* token{nullptr};
        int slices_left{3};
        void sleep_ms(int64_t ms) override {
            ManualClock::sleep_ms(ms);
            if (--slices_left == 0) token->request_stop();
        }
    };

    LogCapture logs;
    StoppingClock clock;
    CancelToken cancel;
    clock.token = &cancel;
    FakePort port(&clock);
    port.respond = board();
    ReadoutBoardCodec codec;
    ChannelSampler sampler(port, codec, clock, SamplerConfig{}, &cancel);
    ChannelList channels = default_channels({1});
    RecordingSink sink;

    SchedulerConfig cfg;
    cfg.samples_per_channel = 1;
    cfg.cycle_period_ms = 60000;
    cfg.sleep_slice_ms = 100;
    Scheduler sched(sampler, port, channels, sink, clock, cancel, cfg);

    CHECK(sched.run() == 1);
    CHECK(clock.sleeps.size() == 3);
    CHECK(clock.slept() == 300);
    CHECK(sched.state() == SchedulerState::Stopped);
}

TEST_CASE("A failing sink is counted and the run goes on") {
    LogCapture logs;
    ManualClock clock;
    FakePort port(&clock);
    port.respond = board();
    ReadoutBoardCodec codec;
    CancelToken cancel;
    ChannelSampler sampler(port, codec, clock, SamplerConfig{}, &cancel);
    ChannelList channels = default_channels({1});
    RecordingSink sink;
    sink.ok = false;

    SchedulerConfig cfg;
    cfg.samples_per_channel = 1;
    cfg.cycle_period_ms = 0;
    cfg.max_cycles = 3;
    Scheduler sched(sampler, port, channels, sink, clock, cancel, cfg);

    CHECK(sched.run() == 3);
    CHECK(sched.stats().sink_failures == 3);
    CHECK(logs.os.str().find("event=sink_failed") != std::string::npos);
}
