#include <doctest/doctest.h>
#include "lmreadout/board_setup.hpp"
#include "lmreadout/calibration.hpp"
#include "lmreadout/log.hpp"
#include "fakes.hpp"

#include <sstream>

using namespace lmreadout;
using namespace lmreadout::test;

namespace {

// Console of the readout board: mode switches and getmode.
struct SimBoard {
    char speed{'s'};
    bool verbose{true}, echo{false}, debug{false};
    bool ignore_speed{false};

    std::vector<std::string> operator()(const std::string& req) {
        auto flag = [](bool b) { return b ? '1' : '0'; };
        if (req == "getmode\n")
            return {std::string("S") + speed + "\r\n", std::string("V") + flag(verbose) + "\r\n",
                    std::string("E ") + flag(echo) + "\r\n", std::string("D") + flag(debug) + "\r\n"};
        if (req.rfind("echo ", 0) == 0)    { echo    = req[5] == '1'; return {"ok\r\n"}; }
        if (req.rfind("verbose ", 0) == 0) { verbose = req[8] == '1'; return {"ok\r\n"}; }
        if (req.rfind("debug ", 0) == 0)   { debug   = req[6] == '1'; return {"ok\r\n"}; }
        if (req == "f\n" || req == "s\n")  { if (!ignore_speed) speed = req[0]; return {"ok\r\n"}; }
        if (req == "about\n")              return {"Level meter readout\r\n", "fw 2.1\r\n"};
        return {"?\r\n"};
    }
};

struct QuietLog {
    std::ostringstream os;
    QuietLog()  { log::set_stream(&os); }
    ~QuietLog() { log::set_stream(nullptr); }
};

} // namespace

TEST_CASE("Expected getmode lines follow the settings") {
    BoardSettings s;
    CHECK(expected_mode(s) == std::vector<std::string>{"Sf", "V0", "E0", "D0"});
    s.speed = 's';
    s.debug = true;
    CHECK(expected_mode(s) == std::vector<std::string>{"Ss", "V0", "E0", "D1"});
}

TEST_CASE("read_lines strips blanks and carriage returns") {
    FakePort port;
    port.inject("S f\r\nV0\r");
    port.inject("\n\r\nE0\nD0");
    auto lines = read_lines(port, 10);
    CHECK(lines == std::vector<std::string>{"Sf", "V0", "E0", "D0"});
}

TEST_CASE("query sends the command and returns its reply") {
    FakePort port;
    SimBoard board;
    port.respond = [&](const std::string& r) { return board(r); };
    auto lines = query(port, "about", 10);
    REQUIRE(port.requests.size() == 1);
    CHECK(port.requests[0] == "about\n");
    CHECK(lines == std::vector<std::string>{"Levelmeterreadout", "fw2.1"});
}

TEST_CASE("A board in the wrong mode is switched and confirmed") {
    QuietLog q;
    FakePort port;
    SimBoard board;
    port.respond = [&](const std::string& r) { return board(r); };

    CHECK(configure_readout_board(port, BoardSettings{}) == SetupResult::Ok);
    CHECK(board.speed == 'f');
    CHECK_FALSE(board.verbose);
    REQUIRE(port.requests.size() == 6);
    CHECK(port.requests[0] == "getmode\n");
    CHECK(port.requests[1] == "echo 0\n");
    CHECK(port.requests[2] == "verbose 0\n");
    CHECK(port.requests[3] == "debug 0\n");
    CHECK(port.requests[4] == "f\n");
    CHECK(port.requests[5] == "getmode\n");
}

TEST_CASE("A board already in the requested mode is reused untouched") {
    QuietLog q;
    FakePort port;
    SimBoard board;
    board.speed = 'f';
    board.verbose = false;
    port.respond = [&](const std::string& r) { return board(r); };

    CHECK(configure_readout_board(port, BoardSettings{}) == SetupResult::AlreadyConfigured);
    CHECK(port.requests.size() == 1);
}

TEST_CASE("Setup failures") {
    QuietLog q;

    SUBCASE("mode does not stick") {
        FakePort port;
        SimBoard board;
        board.ignore_speed = true;
        port.respond = [&](const std::string& r) { return board(r); };
        CHECK(configure_readout_board(port, BoardSettings{}) == SetupResult::ModeMismatch);
    }
    SUBCASE("silent board") {
        FakePort port;
        CHECK(configure_readout_board(port, BoardSettings{}) == SetupResult::NoResponse);
    }
    SUBCASE("write fails") {
        FakePort port;
        port.fail_writes = true;
        CHECK(configure_readout_board(port, BoardSettings{}) == SetupResult::WriteFailed);
    }
}

TEST_CASE("UTI board test measurement") {
    QuietLog q;
    ManualClock clock;
    FakePort port(&clock);
    SmartecUtiCodec codec;
    ChannelSampler sampler(port, codec, clock);
    Channel ch;
    ch.id = 1;
    ch.coeffs = calibration::identity();

    CHECK(check_uti_board(sampler, ch) == SetupResult::TestMeasurementFailed);

    port.respond = [](const std::string&) { return std::vector<std::string>{"100 500 300\r\n"}; };
    CHECK(check_uti_board(sampler, ch) == SetupResult::Ok);
    CHECK(std::string(to_string(SetupResult::ModeMismatch)) == "mode_mismatch");
}
